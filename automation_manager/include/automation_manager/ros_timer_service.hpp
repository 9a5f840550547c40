#pragma once

#include <automation_engine/timer_service.hpp>

#include <rclcpp/node_interfaces/node_base_interface.hpp>
#include <rclcpp/node_interfaces/node_timers_interface.hpp>
#include <rclcpp/timer.hpp>

#include <map>

namespace automation_manager
{

/**
 * @class RosTimerService
 * @brief TimerService backed by one-shot wall timers on a node.
 *
 * Callbacks run on the node's executor, so they are serialized with the node's other
 * callbacks when the node uses its default callback group.
 */
class RosTimerService : public automation_engine::TimerService
{
public:
  RosTimerService(
    rclcpp::node_interfaces::NodeBaseInterface::SharedPtr nodeBase,
    rclcpp::node_interfaces::NodeTimersInterface::SharedPtr nodeTimers);
  ~RosTimerService() override;

  int64_t nowMs() const override;
  automation_engine::TimerHandle schedule(
    std::chrono::milliseconds delay, Callback callback) override;
  void cancel(automation_engine::TimerHandle handle) override;

  std::size_t pending() const { return timers_.size(); }

private:
  rclcpp::node_interfaces::NodeBaseInterface::SharedPtr nodeBase_;
  rclcpp::node_interfaces::NodeTimersInterface::SharedPtr nodeTimers_;

  automation_engine::TimerHandle nextHandle_{1};
  std::map<automation_engine::TimerHandle, rclcpp::TimerBase::SharedPtr> timers_;
};

}  // namespace automation_manager
