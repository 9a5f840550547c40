#pragma once

#include <automation_engine/execution_scheduler.hpp>
#include <automation_engine/graph_change_observer.hpp>
#include <automation_engine/graph_step_executor.hpp>
#include <automation_engine/in_memory_graph_store.hpp>
#include <automation_engine/rule_store.hpp>
#include <automation_engine/schedule_service.hpp>
#include <automation_engine/spatial_region_store.hpp>
#include <automation_manager/ros_timer_service.hpp>

#include <diagnostic_msgs/msg/diagnostic_array.hpp>
#include <rclcpp_lifecycle/lifecycle_node.hpp>
#include <rclcpp_lifecycle/lifecycle_publisher.hpp>
#include <std_msgs/msg/string.hpp>

#include <cstddef>
#include <memory>
#include <string>

namespace automation_manager
{

/**
 * @class AutomationManagerNode
 * @brief Lifecycle node hosting one automation engine over a workspace file.
 *
 * All engine callbacks (manual triggers, debounce and schedule timers, status) run in the
 * node's default callback group and are therefore never concurrent.
 */
class AutomationManagerNode : public rclcpp_lifecycle::LifecycleNode
{
public:
  explicit AutomationManagerNode(const rclcpp::NodeOptions & options);

  /// Engine access for tests; null unless configured.
  automation_engine::ExecutionScheduler * scheduler() { return scheduler_.get(); }
  automation_engine::InMemoryGraphStore * graph() { return graph_.get(); }
  automation_engine::SpatialRegionStore * regions() { return regions_.get(); }

private:
  using CallbackReturn = rclcpp_lifecycle::node_interfaces::LifecycleNodeInterface::CallbackReturn;

  CallbackReturn on_configure(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_activate(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_deactivate(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_cleanup(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_shutdown(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_error(const rclcpp_lifecycle::State & state) override;

  void onManualTrigger(const std_msgs::msg::String::SharedPtr msg);
  void onGraphCommit(const automation_engine::GraphSnapshot & snapshot);
  void onScheduleTick(const automation_engine::Event & event);
  void publishStatus();

  void releaseEngine();

  std::string workspaceFile_;
  int debounceMs_{300};
  int maxStackDepth_{5};
  double statusRateHz_{1.0};
  int recentEventCapacity_{50};
  std::string manualTriggerTopic_{"manual_trigger"};
  std::string statusTopic_{"automation_status"};

  bool active_{false};

  // Each engine member borrows the ones declared before it; releaseEngine() resets them
  // in reverse order.
  std::unique_ptr<automation_engine::InMemoryGraphStore> graph_;
  std::unique_ptr<automation_engine::SpatialRegionStore> regions_;
  std::unique_ptr<automation_engine::RuleStore> rules_;
  std::unique_ptr<RosTimerService> timers_;
  std::unique_ptr<automation_engine::GraphStepExecutor> stepExecutor_;
  std::unique_ptr<automation_engine::ExecutionScheduler> scheduler_;
  std::unique_ptr<automation_engine::GraphChangeObserver> observer_;
  std::unique_ptr<automation_engine::ScheduleService> schedules_;
  std::size_t graphSubscription_{0};

  rclcpp::Subscription<std_msgs::msg::String>::SharedPtr manualTriggerSub_;
  rclcpp_lifecycle::LifecyclePublisher<diagnostic_msgs::msg::DiagnosticArray>::SharedPtr statusPub_;
  rclcpp::TimerBase::SharedPtr statusTimer_;

  bool autoStart_{true};
  rclcpp::TimerBase::SharedPtr startupTimer_;
};

}  // namespace automation_manager
