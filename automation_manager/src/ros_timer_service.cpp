#include <automation_manager/ros_timer_service.hpp>

#include <rclcpp/create_timer.hpp>

#include <algorithm>
#include <utility>

namespace automation_manager
{

RosTimerService::RosTimerService(
  rclcpp::node_interfaces::NodeBaseInterface::SharedPtr nodeBase,
  rclcpp::node_interfaces::NodeTimersInterface::SharedPtr nodeTimers)
: nodeBase_(std::move(nodeBase))
, nodeTimers_(std::move(nodeTimers))
{
}

RosTimerService::~RosTimerService()
{
  for (auto & entry : timers_) {
    entry.second->cancel();
  }
}

int64_t RosTimerService::nowMs() const
{
  return std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
}

automation_engine::TimerHandle RosTimerService::schedule(
  const std::chrono::milliseconds delay,
  Callback callback)
{
  const automation_engine::TimerHandle handle = nextHandle_++;

  // Wall timers repeat; the first expiry cancels and forgets the timer before the callback
  // runs so it behaves as a one-shot.
  auto timer = rclcpp::create_wall_timer(
    std::max(delay, std::chrono::milliseconds(0)),
    [this, handle, callback = std::move(callback)]() {
      auto it = timers_.find(handle);
      if (it == timers_.end()) {
        return;
      }
      it->second->cancel();
      timers_.erase(it);
      if (callback) {
        callback();
      }
    },
    nullptr,
    nodeBase_.get(),
    nodeTimers_.get());

  timers_[handle] = timer;
  return handle;
}

void RosTimerService::cancel(const automation_engine::TimerHandle handle)
{
  auto it = timers_.find(handle);
  if (it == timers_.end()) {
    return;
  }
  it->second->cancel();
  timers_.erase(it);
}

}  // namespace automation_manager
