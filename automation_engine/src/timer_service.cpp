#include <automation_engine/timer_service.hpp>

#include <algorithm>
#include <utility>

namespace automation_engine
{

ManualTimerService::ManualTimerService(const int64_t startMs)
: nowMs_(startMs)
{
}

TimerHandle ManualTimerService::schedule(
  const std::chrono::milliseconds delay,
  Callback callback)
{
  const TimerHandle handle = nextHandle_++;
  timers_[handle] = Entry{nowMs_ + delay.count(), std::move(callback)};
  return handle;
}

void ManualTimerService::cancel(const TimerHandle handle)
{
  timers_.erase(handle);
}

void ManualTimerService::advance(const std::chrono::milliseconds duration)
{
  const int64_t targetMs = nowMs_ + duration.count();

  while (true) {
    // Earliest due entry; equal due times fire in scheduling order.
    auto next = timers_.end();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
      if (it->second.dueMs <= targetMs &&
        (next == timers_.end() || it->second.dueMs < next->second.dueMs))
      {
        next = it;
      }
    }
    if (next == timers_.end()) {
      break;
    }

    nowMs_ = std::max(nowMs_, next->second.dueMs);
    Callback callback = std::move(next->second.callback);
    timers_.erase(next);
    if (callback) {
      callback();
    }
  }

  nowMs_ = targetMs;
}

}  // namespace automation_engine
