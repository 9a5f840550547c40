#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>

namespace automation_engine
{

using TimerHandle = uint64_t;

/**
 * @class TimerService
 * @brief One-shot scheduled callbacks plus a millisecond clock.
 *
 * Callbacks run on the engine's thread of control. Cancelling an unknown or already
 * fired handle is a no-op.
 */
class TimerService
{
public:
  using Callback = std::function<void()>;

  virtual ~TimerService() = default;

  /// Milliseconds since the Unix epoch (or since the fake clock's origin).
  virtual int64_t nowMs() const = 0;
  virtual TimerHandle schedule(std::chrono::milliseconds delay, Callback callback) = 0;
  virtual void cancel(TimerHandle handle) = 0;
};

/**
 * @class ManualTimerService
 * @brief Deterministic clock that only moves when advance() is called.
 */
class ManualTimerService : public TimerService
{
public:
  explicit ManualTimerService(int64_t startMs = 0);

  int64_t nowMs() const override { return nowMs_; }
  TimerHandle schedule(std::chrono::milliseconds delay, Callback callback) override;
  void cancel(TimerHandle handle) override;

  /**
   * @brief Moves the clock forward, firing due callbacks in due-time order.
   *
   * Callbacks scheduled while advancing fire too if they fall due inside the window.
   */
  void advance(std::chrono::milliseconds duration);

  std::size_t pending() const { return timers_.size(); }

private:
  struct Entry
  {
    int64_t dueMs{0};
    Callback callback;
  };

  int64_t nowMs_{0};
  TimerHandle nextHandle_{1};
  std::map<TimerHandle, Entry> timers_;
};

}  // namespace automation_engine
