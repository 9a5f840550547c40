#pragma once

#include <automation_engine/event_types.hpp>
#include <automation_engine/rule_store.hpp>
#include <automation_engine/timer_service.hpp>

#include <rclcpp/logger.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace automation_engine
{

/**
 * @struct CronSchedule
 * @brief Recurrence understood by the schedule service.
 *
 * Supported patterns: `*\/N * * * *` (minutes), `0 *\/N * * *` (hours),
 * `M H * * *` (daily at local H:M), and the six-field `*\/N * * * * *` (seconds) and
 * `0 *\/N * * * *` (minutes).
 */
struct CronSchedule
{
  std::chrono::milliseconds interval{0};
  bool daily{false};
  int hour{0};
  int minute{0};
};

std::optional<CronSchedule> parseCron(const std::string & cron);

/// Delay until the first tick: the interval, or the time until the next local H:M.
std::chrono::milliseconds initialDelay(const CronSchedule & schedule, int64_t nowMs);

/**
 * @class ScheduleService
 * @brief Emits recurring schedule-tick events, one timer chain per schedule rule.
 *
 * Each tick names its rule as the event source.
 */
class ScheduleService
{
public:
  using TickHandler = std::function<void(const Event &)>;

  ScheduleService(TimerService & timers, TickHandler onTick, rclcpp::Logger logger);
  ~ScheduleService();

  ScheduleService(const ScheduleService &) = delete;
  ScheduleService & operator=(const ScheduleService &) = delete;

  /// Starts timers for new schedule rules, restarts edited ones, stops the rest.
  void sync(const RuleStore & rules);
  void clear();

  std::size_t activeCount() const { return entries_.size(); }
  /// Rules whose cron text was rejected; each is reported once until its cron changes.
  std::size_t rejectedCount() const { return rejected_.size(); }
  std::optional<std::chrono::milliseconds> intervalFor(const std::string & ruleId) const;

private:
  struct Entry
  {
    std::string cron;
    CronSchedule schedule;
    TimerHandle handle{0};
  };

  void arm(const std::string & ruleId, std::chrono::milliseconds delay);
  void fire(const std::string & ruleId);

  TimerService & timers_;
  TickHandler onTick_;
  rclcpp::Logger logger_;
  std::map<std::string, Entry> entries_;
  std::map<std::string, std::string> rejected_;
};

}  // namespace automation_engine
