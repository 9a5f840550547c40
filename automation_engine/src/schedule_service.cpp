#include <automation_engine/schedule_service.hpp>

#include <rclcpp/logging.hpp>

#include <cerrno>
#include <cstdlib>
#include <iterator>
#include <ctime>
#include <sstream>
#include <utility>
#include <vector>

namespace automation_engine
{
namespace
{

constexpr int64_t kSecondMs = 1000;
constexpr int64_t kMinuteMs = 60 * kSecondMs;
constexpr int64_t kHourMs = 60 * kMinuteMs;
constexpr int64_t kDayMs = 24 * kHourMs;

std::optional<long> parseInteger(const std::string & text)
{
  if (text.empty()) {
    return std::nullopt;
  }
  char * end = nullptr;
  errno = 0;
  const long value = std::strtol(text.c_str(), &end, 10);
  if (errno != 0 || end == nullptr || *end != '\0') {
    return std::nullopt;
  }
  return value;
}

// "*/N" with lo <= N <= hi
std::optional<long> parseStep(const std::string & field, const long lo, const long hi)
{
  if (field.rfind("*/", 0) != 0) {
    return std::nullopt;
  }
  const auto n = parseInteger(field.substr(2));
  if (!n || *n < lo || *n > hi) {
    return std::nullopt;
  }
  return n;
}

CronSchedule every(const int64_t ms)
{
  CronSchedule schedule;
  schedule.interval = std::chrono::milliseconds(ms);
  return schedule;
}

}  // namespace

std::optional<CronSchedule> parseCron(const std::string & cron)
{
  std::istringstream in(cron);
  std::vector<std::string> parts;
  for (std::string part; in >> part; ) {
    parts.push_back(part);
  }

  if (parts.size() == 5) {
    const auto & min = parts[0];
    const auto & hour = parts[1];

    if (hour == "*") {
      if (const auto n = parseStep(min, 1, 1440)) {
        return every(*n * kMinuteMs);
      }
    }
    if (min == "0") {
      if (const auto n = parseStep(hour, 1, 24)) {
        return every(*n * kHourMs);
      }
    }

    const auto m = parseInteger(min);
    const auto h = parseInteger(hour);
    if (m && h && *m >= 0 && *m <= 59 && *h >= 0 && *h <= 23 &&
      parts[2] == "*" && parts[3] == "*" && parts[4] == "*")
    {
      CronSchedule schedule = every(kDayMs);
      schedule.daily = true;
      schedule.hour = static_cast<int>(*h);
      schedule.minute = static_cast<int>(*m);
      return schedule;
    }
    return std::nullopt;
  }

  if (parts.size() == 6) {
    const auto & sec = parts[0];
    const auto & min = parts[1];

    if (min == "*") {
      if (const auto n = parseStep(sec, 1, 3600)) {
        return every(*n * kSecondMs);
      }
    }
    if (sec == "0") {
      if (const auto n = parseStep(min, 1, 1440)) {
        return every(*n * kMinuteMs);
      }
    }
  }
  return std::nullopt;
}

std::chrono::milliseconds initialDelay(const CronSchedule & schedule, const int64_t nowMs)
{
  if (!schedule.daily) {
    return schedule.interval;
  }

  const std::time_t nowTime = static_cast<std::time_t>(nowMs / 1000);
  std::tm target{};
  localtime_r(&nowTime, &target);
  target.tm_hour = schedule.hour;
  target.tm_min = schedule.minute;
  target.tm_sec = 0;
  target.tm_isdst = -1;

  int64_t targetMs = static_cast<int64_t>(std::mktime(&target)) * 1000;
  if (targetMs <= nowMs) {
    target.tm_mday += 1;
    target.tm_isdst = -1;
    targetMs = static_cast<int64_t>(std::mktime(&target)) * 1000;
  }
  return std::chrono::milliseconds(targetMs - nowMs);
}

ScheduleService::ScheduleService(TimerService & timers, TickHandler onTick, rclcpp::Logger logger)
: timers_(timers)
, onTick_(std::move(onTick))
, logger_(logger)
{
}

ScheduleService::~ScheduleService()
{
  clear();
}

void ScheduleService::sync(const RuleStore & rules)
{
  std::map<std::string, std::string> wanted;
  for (const auto & rule : rules.rules()) {
    if (const auto * trigger = std::get_if<ScheduleTrigger>(&rule.trigger)) {
      wanted[rule.id] = trigger->cron;
    }
  }

  for (auto it = entries_.begin(); it != entries_.end(); ) {
    auto w = wanted.find(it->first);
    if (w == wanted.end() || w->second != it->second.cron) {
      timers_.cancel(it->second.handle);
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
  for (auto it = rejected_.begin(); it != rejected_.end(); ) {
    auto w = wanted.find(it->first);
    it = (w == wanted.end() || w->second != it->second) ? rejected_.erase(it) : std::next(it);
  }

  for (const auto & [ruleId, cron] : wanted) {
    if (entries_.count(ruleId) > 0) {
      continue;
    }
    if (rejected_.count(ruleId) > 0) {
      continue;
    }
    const auto schedule = parseCron(cron);
    if (!schedule) {
      RCLCPP_WARN(logger_, "Rule '%s' has unsupported cron '%s', schedule ignored",
        ruleId.c_str(), cron.c_str());
      rejected_[ruleId] = cron;
      continue;
    }
    entries_[ruleId] = Entry{cron, *schedule, 0};
    arm(ruleId, initialDelay(*schedule, timers_.nowMs()));
    RCLCPP_DEBUG(logger_, "Scheduled rule '%s' every %lld ms", ruleId.c_str(),
      static_cast<long long>(schedule->interval.count()));
  }
}

void ScheduleService::clear()
{
  for (const auto & entry : entries_) {
    timers_.cancel(entry.second.handle);
  }
  entries_.clear();
  rejected_.clear();
}

std::optional<std::chrono::milliseconds> ScheduleService::intervalFor(const std::string & ruleId) const
{
  auto it = entries_.find(ruleId);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.schedule.interval;
}

void ScheduleService::arm(const std::string & ruleId, const std::chrono::milliseconds delay)
{
  entries_[ruleId].handle = timers_.schedule(delay, [this, ruleId]() {fire(ruleId);});
}

void ScheduleService::fire(const std::string & ruleId)
{
  auto it = entries_.find(ruleId);
  if (it == entries_.end()) {
    return;
  }
  // Re-armed before the handler runs; the handler may resync.
  arm(ruleId, it->second.schedule.interval);

  Event event;
  event.sourceNodeId = ruleId;
  event.timestampMs = timers_.nowMs();
  event.payload = ScheduleTickPayload{};
  onTick_(event);
}

}  // namespace automation_engine
