#pragma once

#include <automation_engine/event_log.hpp>
#include <automation_engine/event_types.hpp>
#include <automation_engine/graph_store.hpp>
#include <automation_engine/rule_store.hpp>
#include <automation_engine/spatial_region_store.hpp>
#include <automation_engine/step_executor.hpp>
#include <automation_engine/timer_service.hpp>
#include <automation_engine/trigger_matcher.hpp>

#include <rclcpp/logger.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace automation_engine
{

/**
 * @struct SchedulerConfig
 * @brief Quiet period and re-entrancy bounds.
 */
struct SchedulerConfig
{
  /// Quiet period per (rule, source node) before a matched event executes.
  std::chrono::milliseconds debounce{300};
  /// Maximum number of nested executions on the execution stack.
  std::size_t maxStackDepth{5};
  std::size_t recentEventCapacity{50};
};

enum class ExecutionCode : uint8_t
{
  Succeeded,
  Failed,
  SkippedCycle,
  SkippedMaxDepth,
  SkippedMissing,
  SkippedDisabled,
  SkippedConditions
};

constexpr std::string_view executionCodeToString(const ExecutionCode code)
{
  switch (code) {
    case ExecutionCode::Succeeded:
      return "SUCCEEDED";
    case ExecutionCode::Failed:
      return "FAILED";
    case ExecutionCode::SkippedCycle:
      return "SKIPPED_CYCLE";
    case ExecutionCode::SkippedMaxDepth:
      return "SKIPPED_MAX_DEPTH";
    case ExecutionCode::SkippedMissing:
      return "SKIPPED_MISSING";
    case ExecutionCode::SkippedDisabled:
      return "SKIPPED_DISABLED";
    case ExecutionCode::SkippedConditions:
      return "SKIPPED_CONDITIONS";
  }
  return "UNKNOWN";
}

/**
 * @struct ExecutionOutcome
 * @brief What one executeAction() call did, with a machine-readable code.
 */
struct ExecutionOutcome
{
  ExecutionCode code{ExecutionCode::SkippedMissing};
  /// Executor error for Failed, log detail for skips.
  std::string detail;

  /// True when the step executor ran (successfully or not).
  bool executed() const
  {
    return code == ExecutionCode::Succeeded || code == ExecutionCode::Failed;
  }
};

/**
 * @class ExecutionScheduler
 * @brief Turns events into debounced, cycle-safe rule executions.
 *
 * All runtime-only state (debounce timers, execution stack, executing set, proximity
 * memory, recent events) is owned here. The scheduler is driven from a single thread of
 * control; collaborators are borrowed and must outlive it.
 */
class ExecutionScheduler
{
public:
  ExecutionScheduler(
    GraphStore & graphStore,
    StepExecutor & stepExecutor,
    RuleStore & ruleStore,
    SpatialRegionStore & regionStore,
    TimerService & timers,
    SchedulerConfig config,
    rclcpp::Logger logger);

  ~ExecutionScheduler();

  ExecutionScheduler(const ExecutionScheduler &) = delete;
  ExecutionScheduler & operator=(const ExecutionScheduler &) = delete;

  /**
   * @brief Matches `event` against every registered rule and (re)arms a debounce timer
   * for each match.
   *
   * A new match for a pending (rule, source node) key replaces the pending timer.
   */
  void handleEvent(const Event & event);

  /// Runs a rule now with a synthesized manual event, skipping matching and debounce.
  ExecutionOutcome triggerManual(const std::string & ruleId);

  /**
   * @brief Executes one rule for `event` unless a safety guard or validation rejects it.
   *
   * Cycle and depth rejections are logged and never recorded on the rule. A missing,
   * disabled or condition-failing rule returns without side effects.
   */
  ExecutionOutcome executeAction(const std::string & ruleId, const Event & event);

  /// Registers (or replaces) a rule. Disabled rules are unregistered instead.
  void registerRule(Rule rule);

  /// Removes the rule, cancels its pending timers and forgets its proximity state.
  bool unregisterRule(const std::string & ruleId);

  /// Full rebuild of the rule table from the current graph.
  RuleStore::SyncResult syncRules();

  /// Drops per-node runtime state of a node that left the graph.
  void forgetNode(const std::string & nodeId);

  /// Cancels every pending debounce timer.
  void cancelAll();

  const std::vector<std::string> & executionStack() const { return stack_; }
  bool isExecuting(const std::string & ruleId) const { return executing_.count(ruleId) > 0; }
  std::size_t pendingTimerCount() const { return pending_.size(); }
  std::vector<Event> recentEvents() const { return recentEvents_.snapshot(); }
  const SchedulerConfig & config() const { return config_; }

private:
  using DebounceKey = std::pair<std::string, std::string>;

  void arm(const std::string & ruleId, const Event & event);
  void onQuietPeriodElapsed(const DebounceKey & key, const Event & event);
  void cancelTimersForRule(const std::string & ruleId);
  void recordRun(const std::string & ruleId, const RuleRunStats & before, const ExecutionResult & result);

  GraphStore & graphStore_;
  StepExecutor & stepExecutor_;
  RuleStore & ruleStore_;
  SpatialRegionStore & regionStore_;
  TimerService & timers_;
  SchedulerConfig config_;
  rclcpp::Logger logger_;

  std::map<DebounceKey, TimerHandle> pending_;
  std::vector<std::string> stack_;
  std::unordered_set<std::string> executing_;
  ProximityMemory proximity_;
  EventLog recentEvents_;
};

}  // namespace automation_engine
