#include <automation_engine/execution_scheduler.hpp>

#include <automation_engine/condition_evaluator.hpp>
#include <automation_engine/workspace_codec.hpp>

#include <rclcpp/logging.hpp>

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace automation_engine
{
namespace
{

std::string joinStack(const std::vector<std::string> & stack)
{
  std::string out;
  for (const auto & id : stack) {
    if (!out.empty()) {
      out += " -> ";
    }
    out += id;
  }
  return out;
}

// Pops one execution stack entry on scope exit, including when the executor throws.
class StackEntry
{
public:
  StackEntry(
    std::vector<std::string> & stack,
    std::unordered_set<std::string> & executing,
    const std::string & ruleId)
  : stack_(stack), executing_(executing), ruleId_(ruleId)
  {
    stack_.push_back(ruleId_);
    executing_.insert(ruleId_);
  }

  ~StackEntry()
  {
    auto it = std::find(stack_.rbegin(), stack_.rend(), ruleId_);
    if (it != stack_.rend()) {
      stack_.erase(std::next(it).base());
    }
    executing_.erase(ruleId_);
  }

  StackEntry(const StackEntry &) = delete;
  StackEntry & operator=(const StackEntry &) = delete;

private:
  std::vector<std::string> & stack_;
  std::unordered_set<std::string> & executing_;
  std::string ruleId_;
};

}  // namespace

ExecutionScheduler::ExecutionScheduler(
  GraphStore & graphStore,
  StepExecutor & stepExecutor,
  RuleStore & ruleStore,
  SpatialRegionStore & regionStore,
  TimerService & timers,
  SchedulerConfig config,
  rclcpp::Logger logger)
: graphStore_(graphStore)
, stepExecutor_(stepExecutor)
, ruleStore_(ruleStore)
, regionStore_(regionStore)
, timers_(timers)
, config_(config)
, logger_(logger)
, recentEvents_(config.recentEventCapacity)
{
  if (config_.maxStackDepth == 0) {
    config_.maxStackDepth = 1;
  }
}

ExecutionScheduler::~ExecutionScheduler()
{
  cancelAll();
}

void ExecutionScheduler::handleEvent(const Event & event)
{
  recentEvents_.push(event);

  const GraphSnapshot graph = graphStore_.snapshot();
  MatchContext context{graph, regionStore_, proximity_};

  for (const auto & rule : ruleStore_.rules()) {
    if (!rule.enabled) {
      continue;
    }
    bool matched = false;
    try {
      matched = matchesTrigger(rule, event, rule.id, context);
    } catch (const YAML::Exception & e) {
      RCLCPP_ERROR(logger_, "Rule '%s' could not match %s event: %s",
        rule.id.c_str(), toString(event.type()), e.what());
    }
    if (matched) {
      arm(rule.id, event);
    }
  }
}

ExecutionOutcome ExecutionScheduler::triggerManual(const std::string & ruleId)
{
  Event event;
  event.sourceNodeId = ruleId;
  event.timestampMs = timers_.nowMs();
  event.payload = ManualPayload{};
  recentEvents_.push(event);
  return executeAction(ruleId, event);
}

ExecutionOutcome ExecutionScheduler::executeAction(const std::string & ruleId, const Event & event)
{
  if (executing_.count(ruleId) > 0) {
    RCLCPP_WARN(logger_, "Cycle detected: rule '%s' is already executing (%s), skipping",
      ruleId.c_str(), joinStack(stack_).c_str());
    return ExecutionOutcome{ExecutionCode::SkippedCycle, joinStack(stack_)};
  }
  if (stack_.size() >= config_.maxStackDepth) {
    RCLCPP_WARN(logger_, "Max execution depth %zu reached, rule '%s' rejected (%s)",
      config_.maxStackDepth, ruleId.c_str(), joinStack(stack_).c_str());
    return ExecutionOutcome{ExecutionCode::SkippedMaxDepth, joinStack(stack_)};
  }

  // The rule may have been edited or disabled while its timer was pending.
  const GraphSnapshot graph = graphStore_.snapshot();
  const GraphNode * node = graph.findNode(ruleId);
  if (node == nullptr || !isRuleNode(*node)) {
    return ExecutionOutcome{ExecutionCode::SkippedMissing, "rule node not found"};
  }

  Rule rule;
  try {
    rule = decodeRule(ruleId, node->data);
  } catch (const YAML::Exception & e) {
    RCLCPP_DEBUG(logger_, "Rule '%s' no longer decodes: %s", ruleId.c_str(), e.what());
    return ExecutionOutcome{ExecutionCode::SkippedMissing, e.what()};
  } catch (const std::runtime_error & e) {
    RCLCPP_DEBUG(logger_, "Rule '%s' no longer decodes: %s", ruleId.c_str(), e.what());
    return ExecutionOutcome{ExecutionCode::SkippedMissing, e.what()};
  }

  if (!rule.enabled) {
    return ExecutionOutcome{ExecutionCode::SkippedDisabled, {}};
  }
  try {
    if (!evaluateConditions(rule, event, graph, ruleId)) {
      return ExecutionOutcome{ExecutionCode::SkippedConditions, {}};
    }
  } catch (const YAML::Exception & e) {
    RCLCPP_ERROR(logger_, "Rule '%s' conditions could not be evaluated: %s",
      ruleId.c_str(), e.what());
    return ExecutionOutcome{ExecutionCode::SkippedConditions, e.what()};
  }

  ExecutionResult result;
  {
    StackEntry entry(stack_, executing_, ruleId);

    ExecutionContext context;
    context.triggerNodeId = event.sourceNodeId;
    context.ruleId = ruleId;
    context.event = event;
    context.startedAtMs = timers_.nowMs();

    try {
      result = stepExecutor_.execute(rule.actionSteps, context, graph);
    } catch (const std::exception & e) {
      RCLCPP_ERROR(logger_, "Step executor threw while running rule '%s': %s",
        ruleId.c_str(), e.what());
      result = ExecutionResult::fail(e.what());
    }

    recordRun(ruleId, rule.stats, result);
  }

  if (result.success) {
    RCLCPP_DEBUG(logger_, "Rule '%s' completed %d step(s)", ruleId.c_str(), result.stepsCompleted);
    return ExecutionOutcome{ExecutionCode::Succeeded, {}};
  }
  RCLCPP_INFO(logger_, "Rule '%s' failed: %s", ruleId.c_str(), result.error.c_str());
  return ExecutionOutcome{ExecutionCode::Failed, result.error};
}

void ExecutionScheduler::registerRule(Rule rule)
{
  if (!rule.enabled) {
    unregisterRule(rule.id);
    return;
  }
  ruleStore_.registerRule(std::move(rule));
}

bool ExecutionScheduler::unregisterRule(const std::string & ruleId)
{
  cancelTimersForRule(ruleId);
  proximity_.forgetRule(ruleId);
  return ruleStore_.unregisterRule(ruleId);
}

RuleStore::SyncResult ExecutionScheduler::syncRules()
{
  auto result = ruleStore_.syncRules(graphStore_.snapshot());
  for (const auto & ruleId : result.removed) {
    cancelTimersForRule(ruleId);
    proximity_.forgetRule(ruleId);
  }
  for (const auto & error : result.errors) {
    RCLCPP_WARN(logger_, "Skipping rule node %s", error.c_str());
  }
  return result;
}

void ExecutionScheduler::forgetNode(const std::string & nodeId)
{
  proximity_.forgetNode(nodeId);
}

void ExecutionScheduler::cancelAll()
{
  for (const auto & entry : pending_) {
    timers_.cancel(entry.second);
  }
  pending_.clear();
}

void ExecutionScheduler::arm(const std::string & ruleId, const Event & event)
{
  const DebounceKey key{ruleId, event.sourceNodeId};

  auto it = pending_.find(key);
  if (it != pending_.end()) {
    timers_.cancel(it->second);
    pending_.erase(it);
  }

  pending_[key] = timers_.schedule(
    config_.debounce,
    [this, key, event]() {onQuietPeriodElapsed(key, event);});
}

void ExecutionScheduler::onQuietPeriodElapsed(const DebounceKey & key, const Event & event)
{
  pending_.erase(key);
  if (!ruleStore_.contains(key.first)) {
    return;
  }
  executeAction(key.first, event);
}

void ExecutionScheduler::cancelTimersForRule(const std::string & ruleId)
{
  for (auto it = pending_.begin(); it != pending_.end(); ) {
    if (it->first.first == ruleId) {
      timers_.cancel(it->second);
      it = pending_.erase(it);
    } else {
      ++it;
    }
  }
}

void ExecutionScheduler::recordRun(
  const std::string & ruleId,
  const RuleRunStats & before,
  const ExecutionResult & result)
{
  // Start from the stored statistics; the steps may have rewritten the rule node.
  RuleRunStats stats = before;
  const GraphSnapshot graph = graphStore_.snapshot();
  if (const GraphNode * node = graph.findNode(ruleId)) {
    stats.runCount = node->data["runCount"].as<int>(stats.runCount);
    stats.errorCount = node->data["errorCount"].as<int>(stats.errorCount);
  }

  stats.runCount += 1;
  stats.lastRun = timers_.nowMs();
  if (result.success) {
    stats.lastError.reset();
  } else {
    stats.errorCount += 1;
    stats.lastError = result.error.empty() ? std::string("unknown error") : result.error;
  }

  if (!graphStore_.updateRuleStats(ruleId, stats)) {
    RCLCPP_DEBUG(logger_, "Rule '%s' left the graph during execution", ruleId.c_str());
  }
}

}  // namespace automation_engine
