#include <automation_engine/condition_evaluator.hpp>

#include <automation_engine/value_utils.hpp>

#include <regex>

namespace automation_engine
{
namespace
{

const GraphNode * resolveTarget(
  const Condition & condition,
  const Event & event,
  const GraphSnapshot & graph,
  const std::string & ruleId)
{
  switch (condition.target) {
    case ConditionTarget::TriggerNode:
      return graph.findNode(event.sourceNodeId);
    case ConditionTarget::RuleNode:
      return graph.findNode(ruleId);
    case ConditionTarget::SpecificNode:
      return graph.findNode(condition.targetNodeId);
  }
  return nullptr;
}

bool matchesRegex(const YAML::Node & fieldValue, const YAML::Node & pattern)
{
  try {
    const std::regex re(valueToString(pattern), std::regex::ECMAScript);
    return std::regex_search(valueToString(fieldValue), re);
  } catch (const std::regex_error &) {
    return false;
  }
}

}  // namespace

bool evaluateOperator(
  const YAML::Node & fieldValue,
  const ConditionOperator op,
  const YAML::Node & conditionValue)
{
  switch (op) {
    case ConditionOperator::Equals:
      return valueToString(fieldValue) == valueToString(conditionValue);
    case ConditionOperator::NotEquals:
      return valueToString(fieldValue) != valueToString(conditionValue);
    case ConditionOperator::Contains:
      return valueToString(fieldValue).find(valueToString(conditionValue)) != std::string::npos;
    case ConditionOperator::NotContains:
      return valueToString(fieldValue).find(valueToString(conditionValue)) == std::string::npos;
    case ConditionOperator::GreaterThan:
      // NaN on either side makes both comparisons false.
      return valueToNumber(fieldValue) > valueToNumber(conditionValue);
    case ConditionOperator::LessThan:
      return valueToNumber(fieldValue) < valueToNumber(conditionValue);
    case ConditionOperator::IsEmpty:
      return valueIsEmpty(fieldValue);
    case ConditionOperator::IsNotEmpty:
      return !valueIsEmpty(fieldValue);
    case ConditionOperator::MatchesRegex:
      return matchesRegex(fieldValue, conditionValue);
    case ConditionOperator::Unknown:
      return false;
  }
  return false;
}

bool evaluateConditions(
  const Rule & rule,
  const Event & event,
  const GraphSnapshot & graph,
  const std::string & ruleId)
{
  for (const auto & condition : rule.conditions) {
    const auto * target = resolveTarget(condition, event, graph, ruleId);
    if (target == nullptr) {
      return false;
    }

    const auto fieldValue = nestedValue(target->data, condition.field);
    if (!evaluateOperator(fieldValue, condition.op, condition.value)) {
      return false;
    }
  }
  return true;
}

}  // namespace automation_engine
