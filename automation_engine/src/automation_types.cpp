#include <automation_engine/event_types.hpp>
#include <automation_engine/rule_types.hpp>

namespace automation_engine
{
namespace
{

struct TriggerNameVisitor
{
  const char * operator()(const ManualTrigger &) const { return "manual"; }
  const char * operator()(const ScheduleTrigger &) const { return "schedule"; }
  const char * operator()(const PropertyChangeTrigger &) const { return "property-change"; }
  const char * operator()(const NodeCreatedTrigger &) const { return "node-created"; }
  const char * operator()(const ConnectionMadeTrigger &) const { return "connection-made"; }
  const char * operator()(const ConnectionCountTrigger &) const { return "connection-count"; }
  const char * operator()(const IsolationTrigger &) const { return "isolation"; }
  const char * operator()(const ChildrenCompleteTrigger &) const { return "children-complete"; }
  const char * operator()(const AncestorChangeTrigger &) const { return "ancestor-change"; }
  const char * operator()(const RegionEnterTrigger &) const { return "region-enter"; }
  const char * operator()(const RegionExitTrigger &) const { return "region-exit"; }
  const char * operator()(const ClusterSizeTrigger &) const { return "cluster-size"; }
  const char * operator()(const ProximityTrigger &) const { return "proximity"; }
};

}  // namespace

const char * triggerTypeName(const Trigger & trigger)
{
  return std::visit(TriggerNameVisitor{}, trigger);
}

const char * toString(const EventType type)
{
  switch (type) {
    case EventType::PropertyChange:
      return "property-change";
    case EventType::NodeCreated:
      return "node-created";
    case EventType::ConnectionMade:
      return "connection-made";
    case EventType::ConnectionRemoved:
      return "connection-removed";
    case EventType::NodePositionChange:
      return "node-position-change";
    case EventType::Manual:
      return "manual";
    case EventType::ScheduleTick:
      return "schedule-tick";
  }
  return "unknown";
}

const char * toString(const ConnectionDirection direction)
{
  switch (direction) {
    case ConnectionDirection::Any:
      return "any";
    case ConnectionDirection::Incoming:
      return "incoming";
    case ConnectionDirection::Outgoing:
      return "outgoing";
  }
  return "any";
}

const char * toString(const Comparison comparison)
{
  switch (comparison) {
    case Comparison::Gte:
      return "gte";
    case Comparison::Lte:
      return "lte";
    case Comparison::Eq:
      return "eq";
  }
  return "eq";
}

const char * toString(const ConditionOperator op)
{
  switch (op) {
    case ConditionOperator::Equals:
      return "equals";
    case ConditionOperator::NotEquals:
      return "not-equals";
    case ConditionOperator::Contains:
      return "contains";
    case ConditionOperator::NotContains:
      return "not-contains";
    case ConditionOperator::GreaterThan:
      return "greater-than";
    case ConditionOperator::LessThan:
      return "less-than";
    case ConditionOperator::IsEmpty:
      return "is-empty";
    case ConditionOperator::IsNotEmpty:
      return "is-not-empty";
    case ConditionOperator::MatchesRegex:
      return "matches-regex";
    case ConditionOperator::Unknown:
      return "unknown";
  }
  return "unknown";
}

bool compare(const Comparison comparison, const int value, const int threshold)
{
  switch (comparison) {
    case Comparison::Gte:
      return value >= threshold;
    case Comparison::Lte:
      return value <= threshold;
    case Comparison::Eq:
      return value == threshold;
  }
  return false;
}

}  // namespace automation_engine
