#include <automation_engine/trigger_matcher.hpp>

#include <automation_engine/graph_traversal.hpp>
#include <automation_engine/value_utils.hpp>

#include <iterator>

namespace automation_engine
{

std::optional<bool> ProximityMemory::exchange(
  const std::string & ruleId, const std::string & nodeId, const bool within)
{
  const auto [it, inserted] = state_.emplace(std::make_pair(ruleId, nodeId), within);
  if (inserted) {
    return std::nullopt;
  }
  const bool previous = it->second;
  it->second = within;
  return previous;
}

void ProximityMemory::forgetRule(const std::string & ruleId)
{
  for (auto it = state_.begin(); it != state_.end(); ) {
    it = it->first.first == ruleId ? state_.erase(it) : std::next(it);
  }
}

void ProximityMemory::forgetNode(const std::string & nodeId)
{
  for (auto it = state_.begin(); it != state_.end(); ) {
    it = it->first.second == nodeId ? state_.erase(it) : std::next(it);
  }
}

namespace
{

bool optionalEquals(const std::optional<std::string> & actual, const std::string & expected)
{
  return actual.has_value() && *actual == expected;
}

/**
 * One overload per trigger alternative. std::visit requires every alternative to be
 * handled, so adding a Trigger type without a case here is a compile error.
 */
class TriggerMatchVisitor
{
public:
  TriggerMatchVisitor(const Event & event, const std::string & ruleId, MatchContext & context)
  : event_(event)
  , ruleId_(ruleId)
  , context_(context)
  {
  }

  bool operator()(const ManualTrigger &) const
  {
    return false;
  }

  bool operator()(const PropertyChangeTrigger & trigger) const
  {
    const auto * change = event_.as<PropertyChangePayload>();
    if (change == nullptr) {
      return false;
    }
    if (!trigger.property.empty() && change->property != trigger.property) {
      return false;
    }
    if (trigger.fromValue && !valuesStrictEqual(change->oldValue, *trigger.fromValue)) {
      return false;
    }
    if (trigger.toValue && !valuesStrictEqual(change->newValue, *trigger.toValue)) {
      return false;
    }
    if (!trigger.nodeFilter.empty() && !optionalEquals(change->nodeType, trigger.nodeFilter)) {
      return false;
    }
    return true;
  }

  bool operator()(const NodeCreatedTrigger & trigger) const
  {
    const auto * created = event_.as<NodeCreatedPayload>();
    if (created == nullptr) {
      return false;
    }
    return trigger.nodeTypeFilter.empty() ||
           optionalEquals(created->nodeType, trigger.nodeTypeFilter);
  }

  bool operator()(const ConnectionMadeTrigger & trigger) const
  {
    const auto * made = event_.as<ConnectionMadePayload>();
    if (made == nullptr) {
      return false;
    }
    if (trigger.direction != ConnectionDirection::Any && made->direction != trigger.direction) {
      return false;
    }
    return trigger.nodeTypeFilter.empty() ||
           optionalEquals(made->connectedNodeType, trigger.nodeTypeFilter);
  }

  bool operator()(const ConnectionCountTrigger & trigger) const
  {
    if (event_.type() != EventType::ConnectionMade &&
      event_.type() != EventType::ConnectionRemoved)
    {
      return false;
    }
    // Counted from the live edge set at match time, not from the event payload.
    const int count = connectionCount(context_.graph, event_.sourceNodeId, trigger.direction);
    return compare(trigger.comparison, count, trigger.threshold);
  }

  bool operator()(const IsolationTrigger &) const
  {
    const auto * removed = event_.as<ConnectionRemovedPayload>();
    return removed != nullptr && removed->connectionCount == 0;
  }

  bool operator()(const ChildrenCompleteTrigger & trigger) const
  {
    const auto * change = event_.as<PropertyChangePayload>();
    if (change == nullptr) {
      return false;
    }
    if (!trigger.property.empty() && change->property != trigger.property) {
      return false;
    }
    return childrenComplete(
      context_.graph, ruleId_, trigger.property, trigger.targetValue, trigger.requireAll);
  }

  bool operator()(const AncestorChangeTrigger & trigger) const
  {
    const auto * change = event_.as<PropertyChangePayload>();
    if (change == nullptr) {
      return false;
    }
    if (!trigger.property.empty() && change->property != trigger.property) {
      return false;
    }
    return hasDescendant(context_.graph, event_.sourceNodeId);
  }

  bool operator()(const RegionEnterTrigger & trigger) const
  {
    const auto * moved = event_.as<NodePositionChangePayload>();
    return moved != nullptr && optionalEquals(moved->enteredRegion, trigger.regionId);
  }

  bool operator()(const RegionExitTrigger & trigger) const
  {
    const auto * moved = event_.as<NodePositionChangePayload>();
    return moved != nullptr && optionalEquals(moved->exitedRegion, trigger.regionId);
  }

  bool operator()(const ClusterSizeTrigger & trigger) const
  {
    const auto * moved = event_.as<NodePositionChangePayload>();
    if (moved == nullptr) {
      return false;
    }
    const auto & relevant = moved->enteredRegion ? moved->enteredRegion : moved->exitedRegion;
    if (!relevant || *relevant != trigger.regionId) {
      return false;
    }
    const int members = context_.regions.memberCount(trigger.regionId);
    return compare(trigger.comparison, members, trigger.threshold);
  }

  bool operator()(const ProximityTrigger & trigger) const
  {
    if (event_.type() != EventType::NodePositionChange || trigger.targetNodeId.empty()) {
      return false;
    }
    const auto * moving = context_.graph.findNode(event_.sourceNodeId);
    const auto * target = context_.graph.findNode(trigger.targetNodeId);
    if (moving == nullptr || target == nullptr) {
      return false;
    }

    const Rect targetBox = nodeBox(*target);
    const bool within = centerDistance(nodeBox(*moving), targetBox) <= trigger.distance;
    auto wasWithin = context_.proximity.exchange(ruleId_, event_.sourceNodeId, within);
    if (!wasWithin) {
      // Unknown pair: fall back to where the node was before this move.
      const auto & previousBox = event_.as<NodePositionChangePayload>()->previousBox;
      if (!previousBox) {
        return false;
      }
      wasWithin = centerDistance(*previousBox, targetBox) <= trigger.distance;
    }

    if (trigger.direction == ProximityDirection::Entering) {
      return !*wasWithin && within;
    }
    return *wasWithin && !within;
  }

  bool operator()(const ScheduleTrigger &) const
  {
    // Ticks are addressed to the rule whose schedule produced them.
    return event_.type() == EventType::ScheduleTick && event_.sourceNodeId == ruleId_;
  }

private:
  const Event & event_;
  const std::string & ruleId_;
  MatchContext & context_;
};

}  // namespace

bool matchesTrigger(
  const Rule & rule,
  const Event & event,
  const std::string & ruleId,
  MatchContext & context)
{
  return std::visit(TriggerMatchVisitor(event, ruleId, context), rule.trigger);
}

}  // namespace automation_engine
