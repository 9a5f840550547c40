#pragma once

#include <automation_engine/event_types.hpp>
#include <automation_engine/graph_types.hpp>
#include <automation_engine/rule_types.hpp>
#include <automation_engine/spatial_region_store.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace automation_engine
{

/**
 * @class ProximityMemory
 * @brief Last known "within distance" flag per (rule, moving node) pair.
 *
 * Runtime-only state, owned by the scheduler.
 */
class ProximityMemory
{
public:
  /// Stores `within` and returns the previously remembered flag, if the pair was known.
  std::optional<bool> exchange(const std::string & ruleId, const std::string & nodeId, bool within);

  void forgetRule(const std::string & ruleId);
  void forgetNode(const std::string & nodeId);
  void clear() { state_.clear(); }
  std::size_t size() const { return state_.size(); }

private:
  std::map<std::pair<std::string, std::string>, bool> state_;
};

/**
 * @struct MatchContext
 * @brief Live state a trigger may consult while matching.
 */
struct MatchContext
{
  const GraphSnapshot & graph;
  const SpatialRegionStore & regions;
  ProximityMemory & proximity;
};

/**
 * @brief Decides whether `event` fires the trigger of `rule`.
 *
 * Manual triggers never match here; they are invoked directly. Schedule triggers match
 * only ticks whose source is the rule itself. Proximity triggers fire
 * only on a threshold crossing in the configured direction, and update the proximity
 * memory on every evaluation whether or not they fire. For a pair with no memory yet the
 * previous state comes from the event's previousBox; without one the evaluation only
 * records the current state.
 *
 * @param ruleId Id of the node that owns the rule.
 */
bool matchesTrigger(
  const Rule & rule, const Event & event, const std::string & ruleId, MatchContext & context);

}  // namespace automation_engine
