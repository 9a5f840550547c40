#pragma once

#include <automation_engine/graph_types.hpp>
#include <automation_engine/rule_types.hpp>

#include <string>

namespace automation_engine
{

/**
 * @class GraphStore
 * @brief Access to the graph the rules live in.
 *
 * The engine reads whole snapshots and writes back nothing but run statistics.
 */
class GraphStore
{
public:
  virtual ~GraphStore() = default;

  virtual GraphSnapshot snapshot() const = 0;

  /// @return false when `ruleId` no longer names a node.
  virtual bool updateRuleStats(const std::string & ruleId, const RuleRunStats & stats) = 0;
};

}  // namespace automation_engine
