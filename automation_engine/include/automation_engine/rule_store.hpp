#pragma once

#include <automation_engine/graph_types.hpp>
#include <automation_engine/rule_types.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace automation_engine
{

/**
 * @class RuleStore
 * @brief Registered rules keyed by the id of the node that owns them.
 *
 * Iteration order is registration order.
 */
class RuleStore
{
public:
  struct SyncResult
  {
    std::vector<std::string> registered;
    std::vector<std::string> removed;
    // "<nodeId>: <reason>" for every rule node whose rule failed to decode
    std::vector<std::string> errors;
  };

  /// Registers `rule` under `rule.id`, replacing an existing entry in place.
  void registerRule(Rule rule);
  bool unregisterRule(const std::string & ruleId);

  const Rule * find(const std::string & ruleId) const;
  bool contains(const std::string & ruleId) const { return find(ruleId) != nullptr; }
  std::vector<std::string> ids() const;
  std::size_t size() const { return rules_.size(); }
  const std::vector<Rule> & rules() const { return rules_; }

  /**
   * @brief Rebuilds the whole table from the enabled rule nodes of `snapshot`.
   *
   * Safe to call any number of times; calling it twice on the same snapshot leaves the
   * table unchanged.
   */
  SyncResult syncRules(const GraphSnapshot & snapshot);

private:
  std::vector<Rule> rules_;
};

}  // namespace automation_engine
