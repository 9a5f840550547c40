#include <automation_engine/rule_store.hpp>

#include <automation_engine/workspace_codec.hpp>

#include <algorithm>
#include <stdexcept>

namespace automation_engine
{

void RuleStore::registerRule(Rule rule)
{
  auto it = std::find_if(
    rules_.begin(), rules_.end(), [&](const Rule & r) {return r.id == rule.id;});
  if (it != rules_.end()) {
    *it = std::move(rule);
  } else {
    rules_.push_back(std::move(rule));
  }
}

bool RuleStore::unregisterRule(const std::string & ruleId)
{
  auto it = std::find_if(
    rules_.begin(), rules_.end(), [&](const Rule & r) {return r.id == ruleId;});
  if (it == rules_.end()) {
    return false;
  }
  rules_.erase(it);
  return true;
}

const Rule * RuleStore::find(const std::string & ruleId) const
{
  for (const auto & rule : rules_) {
    if (rule.id == ruleId) {
      return &rule;
    }
  }
  return nullptr;
}

std::vector<std::string> RuleStore::ids() const
{
  std::vector<std::string> out;
  out.reserve(rules_.size());
  for (const auto & rule : rules_) {
    out.push_back(rule.id);
  }
  return out;
}

RuleStore::SyncResult RuleStore::syncRules(const GraphSnapshot & snapshot)
{
  SyncResult result;
  std::vector<Rule> rebuilt;

  for (const auto & node : snapshot.nodes) {
    if (!isRuleNode(node)) {
      continue;
    }
    try {
      Rule rule = decodeRule(node.id, node.data);
      if (!rule.enabled) {
        continue;
      }
      result.registered.push_back(rule.id);
      rebuilt.push_back(std::move(rule));
    } catch (const YAML::Exception & e) {
      result.errors.push_back(node.id + ": " + e.what());
    } catch (const std::runtime_error & e) {
      result.errors.push_back(node.id + ": " + e.what());
    }
  }

  for (const auto & rule : rules_) {
    const bool kept = std::any_of(
      rebuilt.begin(), rebuilt.end(), [&](const Rule & r) {return r.id == rule.id;});
    if (!kept) {
      result.removed.push_back(rule.id);
    }
  }

  rules_ = std::move(rebuilt);
  return result;
}

}  // namespace automation_engine
