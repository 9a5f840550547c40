#pragma once

#include <automation_engine/event_types.hpp>
#include <automation_engine/graph_types.hpp>
#include <automation_engine/rule_types.hpp>

#include <yaml-cpp/yaml.h>

#include <string>

namespace automation_engine
{

/**
 * @brief Evaluates a rule's guard conditions against the live graph.
 *
 * Conditions are AND-ed and evaluation stops at the first failure; an empty list passes.
 * A condition whose target node cannot be found fails the whole evaluation. Malformed
 * definitions (bad regex, unknown operator, missing field) make their condition false
 * and never throw.
 *
 * @param ruleId Id of the node that owns the rule (resolves the rule-node target).
 */
bool evaluateConditions(
  const Rule & rule,
  const Event & event,
  const GraphSnapshot & graph,
  const std::string & ruleId);

/// Applies one operator to an already-resolved field value.
bool evaluateOperator(
  const YAML::Node & fieldValue, ConditionOperator op, const YAML::Node & conditionValue);

}  // namespace automation_engine
