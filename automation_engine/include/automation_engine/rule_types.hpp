#pragma once

#include <automation_engine/event_types.hpp>

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace automation_engine
{

enum class Comparison : uint8_t
{
  Gte,
  Lte,
  Eq
};

enum class ProximityDirection : uint8_t
{
  Entering,
  Exiting
};

// --- Trigger variants -------------------------------------------------------------
// An empty string filter means "no filter".

struct ManualTrigger
{
};

struct ScheduleTrigger
{
  /// Recurrence in the subset parseCron() accepts.
  std::string cron;
};

struct PropertyChangeTrigger
{
  std::string property;
  std::optional<YAML::Node> fromValue;
  std::optional<YAML::Node> toValue;
  std::string nodeFilter;
};

struct NodeCreatedTrigger
{
  std::string nodeTypeFilter;
};

struct ConnectionMadeTrigger
{
  ConnectionDirection direction{ConnectionDirection::Any};
  std::string nodeTypeFilter;
};

struct ConnectionCountTrigger
{
  int threshold{0};
  Comparison comparison{Comparison::Gte};
  ConnectionDirection direction{ConnectionDirection::Any};
};

struct IsolationTrigger
{
};

struct ChildrenCompleteTrigger
{
  std::string property;
  YAML::Node targetValue{YAML::NodeType::Undefined};
  bool requireAll{true};
};

struct AncestorChangeTrigger
{
  std::string property;
};

struct RegionEnterTrigger
{
  std::string regionId;
};

struct RegionExitTrigger
{
  std::string regionId;
};

struct ClusterSizeTrigger
{
  std::string regionId;
  int threshold{0};
  Comparison comparison{Comparison::Gte};
};

struct ProximityTrigger
{
  std::string targetNodeId;
  double distance{0.0};
  ProximityDirection direction{ProximityDirection::Entering};
};

using Trigger = std::variant<
  ManualTrigger,
  ScheduleTrigger,
  PropertyChangeTrigger,
  NodeCreatedTrigger,
  ConnectionMadeTrigger,
  ConnectionCountTrigger,
  IsolationTrigger,
  ChildrenCompleteTrigger,
  AncestorChangeTrigger,
  RegionEnterTrigger,
  RegionExitTrigger,
  ClusterSizeTrigger,
  ProximityTrigger>;

/// Stable wire name of the trigger ("property-change", "region-enter", ...).
const char * triggerTypeName(const Trigger & trigger);

// --- Conditions ---------------------------------------------------------------------

enum class ConditionTarget : uint8_t
{
  TriggerNode,
  RuleNode,
  SpecificNode
};

enum class ConditionOperator : uint8_t
{
  Equals,
  NotEquals,
  Contains,
  NotContains,
  GreaterThan,
  LessThan,
  IsEmpty,
  IsNotEmpty,
  MatchesRegex,
  // Unrecognized operator names decode to this and always evaluate to false.
  Unknown
};

struct Condition
{
  std::string id;
  ConditionTarget target{ConditionTarget::TriggerNode};
  std::string targetNodeId;
  std::string field;
  ConditionOperator op{ConditionOperator::Equals};
  YAML::Node value{YAML::NodeType::Undefined};
};

// --- Action steps ---------------------------------------------------------------------

enum class StepErrorBehavior : uint8_t
{
  Stop,
  Continue,
  Retry
};

/**
 * @struct ActionStep
 * @brief One step of a rule's action sequence. Interpreted only by the StepExecutor.
 */
struct ActionStep
{
  std::string id;
  std::string type;
  std::string label;
  StepErrorBehavior onError{StepErrorBehavior::Stop};
  bool disabled{false};
  YAML::Node config{YAML::NodeType::Map};
};

// --- Rules -----------------------------------------------------------------------------

struct RuleRunStats
{
  int runCount{0};
  int errorCount{0};
  std::optional<int64_t> lastRun;
  std::optional<std::string> lastError;
};

/**
 * @struct Rule
 * @brief Declarative automation rule attached to one graph node.
 *
 * The engine reads trigger, conditions and steps and only writes run statistics back
 * through the GraphStore.
 */
struct Rule
{
  std::string id;
  Trigger trigger{ManualTrigger{}};
  std::vector<Condition> conditions;
  std::vector<ActionStep> actionSteps;
  bool enabled{true};
  RuleRunStats stats;
};

const char * toString(Comparison comparison);
const char * toString(ConditionOperator op);

/// Applies a gte/lte/eq comparison of `value` against `threshold`.
bool compare(Comparison comparison, int value, int threshold);

}  // namespace automation_engine
