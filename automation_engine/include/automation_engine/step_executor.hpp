#pragma once

#include <automation_engine/event_types.hpp>
#include <automation_engine/graph_types.hpp>
#include <automation_engine/rule_types.hpp>

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace automation_engine
{

struct ExecutionContext
{
  std::string triggerNodeId;
  std::string ruleId;
  Event event;
  YAML::Node variables{YAML::NodeType::Map};
  int64_t startedAtMs{0};
};

struct ExecutionResult
{
  bool success{false};
  std::string error;
  int stepsCompleted{0};

  static ExecutionResult ok(int stepsCompleted)
  {
    return ExecutionResult{true, {}, stepsCompleted};
  }

  static ExecutionResult fail(std::string error, int stepsCompleted = 0)
  {
    return ExecutionResult{false, std::move(error), stepsCompleted};
  }
};

/**
 * @class StepExecutor
 * @brief Runs the ordered action steps of one rule.
 *
 * Failures are reported through ExecutionResult. Implementations should not throw; the
 * scheduler records a thrown std::exception as a failed run.
 */
class StepExecutor
{
public:
  virtual ~StepExecutor() = default;

  virtual ExecutionResult execute(
    const std::vector<ActionStep> & steps,
    ExecutionContext & context,
    const GraphSnapshot & snapshot) = 0;
};

}  // namespace automation_engine
