#pragma once

#include <automation_engine/in_memory_graph_store.hpp>
#include <automation_engine/step_executor.hpp>

#include <rclcpp/logger.hpp>

#include <string>
#include <vector>

namespace automation_engine
{

/// Immediate re-runs of a failing step whose onError is retry.
constexpr int kStepRetryCount = 3;

/**
 * @class GraphStepExecutor
 * @brief Runs graph-editing action steps against an InMemoryGraphStore.
 *
 * Supported step types: update-property, move-node, link-nodes, unlink-nodes,
 * delete-node and condition. Step targets are `trigger-node`, `action-node` or
 * `specific-node` (with `targetNodeId` / `sourceNodeId`). Steps that need outside
 * services fail with "unsupported step type".
 */
class GraphStepExecutor : public StepExecutor
{
public:
  GraphStepExecutor(InMemoryGraphStore & store, rclcpp::Logger logger);

  ExecutionResult execute(
    const std::vector<ActionStep> & steps,
    ExecutionContext & context,
    const GraphSnapshot & snapshot) override;

private:
  struct StepOutcome
  {
    bool success{true};
    std::string error;
    /// Number of following steps to skip (condition steps).
    int skip{0};
  };

  StepOutcome runStep(const ActionStep & step, const ExecutionContext & context);
  StepOutcome runStepUnchecked(const ActionStep & step, const ExecutionContext & context);

  StepOutcome updateProperty(const YAML::Node & config, const ExecutionContext & context);
  StepOutcome moveNode(const YAML::Node & config, const ExecutionContext & context);
  StepOutcome linkNodes(const YAML::Node & config, const ExecutionContext & context);
  StepOutcome unlinkNodes(const YAML::Node & config, const ExecutionContext & context);
  StepOutcome deleteNode(const YAML::Node & config, const ExecutionContext & context);
  StepOutcome condition(const YAML::Node & config, const ExecutionContext & context);

  static StepOutcome fail(std::string error);

  InMemoryGraphStore & store_;
  rclcpp::Logger logger_;
};

}  // namespace automation_engine
