#include <automation_engine/graph_step_executor.hpp>

#include <automation_engine/condition_evaluator.hpp>
#include <automation_engine/value_utils.hpp>
#include <automation_engine/workspace_codec.hpp>

#include <rclcpp/logging.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace automation_engine
{
namespace
{

std::optional<std::string> resolveTarget(
  const YAML::Node & config,
  const char * roleKey,
  const char * idKey,
  const ExecutionContext & context)
{
  const auto role = config[roleKey].as<std::string>("");
  if (role == "trigger-node") {
    return context.triggerNodeId;
  }
  if (role == "action-node" || role == "rule-node") {
    return context.ruleId;
  }
  if (role == "specific-node") {
    const auto id = config[idKey].as<std::string>("");
    if (!id.empty()) {
      return id;
    }
  }
  return std::nullopt;
}

std::string stepLabel(const std::size_t index, const ActionStep & step)
{
  return "Step " + std::to_string(index + 1) + " (" + step.type + ")";
}

}  // namespace

GraphStepExecutor::GraphStepExecutor(InMemoryGraphStore & store, rclcpp::Logger logger)
: store_(store)
, logger_(logger)
{
}

ExecutionResult GraphStepExecutor::execute(
  const std::vector<ActionStep> & steps,
  ExecutionContext & context,
  const GraphSnapshot & /*snapshot*/)
{
  int completed = 0;
  int skipRemaining = 0;

  for (std::size_t i = 0; i < steps.size(); ++i) {
    const ActionStep & step = steps[i];

    if (step.disabled) {
      ++completed;
      continue;
    }
    if (skipRemaining > 0) {
      --skipRemaining;
      ++completed;
      continue;
    }

    StepOutcome outcome = runStep(step, context);
    if (!outcome.success) {
      switch (step.onError) {
        case StepErrorBehavior::Stop:
          return ExecutionResult::fail(stepLabel(i, step) + ": " + outcome.error, completed);

        case StepErrorBehavior::Continue:
          RCLCPP_DEBUG(logger_, "%s failed, continuing: %s",
            stepLabel(i, step).c_str(), outcome.error.c_str());
          ++completed;
          continue;

        case StepErrorBehavior::Retry: {
          bool recovered = false;
          for (int attempt = 1; attempt <= kStepRetryCount && !recovered; ++attempt) {
            RCLCPP_DEBUG(logger_, "Retrying %s (attempt %d/%d)",
              stepLabel(i, step).c_str(), attempt, kStepRetryCount);
            StepOutcome retry = runStep(step, context);
            if (retry.success) {
              outcome = std::move(retry);
              recovered = true;
            }
          }
          if (!recovered) {
            return ExecutionResult::fail(
              stepLabel(i, step) + " failed after " + std::to_string(kStepRetryCount) +
              " retries: " + outcome.error,
              completed);
          }
          break;
        }
      }
    }

    if (outcome.skip > 0) {
      skipRemaining = outcome.skip;
    }
    ++completed;
  }

  return ExecutionResult::ok(completed);
}

GraphStepExecutor::StepOutcome GraphStepExecutor::runStep(
  const ActionStep & step,
  const ExecutionContext & context)
{
  try {
    return runStepUnchecked(step, context);
  } catch (const YAML::Exception & e) {
    return fail(std::string("invalid step config: ") + e.what());
  } catch (const std::runtime_error & e) {
    return fail(std::string("invalid step config: ") + e.what());
  }
}

GraphStepExecutor::StepOutcome GraphStepExecutor::runStepUnchecked(
  const ActionStep & step,
  const ExecutionContext & context)
{
  const YAML::Node & config = step.config;

  if (step.type == "update-property") {
    return updateProperty(config, context);
  }
  if (step.type == "move-node") {
    return moveNode(config, context);
  }
  if (step.type == "link-nodes") {
    return linkNodes(config, context);
  }
  if (step.type == "unlink-nodes") {
    return unlinkNodes(config, context);
  }
  if (step.type == "delete-node") {
    return deleteNode(config, context);
  }
  if (step.type == "condition") {
    return condition(config, context);
  }
  return fail("unsupported step type '" + step.type + "'");
}

GraphStepExecutor::StepOutcome GraphStepExecutor::updateProperty(
  const YAML::Node & config,
  const ExecutionContext & context)
{
  const auto target = resolveTarget(config, "target", "targetNodeId", context);
  if (!target) {
    return fail("Target node not found");
  }
  const auto property = config["property"].as<std::string>("");
  if (property.empty()) {
    return fail("update-property needs 'property'");
  }

  YAML::Node patch(YAML::NodeType::Map);
  patch[property] = config["value"] ? YAML::Clone(config["value"]) : YAML::Node();
  if (!store_.updateNodeData(*target, patch)) {
    return fail("Node " + *target + " not found");
  }
  return {};
}

GraphStepExecutor::StepOutcome GraphStepExecutor::moveNode(
  const YAML::Node & config,
  const ExecutionContext & context)
{
  const auto target = resolveTarget(config, "target", "targetNodeId", context);
  if (!target) {
    return fail("Target node not found");
  }
  const GraphSnapshot graph = store_.snapshot();
  const GraphNode * node = graph.findNode(*target);
  if (node == nullptr) {
    return fail("Node " + *target + " not found");
  }

  const double x = config["x"].as<double>(0.0);
  const double y = config["y"].as<double>(0.0);
  Point position{x, y};
  if (config["position"].as<std::string>("absolute") == "relative") {
    position = Point{node->position.x + x, node->position.y + y};
  }
  if (!store_.moveNode(*target, position)) {
    return fail("Node " + *target + " not found");
  }
  return {};
}

GraphStepExecutor::StepOutcome GraphStepExecutor::linkNodes(
  const YAML::Node & config,
  const ExecutionContext & context)
{
  const auto source = resolveTarget(config, "source", "sourceNodeId", context);
  const auto target = resolveTarget(config, "target", "targetNodeId", context);
  if (!source || !target) {
    return fail("Source or target node not found");
  }

  const GraphSnapshot graph = store_.snapshot();
  if (graph.findNode(*source) == nullptr || graph.findNode(*target) == nullptr) {
    return fail("Source or target node not found");
  }

  const std::string baseId = *source + "->" + *target;
  std::string edgeId = baseId;
  for (int n = 2; graph.findEdge(edgeId) != nullptr; ++n) {
    edgeId = baseId + "#" + std::to_string(n);
  }
  if (!store_.addEdge(GraphEdge{edgeId, *source, *target})) {
    return fail("Could not link " + *source + " to " + *target);
  }
  return {};
}

GraphStepExecutor::StepOutcome GraphStepExecutor::unlinkNodes(
  const YAML::Node & config,
  const ExecutionContext & context)
{
  const auto source = resolveTarget(config, "source", "sourceNodeId", context);
  const auto target = resolveTarget(config, "target", "targetNodeId", context);
  if (!source || !target) {
    return fail("Source or target node not found");
  }

  // Either direction counts.
  const GraphSnapshot graph = store_.snapshot();
  for (const auto & edge : graph.edges) {
    if ((edge.source == *source && edge.target == *target) ||
      (edge.source == *target && edge.target == *source))
    {
      store_.removeEdge(edge.id);
    }
  }
  return {};
}

GraphStepExecutor::StepOutcome GraphStepExecutor::deleteNode(
  const YAML::Node & config,
  const ExecutionContext & context)
{
  const auto target = resolveTarget(config, "target", "targetNodeId", context);
  if (!target) {
    return fail("Target node not found");
  }
  if (!store_.removeNode(*target)) {
    return fail("Node " + *target + " not found");
  }
  return {};
}

GraphStepExecutor::StepOutcome GraphStepExecutor::condition(
  const YAML::Node & config,
  const ExecutionContext & context)
{
  const auto target = resolveTarget(config, "target", "targetNodeId", context);
  if (!target) {
    return fail("Target node not found");
  }
  const GraphSnapshot graph = store_.snapshot();
  const GraphNode * node = graph.findNode(*target);
  if (node == nullptr) {
    return fail("Node " + *target + " not found");
  }

  Condition check = decodeCondition(config);
  const YAML::Node fieldValue = nestedValue(node->data, check.field);
  StepOutcome outcome;
  if (!evaluateOperator(fieldValue, check.op, check.value)) {
    outcome.skip = config["skipCount"].as<int>(0);
  }
  return outcome;
}

GraphStepExecutor::StepOutcome GraphStepExecutor::fail(std::string error)
{
  StepOutcome outcome;
  outcome.success = false;
  outcome.error = std::move(error);
  return outcome;
}

}  // namespace automation_engine
