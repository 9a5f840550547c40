/**
 * @file test_workspace_codec.cpp
 * @brief Unit tests for decoding workspace documents and persisting regions.
 *
 * Decoders throw on malformed input; the load/save entry points report through their
 * result structs. Both paths are covered here.
 */

#include <gtest/gtest.h>

#include <automation_engine/workspace_codec.hpp>

#include <cstddef>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <variant>

namespace
{

const char kWorkspace[] = R"(
nodes:
  - id: project
    type: project
    position: {x: 10, y: 20}
    width: 300
    data: {title: Launch, status: open}
  - id: rule
    type: action
    measured: {width: 200, height: 90}
    data:
      enabled: true
      trigger: {type: connection-count, threshold: 3, comparison: gte, direction: incoming}
      conditions:
        - {field: status, operator: not-equals, value: done, target: action-node}
      actions:
        - {type: update-property, onError: retry, config: {target: trigger-node, property: status, value: busy}}
      runCount: 4
      lastError: boom
  - id: bare
edges:
  - {id: e1, source: project, target: rule}
  - {source: rule, target: bare}
regions:
  - id: triage
    name: Triage
    bounds: {x: 0, y: 0, width: 500, height: 400}
    linkedActionIds: [rule]
    presentationOrder: 2
  - id: district
    isDistrict: true
    bounds: {x: 600, y: 0, width: 100, height: 100}
)";

}  // namespace

TEST(WorkspaceCodecTest, ParsesNodesEdgesAndRegions)
{
  const auto result = automation_engine::parseWorkspace(kWorkspace);
  ASSERT_TRUE(result.ok) << result.error;

  ASSERT_EQ(result.graph.nodes.size(), 3u);
  const auto * project = result.graph.findNode("project");
  ASSERT_NE(project, nullptr);
  EXPECT_DOUBLE_EQ(project->position.y, 20.0);
  EXPECT_EQ(project->width.value_or(0.0), 300.0);
  EXPECT_FALSE(project->height.has_value());
  EXPECT_EQ(project->data["title"].as<std::string>(), "Launch");

  const auto * rule = result.graph.findNode("rule");
  ASSERT_NE(rule, nullptr);
  EXPECT_EQ(rule->measuredHeight.value_or(0.0), 90.0);

  // Defaults: type "note", empty data map, edge id from its endpoints.
  const auto * bare = result.graph.findNode("bare");
  ASSERT_NE(bare, nullptr);
  EXPECT_EQ(bare->type, "note");
  EXPECT_TRUE(bare->data.IsMap());
  EXPECT_NE(result.graph.findEdge("rule->bare"), nullptr);

  ASSERT_EQ(result.regions.size(), 2u);
  EXPECT_EQ(result.regions[0].name, "Triage");
  EXPECT_EQ(result.regions[0].linkedActionIds.size(), 1u);
  EXPECT_EQ(result.regions[0].presentationOrder.value_or(0), 2);
  EXPECT_TRUE(result.regions[1].isDistrict);
}

TEST(WorkspaceCodecTest, DecodesEmbeddedRule)
{
  const auto result = automation_engine::parseWorkspace(kWorkspace);
  ASSERT_TRUE(result.ok) << result.error;
  const auto * node = result.graph.findNode("rule");
  ASSERT_NE(node, nullptr);
  ASSERT_TRUE(automation_engine::isRuleNode(*node));

  const auto rule = automation_engine::decodeRule(node->id, node->data);
  EXPECT_TRUE(rule.enabled);
  const auto * trigger = std::get_if<automation_engine::ConnectionCountTrigger>(&rule.trigger);
  ASSERT_NE(trigger, nullptr);
  EXPECT_EQ(trigger->threshold, 3);
  EXPECT_EQ(trigger->direction, automation_engine::ConnectionDirection::Incoming);

  ASSERT_EQ(rule.conditions.size(), 1u);
  EXPECT_EQ(rule.conditions[0].op, automation_engine::ConditionOperator::NotEquals);
  EXPECT_EQ(rule.conditions[0].target, automation_engine::ConditionTarget::RuleNode);

  ASSERT_EQ(rule.actionSteps.size(), 1u);
  EXPECT_EQ(rule.actionSteps[0].onError, automation_engine::StepErrorBehavior::Retry);
  EXPECT_EQ(rule.actionSteps[0].config["property"].as<std::string>(), "status");

  EXPECT_EQ(rule.stats.runCount, 4);
  EXPECT_EQ(rule.stats.errorCount, 0);
  EXPECT_EQ(rule.stats.lastError.value_or(""), "boom");
}

TEST(WorkspaceCodecTest, RuleDefaults)
{
  const auto rule = automation_engine::decodeRule("r", YAML::Load("{trigger: {type: manual}}"));
  EXPECT_FALSE(rule.enabled);
  EXPECT_TRUE(rule.conditions.empty());
  EXPECT_TRUE(rule.actionSteps.empty());
  EXPECT_FALSE(rule.stats.lastRun.has_value());

  const auto proximity = automation_engine::decodeTrigger(
    YAML::Load("{type: proximity, targetNodeId: hub, distance: 150, direction: leaving}"));
  const auto * p = std::get_if<automation_engine::ProximityTrigger>(&proximity);
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(p->direction, automation_engine::ProximityDirection::Exiting);

  // Unrecognized operators decode to a condition that never passes.
  const auto condition = automation_engine::decodeCondition(
    YAML::Load("{field: x, operator: sounds-like}"));
  EXPECT_EQ(condition.op, automation_engine::ConditionOperator::Unknown);
}

TEST(WorkspaceCodecTest, MalformedRulesThrow)
{
  EXPECT_THROW(
    automation_engine::decodeRule("r", YAML::Load("{enabled: true}")), std::runtime_error);
  EXPECT_THROW(
    automation_engine::decodeTrigger(YAML::Load("{type: telepathy}")), std::runtime_error);
  EXPECT_THROW(
    automation_engine::decodeTrigger(
      YAML::Load("{type: connection-count, threshold: 2, comparison: about}")),
    std::runtime_error);
  EXPECT_THROW(
    automation_engine::decodeTrigger(YAML::Load("{type: region-enter}")), std::runtime_error);
  EXPECT_THROW(
    automation_engine::decodeCondition(YAML::Load("{field: x, target: elsewhere}")),
    std::runtime_error);
}

TEST(WorkspaceCodecTest, MalformedDocumentsReportErrors)
{
  auto result = automation_engine::parseWorkspace("nodes: [ {id: a");
  EXPECT_FALSE(result.ok);
  EXPECT_FALSE(result.error.empty());

  result = automation_engine::parseWorkspace("- just\n- a list\n");
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, "workspace root must be a map");

  result = automation_engine::parseWorkspace("nodes: [{id: a}, {id: a}]");
  EXPECT_FALSE(result.ok);
  EXPECT_NE(result.error.find("duplicate node id 'a'"), std::string::npos);

  result = automation_engine::loadWorkspace("/nonexistent/workspace.yaml");
  EXPECT_FALSE(result.ok);
  EXPECT_NE(result.error.find("cannot open"), std::string::npos);

  // An empty document is an empty workspace.
  result = automation_engine::parseWorkspace("");
  EXPECT_TRUE(result.ok) << result.error;
  EXPECT_TRUE(result.graph.nodes.empty());
}

// Regions written by saveRegions load back unchanged, and nothing else is written.
TEST(WorkspaceCodecTest, SavedRegionsLoadBack)
{
  const auto parsed = automation_engine::parseWorkspace(kWorkspace);
  ASSERT_TRUE(parsed.ok) << parsed.error;

  const std::string path = ::testing::TempDir() + "automation_engine_regions.yaml";
  const auto saved = automation_engine::saveRegions(path, parsed.regions);
  ASSERT_TRUE(saved.ok) << saved.error;

  const auto loaded = automation_engine::loadWorkspace(path);
  std::remove(path.c_str());
  ASSERT_TRUE(loaded.ok) << loaded.error;
  EXPECT_TRUE(loaded.graph.nodes.empty());
  ASSERT_EQ(loaded.regions.size(), parsed.regions.size());
  for (std::size_t i = 0; i < loaded.regions.size(); ++i) {
    const auto & a = parsed.regions[i];
    const auto & b = loaded.regions[i];
    EXPECT_EQ(a.id, b.id);
    EXPECT_EQ(a.name, b.name);
    EXPECT_DOUBLE_EQ(a.bounds.width, b.bounds.width);
    EXPECT_EQ(a.isDistrict, b.isDistrict);
    EXPECT_EQ(a.linkedActionIds, b.linkedActionIds);
    EXPECT_EQ(a.presentationOrder, b.presentationOrder);
  }
}

TEST(WorkspaceCodecTest, SaveToUnwritablePathFails)
{
  const auto result = automation_engine::saveRegions("/nonexistent/dir/regions.yaml", {});
  EXPECT_FALSE(result.ok);
  EXPECT_FALSE(result.error.empty());
}
