/**
 * @file test_rule_store.cpp
 * @brief Unit tests for the rule table and the recent-event log.
 */

#include <gtest/gtest.h>

#include <automation_engine/event_log.hpp>
#include <automation_engine/rule_store.hpp>

#include <string>
#include <variant>
#include <vector>

namespace
{

automation_engine::GraphNode ruleNode(const std::string & id, const std::string & data)
{
  automation_engine::GraphNode n;
  n.id = id;
  n.type = automation_engine::kRuleNodeType;
  n.data.reset(YAML::Load(data));
  return n;
}

}  // namespace

// Only enabled, decodable rule nodes are registered; broken ones are reported by id.
TEST(RuleStoreTest, SyncRegistersEnabledRuleNodes)
{
  automation_engine::GraphSnapshot graph;
  graph.nodes.push_back(ruleNode("on", "{enabled: true, trigger: {type: manual}}"));
  graph.nodes.push_back(ruleNode("off", "{enabled: false, trigger: {type: manual}}"));
  graph.nodes.push_back(ruleNode("broken", "{enabled: true, trigger: {type: nope}}"));
  automation_engine::GraphNode note;
  note.id = "note";
  note.type = "note";
  note.data.reset(YAML::Load("{enabled: true, trigger: {type: manual}}"));
  graph.nodes.push_back(note);

  automation_engine::RuleStore store;
  const auto result = store.syncRules(graph);

  EXPECT_EQ(result.registered, std::vector<std::string>{"on"});
  ASSERT_EQ(result.errors.size(), 1u);
  EXPECT_EQ(result.errors[0].rfind("broken: ", 0), 0u);
  EXPECT_EQ(store.ids(), std::vector<std::string>{"on"});
}

// Syncing twice on the same graph is a no-op; dropping a node reports it as removed.
TEST(RuleStoreTest, SyncIsIdempotentAndReportsRemovals)
{
  automation_engine::GraphSnapshot graph;
  graph.nodes.push_back(ruleNode("a", "{enabled: true, trigger: {type: manual}}"));
  graph.nodes.push_back(ruleNode("b", "{enabled: true, trigger: {type: isolation}}"));

  automation_engine::RuleStore store;
  store.syncRules(graph);
  const auto again = store.syncRules(graph);
  EXPECT_TRUE(again.removed.empty());
  EXPECT_EQ(store.size(), 2u);

  graph.nodes.pop_back();
  const auto result = store.syncRules(graph);
  EXPECT_EQ(result.removed, std::vector<std::string>{"b"});
  EXPECT_FALSE(store.contains("b"));
}

TEST(RuleStoreTest, RegisterReplacesInPlace)
{
  automation_engine::RuleStore store;
  automation_engine::Rule first;
  first.id = "first";
  automation_engine::Rule second;
  second.id = "second";
  store.registerRule(first);
  store.registerRule(second);

  first.trigger = automation_engine::IsolationTrigger{};
  store.registerRule(first);
  EXPECT_EQ(store.ids(), (std::vector<std::string>{"first", "second"}));
  ASSERT_NE(store.find("first"), nullptr);
  EXPECT_TRUE(std::holds_alternative<automation_engine::IsolationTrigger>(
      store.find("first")->trigger));

  EXPECT_TRUE(store.unregisterRule("first"));
  EXPECT_FALSE(store.unregisterRule("first"));
}

TEST(EventLogTest, KeepsNewestWithinCapacity)
{
  automation_engine::EventLog log(3);
  for (int i = 0; i < 5; ++i) {
    automation_engine::Event event;
    event.sourceNodeId = "n" + std::to_string(i);
    log.push(event);
  }

  const auto events = log.snapshot();
  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(events.front().sourceNodeId, "n4");
  EXPECT_EQ(events.back().sourceNodeId, "n2");

  log.clear();
  EXPECT_EQ(log.size(), 0u);
  EXPECT_EQ(automation_engine::EventLog(0).capacity(), 1u);
}
