#pragma once

#include <automation_engine/graph_store.hpp>
#include <automation_engine/graph_types.hpp>

#include <yaml-cpp/yaml.h>

#include <cstddef>
#include <functional>
#include <map>
#include <string>

namespace automation_engine
{

/**
 * @class InMemoryGraphStore
 * @brief GraphStore that owns its graph and notifies subscribers after every commit.
 *
 * Snapshots handed out are deep copies, so a listener may keep the previous one for
 * diffing. Subscribers run synchronously inside the mutating call.
 */
class InMemoryGraphStore : public GraphStore
{
public:
  using Listener = std::function<void(const GraphSnapshot &)>;

  InMemoryGraphStore() = default;
  explicit InMemoryGraphStore(GraphSnapshot initial);

  GraphSnapshot snapshot() const override;
  bool updateRuleStats(const std::string & ruleId, const RuleRunStats & stats) override;

  /// @return false when the id is already taken.
  bool addNode(GraphNode node);
  /// Removes the node together with every edge touching it.
  bool removeNode(const std::string & nodeId);
  /// Merges the top-level keys of `patch` into the node's data.
  bool updateNodeData(const std::string & nodeId, const YAML::Node & patch);
  bool removeNodeDataKey(const std::string & nodeId, const std::string & key);
  bool moveNode(const std::string & nodeId, const Point & position);
  /// @return false when the id is taken or an endpoint does not exist.
  bool addEdge(GraphEdge edge);
  bool removeEdge(const std::string & edgeId);
  void replace(GraphSnapshot graph);

  std::size_t subscribe(Listener listener);
  void unsubscribe(std::size_t token);

private:
  GraphNode * findMutable(const std::string & nodeId);
  void commit();

  GraphSnapshot graph_;
  std::map<std::size_t, Listener> listeners_;
  std::size_t nextToken_{1};
};

}  // namespace automation_engine
