#include <automation_engine/in_memory_graph_store.hpp>

#include <algorithm>
#include <utility>

namespace automation_engine
{

InMemoryGraphStore::InMemoryGraphStore(GraphSnapshot initial)
: graph_(std::move(initial))
{
}

GraphSnapshot InMemoryGraphStore::snapshot() const
{
  GraphSnapshot copy = graph_;
  for (auto & node : copy.nodes) {
    // Rebind, do not assign: assignment would write through to the stored node.
    node.data.reset(YAML::Clone(node.data));
  }
  return copy;
}

bool InMemoryGraphStore::updateRuleStats(const std::string & ruleId, const RuleRunStats & stats)
{
  GraphNode * node = findMutable(ruleId);
  if (node == nullptr) {
    return false;
  }

  node->data["runCount"] = stats.runCount;
  node->data["errorCount"] = stats.errorCount;
  if (stats.lastRun) {
    node->data["lastRun"] = *stats.lastRun;
  } else {
    node->data.remove("lastRun");
  }
  if (stats.lastError) {
    node->data["lastError"] = *stats.lastError;
  } else {
    node->data.remove("lastError");
  }

  commit();
  return true;
}

bool InMemoryGraphStore::addNode(GraphNode node)
{
  if (graph_.findNode(node.id) != nullptr) {
    return false;
  }
  if (!node.data || !node.data.IsMap()) {
    node.data.reset(YAML::Node(YAML::NodeType::Map));
  }
  graph_.nodes.push_back(std::move(node));
  commit();
  return true;
}

bool InMemoryGraphStore::removeNode(const std::string & nodeId)
{
  auto it = std::find_if(
    graph_.nodes.begin(), graph_.nodes.end(),
    [&](const GraphNode & n) {return n.id == nodeId;});
  if (it == graph_.nodes.end()) {
    return false;
  }
  graph_.nodes.erase(it);
  graph_.edges.erase(
    std::remove_if(
      graph_.edges.begin(), graph_.edges.end(),
      [&](const GraphEdge & e) {return e.source == nodeId || e.target == nodeId;}),
    graph_.edges.end());
  commit();
  return true;
}

bool InMemoryGraphStore::updateNodeData(const std::string & nodeId, const YAML::Node & patch)
{
  GraphNode * node = findMutable(nodeId);
  if (node == nullptr || !patch.IsMap()) {
    return false;
  }
  for (const auto & entry : patch) {
    node->data[entry.first.as<std::string>()] = YAML::Clone(entry.second);
  }
  commit();
  return true;
}

bool InMemoryGraphStore::removeNodeDataKey(const std::string & nodeId, const std::string & key)
{
  GraphNode * node = findMutable(nodeId);
  if (node == nullptr || !node->data.remove(key)) {
    return false;
  }
  commit();
  return true;
}

bool InMemoryGraphStore::moveNode(const std::string & nodeId, const Point & position)
{
  GraphNode * node = findMutable(nodeId);
  if (node == nullptr) {
    return false;
  }
  node->position = position;
  commit();
  return true;
}

bool InMemoryGraphStore::addEdge(GraphEdge edge)
{
  if (graph_.findEdge(edge.id) != nullptr ||
    graph_.findNode(edge.source) == nullptr ||
    graph_.findNode(edge.target) == nullptr)
  {
    return false;
  }
  graph_.edges.push_back(std::move(edge));
  commit();
  return true;
}

bool InMemoryGraphStore::removeEdge(const std::string & edgeId)
{
  auto it = std::find_if(
    graph_.edges.begin(), graph_.edges.end(),
    [&](const GraphEdge & e) {return e.id == edgeId;});
  if (it == graph_.edges.end()) {
    return false;
  }
  graph_.edges.erase(it);
  commit();
  return true;
}

void InMemoryGraphStore::replace(GraphSnapshot graph)
{
  graph_ = std::move(graph);
  commit();
}

std::size_t InMemoryGraphStore::subscribe(Listener listener)
{
  const std::size_t token = nextToken_++;
  listeners_[token] = std::move(listener);
  return token;
}

void InMemoryGraphStore::unsubscribe(const std::size_t token)
{
  listeners_.erase(token);
}

GraphNode * InMemoryGraphStore::findMutable(const std::string & nodeId)
{
  for (auto & node : graph_.nodes) {
    if (node.id == nodeId) {
      return &node;
    }
  }
  return nullptr;
}

void InMemoryGraphStore::commit()
{
  if (listeners_.empty()) {
    return;
  }
  const GraphSnapshot current = snapshot();
  // A listener may unsubscribe (or mutate the store) while being notified.
  const auto listeners = listeners_;
  for (const auto & entry : listeners) {
    entry.second(current);
  }
}

}  // namespace automation_engine
