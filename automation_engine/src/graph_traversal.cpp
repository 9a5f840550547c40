#include <automation_engine/graph_traversal.hpp>

#include <automation_engine/value_utils.hpp>

#include <algorithm>
#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace automation_engine
{

std::vector<std::string> childIds(const GraphSnapshot & graph, const std::string & nodeId)
{
  std::vector<std::string> out;
  for (const auto & edge : graph.edges) {
    if (edge.source == nodeId) {
      out.push_back(edge.target);
    }
  }
  return out;
}

int connectionCount(
  const GraphSnapshot & graph,
  const std::string & nodeId,
  const ConnectionDirection direction)
{
  int count = 0;
  for (const auto & edge : graph.edges) {
    switch (direction) {
      case ConnectionDirection::Incoming:
        count += edge.target == nodeId ? 1 : 0;
        break;
      case ConnectionDirection::Outgoing:
        count += edge.source == nodeId ? 1 : 0;
        break;
      case ConnectionDirection::Any:
        count += (edge.source == nodeId || edge.target == nodeId) ? 1 : 0;
        break;
    }
  }
  return count;
}

bool hasDescendant(const GraphSnapshot & graph, const std::string & nodeId)
{
  std::unordered_map<std::string, std::vector<std::string>> adjacency;
  for (const auto & edge : graph.edges) {
    adjacency[edge.source].push_back(edge.target);
  }

  std::unordered_set<std::string> visited{nodeId};
  std::deque<std::string> queue{nodeId};
  while (!queue.empty()) {
    const auto current = queue.front();
    queue.pop_front();

    const auto it = adjacency.find(current);
    if (it == adjacency.end()) {
      continue;
    }
    for (const auto & next : it->second) {
      if (visited.insert(next).second) {
        queue.push_back(next);
      }
    }
  }
  return visited.size() > 1;
}

bool childrenComplete(
  const GraphSnapshot & graph,
  const std::string & parentId,
  const std::string & property,
  const YAML::Node & targetValue,
  const bool requireAll)
{
  const auto ids = childIds(graph, parentId);
  if (ids.empty()) {
    return false;
  }

  // Walk the node list rather than the id list so a node linked twice counts once and
  // dangling edges to deleted nodes are ignored.
  const auto expected = valueToString(targetValue);
  int children = 0;
  int matching = 0;
  for (const auto & node : graph.nodes) {
    if (std::find(ids.begin(), ids.end(), node.id) == ids.end()) {
      continue;
    }
    ++children;
    if (valueToString(nestedValue(node.data, property)) == expected) {
      ++matching;
    }
  }

  if (children == 0) {
    return false;
  }
  return requireAll ? matching == children : matching > 0;
}

}  // namespace automation_engine
