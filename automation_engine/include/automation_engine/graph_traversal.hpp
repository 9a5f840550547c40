#pragma once

#include <automation_engine/event_types.hpp>
#include <automation_engine/graph_types.hpp>

#include <yaml-cpp/yaml.h>

#include <string>
#include <vector>

namespace automation_engine
{

/// Targets of every outgoing edge of `nodeId`, in edge order (duplicates kept).
std::vector<std::string> childIds(const GraphSnapshot & graph, const std::string & nodeId);

/**
 * @brief Number of edges touching `nodeId`.
 *
 * Incoming counts edges targeting the node, Outgoing edges leaving it, Any both.
 */
int connectionCount(
  const GraphSnapshot & graph, const std::string & nodeId, ConnectionDirection direction);

/**
 * @brief True when at least one node other than `nodeId` is reachable along outgoing edges.
 *
 * Breadth-first; nodes are marked visited before expansion, so cycles terminate.
 */
bool hasDescendant(const GraphSnapshot & graph, const std::string & nodeId);

/**
 * @brief Checks a property across the direct children of `parentId`.
 *
 * Values compare by string form. With no children the result is false regardless of
 * `requireAll`.
 */
bool childrenComplete(
  const GraphSnapshot & graph,
  const std::string & parentId,
  const std::string & property,
  const YAML::Node & targetValue,
  bool requireAll);

}  // namespace automation_engine
