#pragma once

#include <automation_engine/geometry.hpp>

#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>
#include <vector>

namespace automation_engine
{

/// Node type that carries an automation rule in its data.
constexpr char kRuleNodeType[] = "action";

struct GraphNode
{
  std::string id;
  std::string type;
  Point position;
  std::optional<double> width;
  std::optional<double> height;
  std::optional<double> measuredWidth;
  std::optional<double> measuredHeight;
  // Free-form node properties. yaml-cpp nodes share storage on copy and assignment
  // writes through to that storage; use YAML::Clone() and reset() instead.
  YAML::Node data{YAML::NodeType::Map};
};

struct GraphEdge
{
  std::string id;
  std::string source;
  std::string target;
};

/**
 * @struct GraphSnapshot
 * @brief Read-only view of the graph handed to matching, evaluation and execution.
 */
struct GraphSnapshot
{
  std::vector<GraphNode> nodes;
  std::vector<GraphEdge> edges;

  const GraphNode * findNode(const std::string & id) const;
  const GraphEdge * findEdge(const std::string & id) const;
};

/**
 * @brief Node bounding box. Size falls back from the explicit size to the measured size
 * to the default size; zero counts as unset.
 */
Rect nodeBox(const GraphNode & node);

}  // namespace automation_engine
