#include <automation_engine/graph_types.hpp>

#include <algorithm>

namespace automation_engine
{
namespace
{

double pickSize(
  const std::optional<double> & explicitSize,
  const std::optional<double> & measuredSize,
  const double fallback)
{
  if (explicitSize.has_value() && *explicitSize != 0.0) {
    return *explicitSize;
  }
  if (measuredSize.has_value() && *measuredSize != 0.0) {
    return *measuredSize;
  }
  return fallback;
}

}  // namespace

const GraphNode * GraphSnapshot::findNode(const std::string & id) const
{
  const auto it = std::find_if(
    nodes.begin(), nodes.end(), [&id](const GraphNode & n) {return n.id == id;});
  return it == nodes.end() ? nullptr : &*it;
}

const GraphEdge * GraphSnapshot::findEdge(const std::string & id) const
{
  const auto it = std::find_if(
    edges.begin(), edges.end(), [&id](const GraphEdge & e) {return e.id == id;});
  return it == edges.end() ? nullptr : &*it;
}

Rect nodeBox(const GraphNode & node)
{
  Rect box;
  box.x = node.position.x;
  box.y = node.position.y;
  box.width = pickSize(node.width, node.measuredWidth, kDefaultNodeWidth);
  box.height = pickSize(node.height, node.measuredHeight, kDefaultNodeHeight);
  return box;
}

}  // namespace automation_engine
