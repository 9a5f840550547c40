#include <automation_engine/graph_change_observer.hpp>

#include <automation_engine/graph_traversal.hpp>
#include <automation_engine/value_utils.hpp>
#include <automation_engine/workspace_codec.hpp>

#include <rclcpp/logging.hpp>

#include <set>
#include <stdexcept>
#include <utility>

namespace automation_engine
{
namespace
{

bool sameValue(const YAML::Node & a, const YAML::Node & b)
{
  if (!a.IsDefined() || !b.IsDefined()) {
    return a.IsDefined() == b.IsDefined();
  }
  if (a.Type() != b.Type()) {
    return false;
  }
  if (a.IsScalar()) {
    return a.Scalar() == b.Scalar();
  }
  return YAML::Dump(a) == YAML::Dump(b);
}

std::vector<std::string> dataKeys(const YAML::Node & data)
{
  std::vector<std::string> keys;
  if (!data.IsMap()) {
    return keys;
  }
  for (const auto & entry : data) {
    keys.push_back(entry.first.as<std::string>());
  }
  return keys;
}

std::optional<std::string> typeOf(const GraphNode * node)
{
  if (node == nullptr) {
    return std::nullopt;
  }
  return node->type;
}

}  // namespace

bool isIgnoredProperty(const std::string & key, const bool ruleNode)
{
  if (key == "updatedAt" || key == "lastAccessedAt" || key == "accessCount") {
    return true;
  }
  // Written back by the scheduler after every run.
  return ruleNode &&
         (key == "runCount" || key == "errorCount" || key == "lastRun" || key == "lastError");
}

GraphChangeObserver::GraphChangeObserver(
  ExecutionScheduler & scheduler,
  SpatialRegionStore & regions,
  const TimerService & clock,
  rclcpp::Logger logger)
: scheduler_(scheduler)
, regions_(regions)
, clock_(clock)
, logger_(logger)
{
}

void GraphChangeObserver::prime(const GraphSnapshot & snapshot)
{
  previous_.emplace(snapshot);
  refreshMembership();
}

void GraphChangeObserver::refreshMembership()
{
  if (!previous_) {
    return;
  }
  for (const auto & node : previous_->nodes) {
    regions_.checkNodePosition(node.id, nodeBox(node));
  }
}

std::vector<Event> GraphChangeObserver::onSnapshot(const GraphSnapshot & snapshot)
{
  std::vector<Event> out;
  if (!previous_) {
    prime(snapshot);
    return out;
  }
  // Move, then copy-construct: assigning GraphNodes would rebind the shared data
  // of the retained copy.
  const GraphSnapshot previous = std::move(*previous_);
  previous_.emplace(snapshot);

  // New nodes
  for (const auto & node : snapshot.nodes) {
    if (previous.findNode(node.id) != nullptr) {
      continue;
    }
    Event event;
    event.sourceNodeId = node.id;
    event.payload = NodeCreatedPayload{node.type};
    dispatch(std::move(event), out);

    if (isRuleNode(node)) {
      syncRuleNode(node);
    }
    // First sighting: membership is seeded silently.
    regions_.checkNodePosition(node.id, nodeBox(node));
  }

  // Property changes
  for (const auto & node : snapshot.nodes) {
    const GraphNode * before = previous.findNode(node.id);
    if (before == nullptr) {
      continue;
    }
    const bool ruleNode = isRuleNode(node);
    bool definitionChanged = before->type != node.type;

    std::vector<std::string> keys = dataKeys(node.data);
    for (const auto & key : dataKeys(before->data)) {
      if (!node.data[key]) {
        keys.push_back(key);
      }
    }

    for (const auto & key : keys) {
      const YAML::Node & oldData = before->data;
      const YAML::Node & newData = node.data;
      const YAML::Node oldValue = oldData[key] ? oldData[key] : undefinedValue();
      const YAML::Node newValue = newData[key] ? newData[key] : undefinedValue();
      if (sameValue(oldValue, newValue)) {
        continue;
      }
      if (isIgnoredProperty(key, ruleNode)) {
        continue;
      }
      definitionChanged = true;

      PropertyChangePayload payload;
      payload.property = key;
      payload.oldValue.reset(oldValue);
      payload.newValue.reset(newValue);
      payload.nodeType = node.type;

      Event event;
      event.sourceNodeId = node.id;
      event.payload = std::move(payload);
      dispatch(std::move(event), out);
    }

    if (definitionChanged) {
      if (ruleNode) {
        syncRuleNode(node);
      } else if (isRuleNode(*before)) {
        scheduler_.unregisterRule(node.id);
      }
    }
  }

  // Removed nodes
  for (const auto & node : previous.nodes) {
    if (snapshot.findNode(node.id) != nullptr) {
      continue;
    }
    scheduler_.unregisterRule(node.id);
    scheduler_.forgetNode(node.id);
    regions_.removeNode(node.id);
  }

  // Edges
  for (const auto & edge : snapshot.edges) {
    if (previous.findEdge(edge.id) != nullptr) {
      continue;
    }
    const GraphNode * source = snapshot.findNode(edge.source);
    const GraphNode * target = snapshot.findNode(edge.target);

    if (source != nullptr) {
      ConnectionMadePayload payload;
      payload.direction = ConnectionDirection::Outgoing;
      payload.connectedNodeId = edge.target;
      payload.connectedNodeType = typeOf(target);
      payload.connectionCount = connectionCount(snapshot, edge.source, ConnectionDirection::Any);
      Event event;
      event.sourceNodeId = edge.source;
      event.payload = std::move(payload);
      dispatch(std::move(event), out);
    }
    if (target != nullptr) {
      ConnectionMadePayload payload;
      payload.direction = ConnectionDirection::Incoming;
      payload.connectedNodeId = edge.source;
      payload.connectedNodeType = typeOf(source);
      payload.connectionCount = connectionCount(snapshot, edge.target, ConnectionDirection::Any);
      Event event;
      event.sourceNodeId = edge.target;
      event.payload = std::move(payload);
      dispatch(std::move(event), out);
    }
  }

  for (const auto & edge : previous.edges) {
    if (snapshot.findEdge(edge.id) != nullptr) {
      continue;
    }
    std::set<std::string> endpoints{edge.source, edge.target};
    for (const auto & endpoint : {edge.source, edge.target}) {
      // Deleted endpoints and the second end of a self-loop get no event.
      if (snapshot.findNode(endpoint) == nullptr || endpoints.erase(endpoint) == 0) {
        continue;
      }
      Event event;
      event.sourceNodeId = endpoint;
      event.payload = ConnectionRemovedPayload{
        connectionCount(snapshot, endpoint, ConnectionDirection::Any)};
      dispatch(std::move(event), out);
    }
  }

  // Positions
  for (const auto & node : snapshot.nodes) {
    const GraphNode * before = previous.findNode(node.id);
    if (before == nullptr) {
      continue;
    }
    const Rect box = nodeBox(node);
    const Rect oldBox = nodeBox(*before);
    if (box.x == oldBox.x && box.y == oldBox.y &&
      box.width == oldBox.width && box.height == oldBox.height)
    {
      continue;
    }

    const MembershipDelta delta = regions_.checkNodePosition(node.id, box);

    NodePositionChangePayload moved;
    moved.nodeType = node.type;
    moved.previousBox = oldBox;
    Event event;
    event.sourceNodeId = node.id;
    event.payload = moved;
    dispatch(event, out);

    for (const auto & regionId : delta.entered) {
      NodePositionChangePayload payload;
      payload.enteredRegion = regionId;
      payload.nodeType = node.type;
      payload.previousBox = oldBox;
      event.payload = std::move(payload);
      dispatch(event, out);
    }
    for (const auto & regionId : delta.exited) {
      NodePositionChangePayload payload;
      payload.exitedRegion = regionId;
      payload.nodeType = node.type;
      payload.previousBox = oldBox;
      event.payload = std::move(payload);
      dispatch(event, out);
    }
  }

  return out;
}

void GraphChangeObserver::syncRuleNode(const GraphNode & node)
{
  try {
    scheduler_.registerRule(decodeRule(node.id, node.data));
  } catch (const YAML::Exception & e) {
    RCLCPP_WARN(logger_, "Rule node '%s' is malformed, unregistering: %s",
      node.id.c_str(), e.what());
    scheduler_.unregisterRule(node.id);
  } catch (const std::runtime_error & e) {
    RCLCPP_WARN(logger_, "Rule node '%s' is malformed, unregistering: %s",
      node.id.c_str(), e.what());
    scheduler_.unregisterRule(node.id);
  }
}

void GraphChangeObserver::dispatch(Event event, std::vector<Event> & out)
{
  event.timestampMs = clock_.nowMs();
  // One bad event must not abort the rest of the diff; previous_ is already replaced.
  try {
    scheduler_.handleEvent(event);
  } catch (const std::exception & e) {
    RCLCPP_ERROR(logger_, "Dispatching %s event from '%s' failed: %s",
      toString(event.type()), event.sourceNodeId.c_str(), e.what());
  }
  out.push_back(std::move(event));
}

}  // namespace automation_engine
