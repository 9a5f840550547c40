#pragma once

#include <automation_engine/geometry.hpp>

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace automation_engine
{

enum class ConnectionDirection : uint8_t
{
  Any,
  Incoming,
  Outgoing
};

/**
 * @enum EventType
 * @brief Event kinds, in the same order as the EventPayload alternatives.
 */
enum class EventType : uint8_t
{
  PropertyChange,
  NodeCreated,
  ConnectionMade,
  ConnectionRemoved,
  NodePositionChange,
  Manual,
  ScheduleTick
};

struct PropertyChangePayload
{
  std::string property;
  YAML::Node oldValue{YAML::NodeType::Undefined};
  YAML::Node newValue{YAML::NodeType::Undefined};
  std::optional<std::string> nodeType;
};

struct NodeCreatedPayload
{
  std::optional<std::string> nodeType;
};

struct ConnectionMadePayload
{
  /// Direction of the new edge as seen from the event's source node.
  ConnectionDirection direction{ConnectionDirection::Any};
  std::string connectedNodeId;
  std::optional<std::string> connectedNodeType;
  int connectionCount{0};
};

struct ConnectionRemovedPayload
{
  /// Edges still touching the node after the removal.
  int connectionCount{0};
};

struct NodePositionChangePayload
{
  std::optional<std::string> enteredRegion;
  std::optional<std::string> exitedRegion;
  std::optional<std::string> nodeType;
  /// Box the node occupied before the move, when the producer knows it.
  std::optional<Rect> previousBox;
};

struct ManualPayload
{
};

struct ScheduleTickPayload
{
};

using EventPayload = std::variant<
  PropertyChangePayload,
  NodeCreatedPayload,
  ConnectionMadePayload,
  ConnectionRemovedPayload,
  NodePositionChangePayload,
  ManualPayload,
  ScheduleTickPayload>;

/**
 * @struct Event
 * @brief One graph mutation (or tick / manual invocation) offered to the rule set.
 *
 * Events are ephemeral: produced by the graph change observer or the host, consumed by
 * the scheduler, never persisted.
 */
struct Event
{
  std::string sourceNodeId;
  int64_t timestampMs{0};
  EventPayload payload;

  EventType type() const { return static_cast<EventType>(payload.index()); }

  template<typename T>
  const T * as() const { return std::get_if<T>(&payload); }
};

const char * toString(EventType type);
const char * toString(ConnectionDirection direction);

}  // namespace automation_engine
