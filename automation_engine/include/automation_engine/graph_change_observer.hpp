#pragma once

#include <automation_engine/event_types.hpp>
#include <automation_engine/execution_scheduler.hpp>
#include <automation_engine/graph_types.hpp>
#include <automation_engine/spatial_region_store.hpp>
#include <automation_engine/timer_service.hpp>

#include <rclcpp/logger.hpp>

#include <optional>
#include <string>
#include <vector>

namespace automation_engine
{

/**
 * @class GraphChangeObserver
 * @brief Derives events from successive graph snapshots and hands them to the scheduler.
 *
 * Per snapshot, in order: node-created for new nodes, property-change per changed data
 * key, rule (un)registration for rule nodes, cleanup for removed nodes, connection
 * events for added and removed edges, then position events. Region membership is
 * updated before any position event is delivered.
 */
class GraphChangeObserver
{
public:
  GraphChangeObserver(
    ExecutionScheduler & scheduler,
    SpatialRegionStore & regions,
    const TimerService & clock,
    rclcpp::Logger logger);

  /// Adopts `snapshot` as the baseline and seeds region membership without emitting.
  void prime(const GraphSnapshot & snapshot);

  /// Diffs against the previous snapshot, dispatches the events and returns them.
  std::vector<Event> onSnapshot(const GraphSnapshot & snapshot);

  /// Recomputes every node's membership, e.g. after the region set was replaced.
  void refreshMembership();

  bool primed() const { return previous_.has_value(); }

private:
  void syncRuleNode(const GraphNode & node);
  void dispatch(Event event, std::vector<Event> & out);

  ExecutionScheduler & scheduler_;
  SpatialRegionStore & regions_;
  const TimerService & clock_;
  rclcpp::Logger logger_;

  std::optional<GraphSnapshot> previous_;
};

/// Keys never reported as property changes.
bool isIgnoredProperty(const std::string & key, bool ruleNode);

}  // namespace automation_engine
