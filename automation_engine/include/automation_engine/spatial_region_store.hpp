#pragma once

#include <automation_engine/geometry.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace automation_engine
{

/// Padding kept between a grown region's edge and the node that caused the growth.
constexpr double kRegionGrowPadding = 20.0;

struct SpatialRegion
{
  std::string id;
  std::string name;
  Rect bounds;
  /// Visual grouping only; membership is tracked the same way as for other regions.
  bool isDistrict{false};
  std::vector<std::string> linkedActionIds;
  std::optional<int> presentationOrder;
};

/// Partial update; unset fields are left untouched.
struct RegionUpdate
{
  std::optional<std::string> name;
  std::optional<Rect> bounds;
  std::optional<bool> isDistrict;
  std::optional<std::vector<std::string>> linkedActionIds;
  std::optional<int> presentationOrder;
};

struct MembershipDelta
{
  std::vector<std::string> entered;
  std::vector<std::string> exited;

  bool empty() const { return entered.empty() && exited.empty(); }
};

/**
 * @class SpatialRegionStore
 * @brief Owns the named regions and the derived node -> region membership table.
 *
 * Membership is recomputed incrementally from position updates and must always equal
 * "regions whose bounds overlap the node's last reported box". The store is not
 * thread-safe; the engine drives it from one thread of control.
 */
class SpatialRegionStore
{
public:
  /// Adds a region built from `definition` (its id is ignored) and returns the new id.
  std::string addRegion(const SpatialRegion & definition);

  bool updateRegion(const std::string & regionId, const RegionUpdate & update);

  /// Removes the region and purges it from every node's membership.
  bool deleteRegion(const std::string & regionId);

  /**
   * @brief Diffs the node's current overlap set against its stored membership.
   *
   * The stored membership is only rewritten when something entered or exited, so a
   * repeated call with the same box is a no-op returning an empty delta.
   */
  MembershipDelta checkNodePosition(const std::string & nodeId, const Rect & nodeBox);

  /**
   * @brief Grows a region so the node box plus padding fits inside it. Never shrinks.
   *
   * @return true when the bounds changed.
   */
  bool autoGrowRegion(const std::string & regionId, const Rect & nodeBox);

  /// Replaces every region and resets membership.
  void loadRegions(std::vector<SpatialRegion> regions);

  /// Drops the membership entry of a node that left the graph.
  void removeNode(const std::string & nodeId);

  const std::vector<SpatialRegion> & regions() const { return regions_; }
  const SpatialRegion * findRegion(const std::string & regionId) const;
  std::vector<SpatialRegion> regionsForRule(const std::string & ruleId) const;

  std::vector<std::string> membership(const std::string & nodeId) const;
  int memberCount(const std::string & regionId) const;

private:
  SpatialRegion * findMutable(const std::string & regionId);
  std::string nextRegionId();

  std::vector<SpatialRegion> regions_;
  std::unordered_map<std::string, std::vector<std::string>> membership_;
  uint64_t nextId_{1};
};

}  // namespace automation_engine
