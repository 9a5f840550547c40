#include <automation_engine/spatial_region_store.hpp>

#include <algorithm>

namespace automation_engine
{
namespace
{

bool contains(const std::vector<std::string> & ids, const std::string & id)
{
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

}  // namespace

std::string SpatialRegionStore::addRegion(const SpatialRegion & definition)
{
  SpatialRegion region = definition;
  region.id = nextRegionId();
  regions_.push_back(region);
  return region.id;
}

bool SpatialRegionStore::updateRegion(const std::string & regionId, const RegionUpdate & update)
{
  auto * region = findMutable(regionId);
  if (region == nullptr) {
    return false;
  }
  if (update.name) {
    region->name = *update.name;
  }
  if (update.bounds) {
    region->bounds = *update.bounds;
  }
  if (update.isDistrict) {
    region->isDistrict = *update.isDistrict;
  }
  if (update.linkedActionIds) {
    region->linkedActionIds = *update.linkedActionIds;
  }
  if (update.presentationOrder) {
    region->presentationOrder = update.presentationOrder;
  }
  return true;
}

bool SpatialRegionStore::deleteRegion(const std::string & regionId)
{
  const auto it = std::find_if(
    regions_.begin(), regions_.end(),
    [&regionId](const SpatialRegion & r) {return r.id == regionId;});
  if (it == regions_.end()) {
    return false;
  }
  regions_.erase(it);

  for (auto & entry : membership_) {
    auto & ids = entry.second;
    ids.erase(std::remove(ids.begin(), ids.end(), regionId), ids.end());
  }
  return true;
}

MembershipDelta SpatialRegionStore::checkNodePosition(
  const std::string & nodeId,
  const Rect & nodeBox)
{
  MembershipDelta delta;
  static const std::vector<std::string> kEmpty;
  const auto found = membership_.find(nodeId);
  const auto & current = found == membership_.end() ? kEmpty : found->second;

  std::vector<std::string> next;
  for (const auto & region : regions_) {
    if (rectsOverlap(nodeBox, region.bounds)) {
      next.push_back(region.id);
      if (!contains(current, region.id)) {
        delta.entered.push_back(region.id);
      }
    } else if (contains(current, region.id)) {
      delta.exited.push_back(region.id);
    }
  }

  if (!delta.empty()) {
    membership_[nodeId] = std::move(next);
  }
  return delta;
}

bool SpatialRegionStore::autoGrowRegion(const std::string & regionId, const Rect & nodeBox)
{
  auto * region = findMutable(regionId);
  if (region == nullptr) {
    return false;
  }

  const double left = nodeBox.x - kRegionGrowPadding;
  const double top = nodeBox.y - kRegionGrowPadding;
  const double right = nodeBox.right() + kRegionGrowPadding;
  const double bottom = nodeBox.bottom() + kRegionGrowPadding;

  auto & bounds = region->bounds;
  bool grown = false;

  // Left and top move the origin; width/height absorb the shift so the far edge stays put.
  if (left < bounds.x) {
    bounds.width += bounds.x - left;
    bounds.x = left;
    grown = true;
  }
  if (top < bounds.y) {
    bounds.height += bounds.y - top;
    bounds.y = top;
    grown = true;
  }
  if (right > bounds.right()) {
    bounds.width = right - bounds.x;
    grown = true;
  }
  if (bottom > bounds.bottom()) {
    bounds.height = bottom - bounds.y;
    grown = true;
  }
  return grown;
}

void SpatialRegionStore::loadRegions(std::vector<SpatialRegion> regions)
{
  regions_ = std::move(regions);
  membership_.clear();
}

void SpatialRegionStore::removeNode(const std::string & nodeId)
{
  membership_.erase(nodeId);
}

const SpatialRegion * SpatialRegionStore::findRegion(const std::string & regionId) const
{
  const auto it = std::find_if(
    regions_.begin(), regions_.end(),
    [&regionId](const SpatialRegion & r) {return r.id == regionId;});
  return it == regions_.end() ? nullptr : &*it;
}

std::vector<SpatialRegion> SpatialRegionStore::regionsForRule(const std::string & ruleId) const
{
  std::vector<SpatialRegion> out;
  for (const auto & region : regions_) {
    if (contains(region.linkedActionIds, ruleId)) {
      out.push_back(region);
    }
  }
  return out;
}

std::vector<std::string> SpatialRegionStore::membership(const std::string & nodeId) const
{
  const auto it = membership_.find(nodeId);
  return it == membership_.end() ? std::vector<std::string>{} : it->second;
}

int SpatialRegionStore::memberCount(const std::string & regionId) const
{
  int count = 0;
  for (const auto & entry : membership_) {
    if (contains(entry.second, regionId)) {
      ++count;
    }
  }
  return count;
}

SpatialRegion * SpatialRegionStore::findMutable(const std::string & regionId)
{
  const auto it = std::find_if(
    regions_.begin(), regions_.end(),
    [&regionId](const SpatialRegion & r) {return r.id == regionId;});
  return it == regions_.end() ? nullptr : &*it;
}

std::string SpatialRegionStore::nextRegionId()
{
  // Loaded regions keep their own ids; skip any generated id that is already taken.
  std::string id;
  do {
    id = "region-" + std::to_string(nextId_++);
  } while (findRegion(id) != nullptr);
  return id;
}

}  // namespace automation_engine
