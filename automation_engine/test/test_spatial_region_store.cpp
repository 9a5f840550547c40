/**
 * @file test_spatial_region_store.cpp
 * @brief Unit tests for region bookkeeping, membership diffs and auto-grow.
 *
 * The store is pure geometry plus a membership table, so everything here runs without ROS.
 */

#include <gtest/gtest.h>

#include <automation_engine/spatial_region_store.hpp>

#include <string>

namespace
{

automation_engine::SpatialRegion region(double x, double y, double w, double h)
{
  automation_engine::SpatialRegion r;
  r.name = "zone";
  r.bounds = automation_engine::Rect{x, y, w, h};
  return r;
}

}  // namespace

TEST(SpatialRegionStoreTest, AddRegionAssignsFreshIds)
{
  automation_engine::SpatialRegionStore store;
  const auto a = store.addRegion(region(0, 0, 100, 100));
  const auto b = store.addRegion(region(200, 0, 100, 100));

  EXPECT_NE(a, b);
  ASSERT_NE(store.findRegion(a), nullptr);
  EXPECT_EQ(store.findRegion(a)->name, "zone");
  EXPECT_EQ(store.regions().size(), 2u);
}

// The example from the design notes: a node poking out of the right edge grows only that
// edge, to exactly the padded node edge.
TEST(SpatialRegionStoreTest, AutoGrowMovesOnlyTheExceededEdge)
{
  automation_engine::SpatialRegionStore store;
  const auto id = store.addRegion(region(100, 100, 400, 300));

  EXPECT_TRUE(store.autoGrowRegion(id, automation_engine::Rect{400, 200, 150, 100}));

  const auto & bounds = store.findRegion(id)->bounds;
  EXPECT_DOUBLE_EQ(bounds.x, 100.0);
  EXPECT_DOUBLE_EQ(bounds.y, 100.0);
  EXPECT_DOUBLE_EQ(bounds.right(), 570.0);
  EXPECT_DOUBLE_EQ(bounds.bottom(), 400.0);
}

TEST(SpatialRegionStoreTest, AutoGrowLeftKeepsRightEdge)
{
  automation_engine::SpatialRegionStore store;
  const auto id = store.addRegion(region(100, 100, 400, 300));

  EXPECT_TRUE(store.autoGrowRegion(id, automation_engine::Rect{50, 150, 100, 100}));

  const auto & bounds = store.findRegion(id)->bounds;
  EXPECT_DOUBLE_EQ(bounds.x, 30.0);
  EXPECT_DOUBLE_EQ(bounds.right(), 500.0);
  EXPECT_DOUBLE_EQ(bounds.y, 100.0);
  EXPECT_DOUBLE_EQ(bounds.bottom(), 400.0);
}

TEST(SpatialRegionStoreTest, AutoGrowTopAndBottom)
{
  automation_engine::SpatialRegionStore store;
  const auto id = store.addRegion(region(0, 100, 400, 100));

  EXPECT_TRUE(store.autoGrowRegion(id, automation_engine::Rect{100, 90, 50, 200}));

  const auto & bounds = store.findRegion(id)->bounds;
  EXPECT_DOUBLE_EQ(bounds.y, 70.0);
  EXPECT_DOUBLE_EQ(bounds.bottom(), 310.0);
  EXPECT_DOUBLE_EQ(bounds.x, 0.0);
  EXPECT_DOUBLE_EQ(bounds.width, 400.0);
}

// A padded box that already fits must leave the bounds bit-for-bit identical.
TEST(SpatialRegionStoreTest, AutoGrowIsNoOpWhenPaddedBoxFits)
{
  automation_engine::SpatialRegionStore store;
  const auto id = store.addRegion(region(100.25, 100.5, 400.125, 300.75));
  const auto before = store.findRegion(id)->bounds;

  EXPECT_FALSE(store.autoGrowRegion(id, automation_engine::Rect{120.25, 120.5, 360.125, 260.75}));

  const auto & after = store.findRegion(id)->bounds;
  EXPECT_EQ(after.x, before.x);
  EXPECT_EQ(after.y, before.y);
  EXPECT_EQ(after.width, before.width);
  EXPECT_EQ(after.height, before.height);
}

TEST(SpatialRegionStoreTest, AutoGrowUnknownRegionReturnsFalse)
{
  automation_engine::SpatialRegionStore store;
  EXPECT_FALSE(store.autoGrowRegion("missing", automation_engine::Rect{0, 0, 10, 10}));
}

TEST(SpatialRegionStoreTest, CheckNodePositionReportsEnterThenNothing)
{
  automation_engine::SpatialRegionStore store;
  const auto id = store.addRegion(region(0, 0, 500, 500));
  const automation_engine::Rect box{100, 100, 280, 140};

  const auto first = store.checkNodePosition("n1", box);
  ASSERT_EQ(first.entered.size(), 1u);
  EXPECT_EQ(first.entered[0], id);
  EXPECT_TRUE(first.exited.empty());

  const auto second = store.checkNodePosition("n1", box);
  EXPECT_TRUE(second.empty());
  EXPECT_EQ(store.membership("n1"), std::vector<std::string>{id});
}

TEST(SpatialRegionStoreTest, CheckNodePositionReportsExit)
{
  automation_engine::SpatialRegionStore store;
  const auto id = store.addRegion(region(0, 0, 500, 500));
  store.checkNodePosition("n1", automation_engine::Rect{100, 100, 100, 100});

  const auto delta = store.checkNodePosition("n1", automation_engine::Rect{900, 900, 100, 100});
  ASSERT_EQ(delta.exited.size(), 1u);
  EXPECT_EQ(delta.exited[0], id);
  EXPECT_TRUE(store.membership("n1").empty());
  EXPECT_EQ(store.memberCount(id), 0);
}

// Sharing an edge is not overlap.
TEST(SpatialRegionStoreTest, TouchingEdgeIsNotMembership)
{
  automation_engine::SpatialRegionStore store;
  store.addRegion(region(0, 0, 100, 100));

  const auto delta = store.checkNodePosition("n1", automation_engine::Rect{100, 0, 50, 50});
  EXPECT_TRUE(delta.empty());
}

TEST(SpatialRegionStoreTest, DistrictsParticipateInMembership)
{
  automation_engine::SpatialRegionStore store;
  auto district = region(0, 0, 1000, 1000);
  district.isDistrict = true;
  const auto districtId = store.addRegion(district);
  const auto innerId = store.addRegion(region(100, 100, 200, 200));

  const auto delta = store.checkNodePosition("n1", automation_engine::Rect{150, 150, 50, 50});
  EXPECT_EQ(delta.entered, (std::vector<std::string>{districtId, innerId}));
  EXPECT_EQ(store.memberCount(districtId), 1);
}

TEST(SpatialRegionStoreTest, DeleteRegionPurgesMembership)
{
  automation_engine::SpatialRegionStore store;
  const auto id = store.addRegion(region(0, 0, 500, 500));
  store.checkNodePosition("n1", automation_engine::Rect{10, 10, 10, 10});

  EXPECT_TRUE(store.deleteRegion(id));
  EXPECT_FALSE(store.deleteRegion(id));
  EXPECT_TRUE(store.membership("n1").empty());
  EXPECT_EQ(store.findRegion(id), nullptr);
}

TEST(SpatialRegionStoreTest, UpdateRegionAppliesOnlySetFields)
{
  automation_engine::SpatialRegionStore store;
  const auto id = store.addRegion(region(0, 0, 100, 100));

  automation_engine::RegionUpdate update;
  update.name = "renamed";
  update.linkedActionIds = std::vector<std::string>{"rule-1"};
  EXPECT_TRUE(store.updateRegion(id, update));
  EXPECT_FALSE(store.updateRegion("missing", update));

  const auto * r = store.findRegion(id);
  EXPECT_EQ(r->name, "renamed");
  EXPECT_DOUBLE_EQ(r->bounds.width, 100.0);
  ASSERT_EQ(store.regionsForRule("rule-1").size(), 1u);
  EXPECT_TRUE(store.regionsForRule("rule-2").empty());
}

TEST(SpatialRegionStoreTest, LoadRegionsResetsMembership)
{
  automation_engine::SpatialRegionStore store;
  const auto id = store.addRegion(region(0, 0, 500, 500));
  store.checkNodePosition("n1", automation_engine::Rect{10, 10, 10, 10});

  auto loaded = region(0, 0, 500, 500);
  loaded.id = "persisted";
  store.loadRegions({loaded});

  EXPECT_EQ(store.findRegion(id), nullptr);
  EXPECT_TRUE(store.membership("n1").empty());

  // The same box now "enters" the reloaded region.
  const auto delta = store.checkNodePosition("n1", automation_engine::Rect{10, 10, 10, 10});
  EXPECT_EQ(delta.entered, std::vector<std::string>{"persisted"});

  // New ids never collide with loaded ones.
  EXPECT_NE(store.addRegion(region(0, 0, 1, 1)), "persisted");
}
