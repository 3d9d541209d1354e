#include <gtest/gtest.h>

#include <algorithm>
#include <set>

#include "cellroute/cell_id.h"

using namespace cellroute;

TEST(CellId, SameInputSameCell) {
  for (int level : {0, 5, 13, 30}) {
    EXPECT_EQ(cellFromLatLng(48.8566, 2.3522, level), cellFromLatLng(48.8566, 2.3522, level));
    EXPECT_EQ(cellLevel(cellFromLatLng(48.8566, 2.3522, level)), level);
    EXPECT_TRUE(cellIsValid(cellFromLatLng(-33.86, 151.21, level)));
  }
}

TEST(CellId, EveryFaceIsReachable) {
  std::set<int> faces;
  const LatLng samples[] = {{0, 0}, {0, 90}, {89, 0}, {0, 180}, {0, -90}, {-89, 0}};
  for (const auto& p : samples) faces.insert(cellFace(cellFromLatLng(p, 0)));
  EXPECT_EQ(faces.size(), 6u);
}

TEST(CellId, ChildrenHaveParentAndAreDistinct) {
  const CellId c = cellFromLatLng(40.7128, -74.0060, 10);
  const auto kids = cellChildren(c);
  std::set<CellId> unique(kids.begin(), kids.end());
  EXPECT_EQ(unique.size(), 4u);
  for (CellId k : kids) {
    EXPECT_EQ(cellLevel(k), 11);
    EXPECT_EQ(cellParent(k), c);
    EXPECT_TRUE(cellContains(c, k));
    EXPECT_FALSE(cellContains(k, c));
  }
  EXPECT_FALSE(cellContains(kids[0], kids[1]));
}

TEST(CellId, FineCellLiesInsideItsAncestors) {
  const CellId leaf = cellFromLatLng(35.6762, 139.6503, 30);
  for (int level = 0; level < 30; ++level) {
    const CellId a = cellParentAt(leaf, level);
    EXPECT_EQ(cellLevel(a), level);
    EXPECT_TRUE(cellContains(a, leaf));
    EXPECT_EQ(a, cellFromLatLng(35.6762, 139.6503, level));
  }
}

TEST(CellId, DenseIndexIsABijection) {
  for (int level : {0, 1, 3}) {
    const uint64_t n = cellCountAtLevel(level);
    EXPECT_EQ(n, 6ull << (2 * level));
    for (uint64_t i = 0; i < n; ++i) {
      const CellId c = cellFromDenseIndex(level, i);
      ASSERT_TRUE(cellIsValid(c));
      ASSERT_EQ(cellLevel(c), level);
      ASSERT_EQ(cellDenseIndex(c), i);
    }
  }
  const CellId c = cellFromLatLng(51.5, -0.12, 5);
  EXPECT_EQ(cellFromDenseIndex(5, cellDenseIndex(c)), c);
}

TEST(CellId, DenseIndexFollowsIdOrder) {
  const uint64_t n = cellCountAtLevel(2);
  for (uint64_t i = 1; i < n; ++i) {
    EXPECT_LT(cellFromDenseIndex(2, i - 1), cellFromDenseIndex(2, i));
  }
}

TEST(CellId, RingZeroIsTheCellItself) {
  const CellId c = cellFromLatLng(48.85, 2.35, 13);
  const auto ring = cellRing(c, 0);
  ASSERT_EQ(ring.size(), 1u);
  EXPECT_EQ(ring[0], c);
}

TEST(CellId, RingsInsideAFaceHaveSquareSizes) {
  const CellId c = cellFromLatLng(48.85, 2.35, 13);
  for (int k = 1; k <= 3; ++k) {
    const auto ring = cellRing(c, k);
    EXPECT_EQ(ring.size(), static_cast<size_t>(8 * k)) << "k=" << k;
    for (CellId r : ring) {
      EXPECT_EQ(cellLevel(r), 13);
      EXPECT_NE(r, c);
    }
  }
}

TEST(CellId, RingNeighboursAreNearby) {
  const CellId c = cellFromLatLng(48.85, 2.35, 13);
  const LatLng cc = cellCenter(c);
  for (CellId r : cellRing(c, 1)) {
    const LatLng rc = cellCenter(r);
    EXPECT_LT(std::abs(rc.lat - cc.lat), 0.05);
    EXPECT_LT(std::abs(rc.lng - cc.lng), 0.05);
  }
}

TEST(CellId, RingWrapsAcrossFaces) {
  // Face 0 spans longitudes -45..45 at the equator; this cell touches its east edge.
  const CellId c = cellFromLatLng(0.0, 44.99, 6);
  const auto ring = cellRing(c, 1);
  EXPECT_GE(ring.size(), 7u);
  const bool otherFace = std::any_of(ring.begin(), ring.end(),
                                     [&](CellId r) { return cellFace(r) != cellFace(c); });
  EXPECT_TRUE(otherFace);
  for (CellId r : ring) EXPECT_EQ(cellLevel(r), 6);
}

TEST(CellId, CenterMapsBackToSameCell) {
  const CellId c = cellFromLatLng(-22.9, -43.2, 12);
  EXPECT_EQ(cellFromLatLng(cellCenter(c), 12), c);
}
