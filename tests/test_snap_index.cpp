#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <memory>

#include "cellroute/geo.h"
#include "cellroute/snap_index.h"
#include "graph_builder.h"
#include "test_graphs.h"

using namespace cellroute;
using namespace cellroute::fixtures;

namespace {

struct Built {
  std::shared_ptr<const GraphStore> graph;
  std::shared_ptr<const SnapBuckets> buckets;
};

Built publishOutput(BuildOutput out) {
  Built b;
  b.graph = std::make_shared<const GraphStore>(std::move(out.graph));
  b.buckets = std::make_shared<const SnapBuckets>(std::move(out.buckets));
  return b;
}

bool inRing(CellId center, int k, CellId c) {
  const std::vector<CellId> ring = cellRing(center, k);
  return std::find(ring.begin(), ring.end(), c) != ring.end();
}

// First point stepping from `from` whose fine cell lies in ring k of `home`.
LatLng walkUntilRing(LatLng from, double dlat, double dlng, CellId home, int k) {
  const std::vector<CellId> ring = cellRing(home, k);
  LatLng p = from;
  for (int step = 0; step < 200000; ++step) {
    p = LatLng{p.lat + dlat, p.lng + dlng};
    if (std::find(ring.begin(), ring.end(), cellFromLatLng(p, 13)) != ring.end()) return p;
  }
  return from;
}

double bruteForceNearest(const GraphStore& g, const LatLng& p) {
  double best = HUGE_VAL;
  for (uint32_t e = 0; e < g.edgeCount(); ++e) best = std::min(best, geo::pointToPolylineMeters(p, g.edgePoints(e)));
  return best;
}

} // namespace

TEST(SnapIndex, PointOnVertexSnapsToItsEdge) {
  Built b = publishOutput(buildParisGrid());
  SnapIndex index(b.graph, b.buckets);
  EXPECT_EQ(index.snap(48.8600, 2.3425), 0u);  // interior vertex of E0
  EXPECT_EQ(index.snap(48.8550, 2.3450), 4u);  // interior vertex of E4
  EXPECT_EQ(index.snap(48.8575, 2.3500), 3u);  // midway along E3
}

TEST(SnapIndex, NearbyPointPicksClosestEdge) {
  Built b = publishOutput(buildParisGrid());
  SnapIndex index(b.graph, b.buckets);
  EXPECT_EQ(index.snap(48.8599, 2.3475), 1u);
  EXPECT_EQ(index.snap(48.8560, 2.3401), 2u);

  auto hit = index.snapWithDistance(48.8599, 2.3475);
  ASSERT_TRUE(hit.has_value());
  EXPECT_NEAR(hit->distance_m, 11.1, 0.5);
}

TEST(SnapIndex, CandidatesAreSortedAndUnique) {
  Built b = publishOutput(buildParisGrid());
  SnapIndex index(b.graph, b.buckets);
  const auto c = index.candidates(48.8575, 2.3450);
  ASSERT_FALSE(c.empty());
  EXPECT_TRUE(std::is_sorted(c.begin(), c.end()));
  EXPECT_EQ(std::adjacent_find(c.begin(), c.end()), c.end());
}

TEST(SnapIndex, FarAwayPointMisses) {
  Built b = publishOutput(buildParisGrid());
  SnapIndex index(b.graph, b.buckets);
  EXPECT_FALSE(index.snap(-33.8688, 151.2093).has_value());
  EXPECT_TRUE(index.candidates(-33.8688, 151.2093).empty());
}

TEST(SnapIndex, OuterRingFallbackFindsDistantEdge) {
  Built b = publishOutput(buildParisGrid());
  SnapIndex index(b.graph, b.buckets);
  // ~10 km north of the grid: beyond two fine rings at level 13
  const auto hit = index.snapWithDistance(48.95, 2.345);
  ASSERT_TRUE(hit.has_value());
  EXPECT_TRUE(hit->edge == 0 || hit->edge == 1);
  EXPECT_GT(hit->distance_m, 9000.0);
}

TEST(SnapIndex, TiesGoToSmallestEdgeIndex) {
  GraphBuilder builder;
  builder.addWay(way(1, {pt(30.0, 30.0), pt(30.0, 30.001)}));
  builder.addWay(way(2, {pt(30.0, 30.0), pt(30.0, 30.001)}));
  Built b = publishOutput(builder.build());
  ASSERT_EQ(b.graph->edgeCount(), 2u);
  SnapIndex index(b.graph, b.buckets);
  EXPECT_EQ(index.snap(30.0, 30.0005), 0u);
}

TEST(SnapIndex, EdgeAcrossOuterBoundaryIsFoundFromNeighbourCell) {
  // Walk east along a parallel until the level-5 cell changes.
  const double lat = 48.85;
  const CellId home = cellFromLatLng(lat, 2.35, 5);
  double inside = 2.35;
  double across = 2.35;
  for (int step = 1; step < 20000; ++step) {
    const double lng = 2.35 + step * 0.0005;
    if (cellFromLatLng(lat, lng, 5) != home) {
      across = lng;
      break;
    }
    inside = lng;
  }
  ASSERT_GT(across, inside);
  const CellId neighbour = cellFromLatLng(lat, across, 5);
  const double deep = across + 0.3;
  ASSERT_EQ(cellFromLatLng(lat, deep, 5), neighbour);

  // points in outer cells {home, home, neighbour}
  GraphBuilder builder;
  builder.addWay(way(1, {pt(lat, 2.35), pt(lat, inside), pt(lat, deep)}));
  Built b = publishOutput(builder.build());

  // The neighbour bucket holds only the far point, nowhere near the query.
  const CellId queryFine = cellFromLatLng(lat, across, 13);
  const SnapBucket& nb = b.buckets->bucketFor(neighbour);
  EXPECT_EQ(std::find(nb.fine_cell_ids.begin(), nb.fine_cell_ids.end(), queryFine), nb.fine_cell_ids.end());

  SnapOptions fineOnly;
  fineOnly.max_outer_ring = -1;
  SnapIndex index(b.graph, b.buckets, fineOnly);
  EXPECT_EQ(cellParentAt(queryFine, 5), neighbour);
  EXPECT_EQ(index.snap(lat, across), 0u);
}

TEST(SnapIndex, NullInputsAreRejected) {
  Built b = publishOutput(buildParisGrid());
  EXPECT_THROW(SnapIndex(nullptr, b.buckets), std::invalid_argument);
  EXPECT_THROW(SnapIndex(b.graph, nullptr), std::invalid_argument);
}

TEST(SnapIndex, CloserPointTwoRingsPastFirstHitIsFound) {
  const double step = 1e-5;
  // query on the west edge of its fine cell
  const LatLng start{48.85, 2.35};
  const LatLng out = walkUntilRing(start, 0.0, -step, cellFromLatLng(start, 13), 1);
  const LatLng q{out.lat, out.lng + step};
  const CellId home = cellFromLatLng(q, 13);
  ASSERT_EQ(home, cellFromLatLng(start, 13));

  // far corner of the north-east diagonal neighbour
  const LatLng east2 = walkUntilRing(q, 0.0, step, home, 2);
  const LatLng eastSide{east2.lat, east2.lng - 200 * step};
  const LatLng north2 = walkUntilRing(eastSide, step, 0.0, home, 2);
  const LatLng corner{north2.lat - step, north2.lng};
  ASSERT_TRUE(inRing(home, 1, cellFromLatLng(corner, 13)));

  // just inside the third cell to the west
  const LatLng west3 = walkUntilRing(q, 0.0, -step, home, 3);
  const LatLng westPoint{west3.lat, west3.lng - 3 * step};
  ASSERT_TRUE(inRing(home, 3, cellFromLatLng(westPoint, 13)));
  ASSERT_GT(geo::haversine(q, corner), geo::haversine(q, westPoint));

  GraphBuilder builder;
  builder.addWay(way(1, {pt(corner.lat - step, corner.lng - step), pt(corner.lat, corner.lng)}));
  builder.addWay(way(2, {pt(westPoint.lat, westPoint.lng), pt(westPoint.lat, westPoint.lng - step)}));
  Built b = publishOutput(builder.build());
  ASSERT_EQ(b.graph->edgeCount(), 2u);

  SnapIndex index(b.graph, b.buckets);
  EXPECT_EQ(index.snap(q.lat, q.lng), 1u);
  const auto hit = index.snapWithDistance(q.lat, q.lng);
  ASSERT_TRUE(hit.has_value());
  EXPECT_NEAR(hit->distance_m, bruteForceNearest(*b.graph, q), 1e-6);
}

TEST(SnapIndex, FallbackInsideEmptyAreaIsBounded) {
  // Short east-west segments on a regular grid with a ~12 km wide hole
  // around the query point.
  const LatLng q{48.81, 2.35};
  auto inHole = [&](double lat, double lng) {
    return std::fabs(lat - q.lat) < 0.05 && std::fabs(lng - q.lng) < 0.08;
  };
  GraphBuilder builder;
  int64_t id = 1;
  for (int row = 0; row <= 20; ++row) {
    const double lat = 48.61 + 0.02 * row;
    for (int col = 0; col < 50; ++col) {
      const double a = 2.10 + 0.01 * col;
      const double z = a + 0.01;
      if (inHole(lat, a) || inHole(lat, z)) continue;
      builder.addWay(way(id++, {pt(lat, a), pt(lat, z)}));
    }
  }
  Built b = publishOutput(builder.build());
  ASSERT_GT(b.graph->edgeCount(), 500u);

  SnapIndex index(b.graph, b.buckets);
  const auto c = index.candidates(q.lat, q.lng);
  ASSERT_FALSE(c.empty());
  EXPECT_LE(c.size(), index.options().max_fallback_candidates);
  EXPECT_TRUE(std::is_sorted(c.begin(), c.end()));

  const auto hit = index.snapWithDistance(q.lat, q.lng);
  ASSERT_TRUE(hit.has_value());
  EXPECT_GT(hit->distance_m, 5000.0);
  EXPECT_NEAR(hit->distance_m, bruteForceNearest(*b.graph, q), 1e-6);
}
