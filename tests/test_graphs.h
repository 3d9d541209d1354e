#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "cellroute/graph_store.h"
#include "cellroute/packed_cost.h"
#include "graph_builder.h"

namespace cellroute::fixtures {

struct EdgeSpec {
  uint32_t from;
  uint32_t to;
  uint32_t cost;
  bool oneway {false};
};

// Hand-made graph without geometry; every mode gets the same packed value.
inline std::shared_ptr<GraphStore> makeGraph(uint32_t nodeCount, const std::vector<EdgeSpec>& specs) {
  auto g = std::make_shared<GraphStore>();
  g->name = "test";
  g->nodes.resize(nodeCount);
  for (uint32_t i = 0; i < specs.size(); ++i) {
    const EdgeSpec& s = specs[i];
    const uint16_t v = packed::make(s.cost, s.oneway, false);
    g->edges.push_back(Edge{s.from, s.to, v});
    for (int m = 1; m < kNumModes; ++m) g->mode_costs[static_cast<size_t>(m)].push_back(v);
    g->nodes[s.from].edges.push_back(i);
    g->nodes[s.from].interactions.push_back({});
    if (s.to != s.from) {
      g->nodes[s.to].edges.push_back(i);
      g->nodes[s.to].interactions.push_back({});
    }
  }
  return g;
}

// 0 --E0(5)-- 1 --E1(7)-- 2
inline std::shared_ptr<GraphStore> threeNodeGraph(bool e1Oneway = false) {
  return makeGraph(3, {{0, 1, 5}, {1, 2, 7, e1Oneway}});
}

inline WayPoint pt(double lat, double lng, int64_t nodeId = 0) {
  WayPoint p;
  p.pos = LatLng{lat, lng};
  p.node_id = nodeId;
  return p;
}

inline WayRecord way(int64_t id, std::vector<WayPoint> points, RoadClass rc = RoadClass::Residential) {
  WayRecord w;
  w.id = id;
  w.points = std::move(points);
  w.road_class = rc;
  return w;
}

inline NodeRecord node(int64_t id, double lat, double lng, Interaction control = Interaction::None) {
  NodeRecord n;
  n.id = id;
  n.lat = lat;
  n.lng = lng;
  n.control = control;
  return n;
}

// Node slot at an exact location, or nodeCount() when there is none.
inline uint32_t nodeAt(const GraphStore& g, double lat, double lng) {
  for (uint32_t n = 0; n < g.nodeCount(); ++n) {
    if (g.node_locations[n].lat == lat && g.node_locations[n].lng == lng) return n;
  }
  return g.nodeCount();
}

// A small street grid around Paris:
//
//   1 ---w10--- 2 ---w11--- 3
//   |                       |
//  w12                     w13
//   |                       |
//   4 ---------w14--------- 5
inline BuildOutput buildParisGrid(BuildOptions opt = {}) {
  GraphBuilder b(opt);
  b.addNode(node(1, 48.8600, 2.3400));
  b.addNode(node(2, 48.8600, 2.3450, Interaction::TrafficLight));
  b.addNode(node(3, 48.8600, 2.3500));
  b.addNode(node(4, 48.8550, 2.3400));
  b.addNode(node(5, 48.8550, 2.3500));

  WayRecord w10 = way(10, {pt(48.8600, 2.3400, 1), pt(48.8600, 2.3425), pt(48.8600, 2.3450, 2)});
  w10.names = {"Rue A"};
  WayRecord w11 = way(11, {pt(48.8600, 2.3450, 2), pt(48.8600, 2.3500, 3)});
  w11.names = {"Rue A"};
  WayRecord w12 = way(12, {pt(48.8600, 2.3400, 1), pt(48.8550, 2.3400, 4)});
  w12.names = {"Rue B"};
  WayRecord w13 = way(13, {pt(48.8600, 2.3500, 3), pt(48.8550, 2.3500, 5)});
  w13.names = {"Rue C"};
  WayRecord w14 = way(14, {pt(48.8550, 2.3400, 4), pt(48.8550, 2.3450), pt(48.8550, 2.3500, 5)},
                      RoadClass::Primary);
  w14.names = {"Boulevard D", "D1"};
  w14.priority = 8;
  for (auto* w : {&w10, &w11, &w12, &w13, &w14}) b.addWay(*w);
  return b.build();
}

} // namespace cellroute::fixtures
