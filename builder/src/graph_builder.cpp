#include "graph_builder.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>
#include <unordered_map>

#include "cellroute/errors.h"
#include "cellroute/geo.h"
#include "cellroute/packed_cost.h"

namespace cellroute {

namespace {

// Points carrying an external id are keyed by it; way endpoints without one
// are keyed by their exact coordinate.
struct NodeKey {
  int64_t id;
  double lat;
  double lng;
};

bool operator<(const NodeKey& a, const NodeKey& b) {
  if (a.id != b.id) return a.id < b.id;
  if (a.id != 0) return false;
  if (a.lat != b.lat) return a.lat < b.lat;
  return a.lng < b.lng;
}

Interaction wayControlAt(const WayRecord& w, size_t k) {
  for (const auto& pc : w.point_controls) {
    if (pc.first == k) return pc.second;
  }
  return Interaction::None;
}

} // namespace

uint32_t clampCost(double raw, bool& overflow) {
  overflow = false;
  if (!(raw > 0.0)) return 0;
  const double r = std::round(raw);
  if (r > static_cast<double>(packed::kMaxCost)) {
    overflow = true;
    return packed::kMaxCost;
  }
  return static_cast<uint32_t>(r);
}

GraphBuilder::GraphBuilder(BuildOptions opt) : opt_(std::move(opt)) {
  if (opt_.outerLevel < 0 || opt_.fineLevel > kMaxCellLevel || opt_.outerLevel > opt_.fineLevel) {
    throw std::invalid_argument("cell levels must satisfy 0 <= outer <= fine <= 30");
  }
}

void GraphBuilder::addNode(const NodeRecord& node) {
  nodes_[node.id] = node;
}

void GraphBuilder::addWay(WayRecord way) {
  ways_.push_back(std::move(way));
}

BuildOutput GraphBuilder::build() const {
  BuildOutput out;
  GraphStore& g = out.graph;
  g.name = opt_.graphName;

  auto positionOf = [&](const WayPoint& p) -> LatLng {
    if (p.node_id == 0) return p.pos;
    const NodeRecord& n = nodes_.at(p.node_id);
    return LatLng{n.lat, n.lng};
  };
  auto keyOf = [&](const WayPoint& p) -> NodeKey {
    if (p.node_id != 0) return NodeKey{p.node_id, 0.0, 0.0};
    return NodeKey{0, p.pos.lat, p.pos.lng};
  };

  // 1. validate input, count how often every referenced node is used
  std::unordered_map<int64_t, size_t> uses;
  for (const auto& w : ways_) {
    if (w.points.size() < 2) {
      throw MalformedInputError("way " + std::to_string(w.id) + " has " + std::to_string(w.points.size()) +
                                " point(s); at least 2 are required");
    }
    for (size_t k = 0; k < w.points.size(); ++k) {
      const WayPoint& p = w.points[k];
      if (p.node_id != 0 && nodes_.find(p.node_id) == nodes_.end()) {
        throw MalformedInputError("way " + std::to_string(w.id) + " references node " +
                                  std::to_string(p.node_id) + " which is not in the node table");
      }
      if (p.node_id != 0) ++uses[p.node_id];
    }
  }

  // Endpoints, shared points and controlled points split ways.
  auto isIntersection = [&](const WayRecord& w, size_t k) {
    if (k == 0 || k + 1 == w.points.size()) return true;
    const int64_t id = w.points[k].node_id;
    if (id == 0) return false;
    return uses.at(id) > 1 || nodes_.at(id).control != Interaction::None;
  };

  std::map<NodeKey, LatLng> found;
  for (const auto& w : ways_) {
    for (size_t k = 0; k < w.points.size(); ++k) {
      if (isIntersection(w, k)) found.emplace(keyOf(w.points[k]), positionOf(w.points[k]));
    }
  }

  // Slots follow the leaf cell order so nearby nodes sit close in memory;
  // the key breaks ties between points sharing a leaf cell.
  std::vector<std::pair<CellId, std::map<NodeKey, LatLng>::const_iterator>> order;
  order.reserve(found.size());
  for (auto it = found.cbegin(); it != found.cend(); ++it) {
    order.emplace_back(cellFromLatLng(it->second, kMaxCellLevel), it);
  }
  std::stable_sort(order.begin(), order.end(),
                   [](const auto& a, const auto& b) { return a.first < b.first; });

  std::map<NodeKey, uint32_t> slot;
  std::vector<Interaction> nodeControl(found.size(), Interaction::None);
  g.nodes.resize(found.size());
  g.node_locations.reserve(found.size());
  uint32_t next = 0;
  for (const auto& entry : order) {
    const NodeKey& key = entry.second->first;
    slot.emplace(key, next);
    g.node_locations.push_back(entry.second->second);
    if (key.id != 0) nodeControl[next] = nodes_.at(key.id).control;
    ++next;
  }

  // 2. split ways into edges at intersections
  for (int m = 0; m < kNumModes; ++m) g.mode_costs[static_cast<size_t>(m)].clear();
  g.edge_point_offsets.push_back(0);

  auto emitEdge = [&](const WayRecord& w, size_t first, size_t last) {
    const auto ei = static_cast<uint32_t>(g.edges.size());
    const uint32_t u = slot.at(keyOf(w.points[first]));
    const uint32_t v = slot.at(keyOf(w.points[last]));

    const size_t pointBase = g.points.size();
    for (size_t k = first; k <= last; ++k) g.points.push_back(positionOf(w.points[k]));
    g.edge_point_offsets.push_back(static_cast<uint32_t>(g.points.size()));
    const double length = geo::polylineLengthMeters(g.points.data() + pointBase,
                                                    g.points.data() + g.points.size());

    Edge edge{u, v, 0};
    for (int m = 0; m < kNumModes; ++m) {
      const auto mode = static_cast<TravelMode>(m);
      const ModeProfile& prof = opt_.profiles[static_cast<size_t>(m)];
      uint16_t value = packed::make(0, w.oneway, true);
      if (((w.mode_mask >> m) & 1u) && prof.allows(w.road_class)) {
        const double raw = prof.costFor(length, w.road_class, w.maxspeed_kmh);
        bool overflow = false;
        const uint32_t c = clampCost(raw, overflow);
        if (overflow) {
          BuildWarning warn;
          warn.way_id = w.id;
          warn.edge = ei;
          warn.mode = mode;
          warn.raw_cost = raw;
          warn.message = "edge " + std::to_string(ei) + " of way " + std::to_string(w.id) + ": " +
                         travelModeName(mode) + " cost " + std::to_string(std::llround(raw)) +
                         " clamped to " + std::to_string(packed::kMaxCost);
          out.report.warnings.push_back(std::move(warn));
        }
        value = packed::make(c, w.oneway, false);
      }
      if (mode == TravelMode::Car) edge.cost_and_flags = value;
      else g.mode_costs[static_cast<size_t>(m)].push_back(value);
    }
    g.edges.push_back(edge);

    EdgeDescription desc;
    desc.names = w.names;
    desc.priority = std::min<uint8_t>(w.priority, 10);
    g.descriptions.push_back(std::move(desc));

    // 3. interactions at both ends; a control tagged on the way applies to
    // arriving and leaving along it alike
    auto attach = [&](uint32_t node, size_t pointIdx) {
      InteractionPair pair;
      const Interaction tagged = wayControlAt(w, pointIdx);
      pair.incoming = tagged != Interaction::None ? tagged : nodeControl[node];
      pair.outgoing = pair.incoming;
      g.nodes[node].edges.push_back(ei);
      g.nodes[node].interactions.push_back(pair);
    };
    attach(u, first);
    attach(v, last);
  };

  for (const auto& w : ways_) {
    size_t start = 0;
    for (size_t k = 1; k < w.points.size(); ++k) {
      if (!isIntersection(w, k)) continue;
      emitEdge(w, start, k);
      start = k;
    }
  }

  g.validate();

  // 4. snap index over every edge point
  out.buckets = buildSnapBuckets(g, opt_.outerLevel, opt_.fineLevel);

  out.report.ways = ways_.size();
  out.report.nodes = g.nodeCount();
  out.report.edges = g.edgeCount();
  out.report.snapEntries = out.buckets.entryCount();
  return out;
}

} // namespace cellroute
