#include "cellroute/route_planner.h"

#include <algorithm>
#include <limits>
#include <queue>
#include <stdexcept>

namespace cellroute {

const char* routeStatusName(RouteStatus status) {
  switch (status) {
    case RouteStatus::OK: return "OK";
    case RouteStatus::UNREACHABLE: return "UNREACHABLE";
    case RouteStatus::TRUNCATED: return "TRUNCATED";
    case RouteStatus::INVALID_INPUT: return "INVALID_INPUT";
  }
  return "UNKNOWN";
}

RoutePlanner::RoutePlanner(std::shared_ptr<const GraphStore> graph, ModeProfiles profiles)
  : graph_(std::move(graph)), profiles_(profiles) {
  if (!graph_) throw std::invalid_argument("RoutePlanner needs a graph");
}

bool RoutePlanner::canTraverse(uint32_t edge, bool reverse, const ModeProfile& p) const {
  const uint16_t pc = graph_->packedCost(edge, p.mode);
  if (packed::excluded(pc)) return false;
  if (reverse && packed::oneway(pc) && p.respects_oneway) return false;
  return true;
}

RouteResult RoutePlanner::route(uint32_t start_edge, uint32_t end_edge, TravelMode mode,
                                size_t max_visited) const {
  RouteResult rr;
  const GraphStore& g = *graph_;
  const size_t E = g.edgeCount();
  if (start_edge >= E || end_edge >= E) {
    rr.status = RouteStatus::INVALID_INPUT;
    rr.error_message = "edge index out of range";
    return rr;
  }
  const ModeProfile& prof = profile(mode);

  // state = edge * 2 + dir; dir 0 runs from_node -> to_node, dir 1 the other way
  auto edgeOf = [](size_t s) { return static_cast<uint32_t>(s >> 1); };
  auto headOf = [&](size_t s) {
    const Edge& e = g.edges[s >> 1];
    return (s & 1) ? e.from_node : e.to_node;
  };

  constexpr uint64_t kInf = std::numeric_limits<uint64_t>::max();
  constexpr size_t kNone = std::numeric_limits<size_t>::max();
  std::vector<uint64_t> dist(E * 2, kInf);
  std::vector<size_t> prev(E * 2, kNone);
  std::vector<bool> settled(E * 2, false);

  struct QItem { uint64_t cost; uint32_t node; size_t state; };
  struct Cmp {
    bool operator()(const QItem& a, const QItem& b) const {
      if (a.cost != b.cost) return a.cost > b.cost;
      if (a.node != b.node) return a.node > b.node;
      return a.state > b.state;
    }
  };
  std::priority_queue<QItem, std::vector<QItem>, Cmp> pq;

  const uint64_t startCost = packed::cost(g.packedCost(start_edge, mode));
  for (size_t dir = 0; dir < 2; ++dir) {
    if (!canTraverse(start_edge, dir == 1, prof)) continue;
    const size_t s = size_t{start_edge} * 2 + dir;
    dist[s] = startCost;
    pq.push({startCost, headOf(s), s});
  }

  while (!pq.empty()) {
    const QItem q = pq.top();
    pq.pop();
    if (settled[q.state] || q.cost != dist[q.state]) continue;
    settled[q.state] = true;
    ++rr.visited;
    if (max_visited > 0 && rr.visited > max_visited) {
      rr.status = RouteStatus::TRUNCATED;
      rr.error_message = "visited-state budget exceeded";
      return rr;
    }

    const uint32_t a = edgeOf(q.state);
    if (a == end_edge) {
      for (size_t s = q.state; s != kNone; s = prev[s]) rr.path.push_back(edgeOf(s));
      std::reverse(rr.path.begin(), rr.path.end());
      rr.cost = static_cast<uint32_t>(std::min<uint64_t>(q.cost, std::numeric_limits<uint32_t>::max()));
      rr.status = RouteStatus::OK;
      return rr;
    }

    const uint32_t n = q.node;
    const Interaction arriving = g.interactionAt(n, a).incoming;
    const Node& node = g.nodes[n];
    for (size_t k = 0; k < node.edges.size(); ++k) {
      const uint32_t b = node.edges[k];
      const Edge& eb = g.edges[b];
      const Interaction control = std::max(arriving, node.interactions[k].outgoing);
      const uint64_t w = packed::cost(g.packedCost(b, mode)) + prof.penalty(control);
      for (size_t dir = 0; dir < 2; ++dir) {
        const uint32_t tail = dir ? eb.to_node : eb.from_node;
        if (tail != n || !canTraverse(b, dir == 1, prof)) continue;
        const size_t s = size_t{b} * 2 + dir;
        if (settled[s]) continue;
        const uint64_t cand = q.cost + w;
        if (cand < dist[s]) {
          dist[s] = cand;
          prev[s] = q.state;
          pq.push({cand, headOf(s), s});
        }
      }
    }
  }

  rr.status = RouteStatus::UNREACHABLE;
  rr.error_message = "no path between edges";
  return rr;
}

} // namespace cellroute
