#include "cellroute/graph_store.h"

#include <string>

#include "cellroute/errors.h"

namespace cellroute {

const char* travelModeName(TravelMode mode) {
  switch (mode) {
    case TravelMode::Car: return "car";
    case TravelMode::Bike: return "bike";
    case TravelMode::Walk: return "walk";
    case TravelMode::Transit: return "transit";
  }
  return "unknown";
}

bool parseTravelMode(const std::string& s, TravelMode& out) {
  if (s == "car") out = TravelMode::Car;
  else if (s == "bike") out = TravelMode::Bike;
  else if (s == "walk" || s == "foot") out = TravelMode::Walk;
  else if (s == "transit") out = TravelMode::Transit;
  else return false;
  return true;
}

const char* interactionName(Interaction i) {
  switch (i) {
    case Interaction::None: return "none";
    case Interaction::Yield: return "yield";
    case Interaction::StopSign: return "stop";
    case Interaction::TrafficLight: return "traffic_light";
  }
  return "unknown";
}

uint16_t GraphStore::packedCost(uint32_t edge, TravelMode mode) const {
  if (mode == TravelMode::Car) return edges[edge].cost_and_flags;
  const auto& table = mode_costs[static_cast<size_t>(mode)];
  if (edge >= table.size()) return packed::make(0, false, true);
  return table[edge];
}

PointRange GraphStore::edgePoints(uint32_t edge) const {
  if (edge + 1 >= edge_point_offsets.size()) return {};
  const LatLng* base = points.data();
  return {base + edge_point_offsets[edge], base + edge_point_offsets[edge + 1]};
}

InteractionPair GraphStore::interactionAt(uint32_t node, uint32_t edge) const {
  const Node& n = nodes[node];
  for (size_t k = 0; k < n.edges.size(); ++k) {
    if (n.edges[k] == edge) return n.interactions[k];
  }
  return {};
}

void GraphStore::validate() const {
  const size_t N = nodes.size();
  const size_t E = edges.size();
  for (size_t ei = 0; ei < E; ++ei) {
    const Edge& e = edges[ei];
    if (e.from_node >= N || e.to_node >= N) {
      throw DataError("edge " + std::to_string(ei) + " references node out of range (node count " +
                      std::to_string(N) + ")");
    }
  }
  for (size_t ni = 0; ni < N; ++ni) {
    const Node& n = nodes[ni];
    if (n.edges.size() != n.interactions.size()) {
      throw DataError("node " + std::to_string(ni) + " has " + std::to_string(n.edges.size()) +
                      " edges but " + std::to_string(n.interactions.size()) + " interactions");
    }
    for (uint32_t ei : n.edges) {
      if (ei >= E) {
        throw DataError("node " + std::to_string(ni) + " references edge " + std::to_string(ei) +
                        " out of range (edge count " + std::to_string(E) + ")");
      }
    }
  }
  if (!node_locations.empty() && node_locations.size() != N) {
    throw DataError("node location table size mismatch");
  }
  if (!edge_point_offsets.empty()) {
    if (edge_point_offsets.size() != E + 1) throw DataError("edge point offset table size mismatch");
    for (size_t ei = 0; ei < E; ++ei) {
      if (edge_point_offsets[ei] > edge_point_offsets[ei + 1]) {
        throw DataError("edge " + std::to_string(ei) + " has decreasing point offsets");
      }
    }
    if (edge_point_offsets.back() != points.size()) throw DataError("edge point offsets do not cover points");
  }
  if (!descriptions.empty() && descriptions.size() != E) {
    throw DataError("description table size mismatch");
  }
  for (int m = 0; m < kNumModes; ++m) {
    const auto& table = mode_costs[static_cast<size_t>(m)];
    if (!table.empty() && table.size() != E) {
      throw DataError(std::string("cost table for ") + travelModeName(static_cast<TravelMode>(m)) +
                      " size mismatch");
    }
  }
}

} // namespace cellroute
