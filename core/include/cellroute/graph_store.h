#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "cellroute/cell_id.h"
#include "cellroute/packed_cost.h"

namespace cellroute {

enum class TravelMode : uint8_t { Car = 0, Bike = 1, Walk = 2, Transit = 3 };
constexpr int kNumModes = 4;

const char* travelModeName(TravelMode mode);
bool parseTravelMode(const std::string& s, TravelMode& out);

// Ordered by severity; a movement through a node takes the stronger of the
// two controls involved.
enum class Interaction : uint8_t { None = 0, Yield = 1, StopSign = 2, TrafficLight = 3 };

const char* interactionName(Interaction i);

struct InteractionPair {
  Interaction incoming {Interaction::None}; // arriving at the node along the edge
  Interaction outgoing {Interaction::None}; // leaving the node along the edge
};

struct Edge {
  uint32_t from_node {0};
  uint32_t to_node {0};
  uint16_t cost_and_flags {0}; // car cost, see packed_cost.h
};

struct Node {
  std::vector<uint32_t> edges;
  std::vector<InteractionPair> interactions; // parallel to edges
};

struct EdgeDescription {
  std::vector<std::string> names;
  uint8_t priority {0}; // 0..10
};

struct PointRange {
  const LatLng* first {nullptr};
  const LatLng* last {nullptr};
  const LatLng* begin() const { return first; }
  const LatLng* end() const { return last; }
  size_t size() const { return static_cast<size_t>(last - first); }
  bool empty() const { return first == last; }
};

// Immutable once published. Nodes and edges refer to each other by index.
struct GraphStore {
  std::string name;
  std::vector<Edge> edges;
  std::vector<Node> nodes;

  std::vector<LatLng> node_locations;       // parallel to nodes
  std::vector<LatLng> points;               // all edge geometry, concatenated
  std::vector<uint32_t> edge_point_offsets; // edges.size() + 1 entries into points

  std::vector<EdgeDescription> descriptions; // parallel to edges, may be empty

  // Packed cost/flags of the modes other than Car, each parallel to edges.
  // The Car slot stays empty: its values live in Edge::cost_and_flags.
  // An empty table for another mode means the mode has no usable edge.
  std::array<std::vector<uint16_t>, kNumModes> mode_costs;

  size_t nodeCount() const { return nodes.size(); }
  size_t edgeCount() const { return edges.size(); }

  uint16_t packedCost(uint32_t edge, TravelMode mode) const;

  PointRange edgePoints(uint32_t edge) const;

  uint32_t otherNode(uint32_t edge, uint32_t node) const {
    const Edge& e = edges[edge];
    return e.from_node == node ? e.to_node : e.from_node;
  }

  // Interaction recorded at `node` for incident `edge`; None if not incident.
  InteractionPair interactionAt(uint32_t node, uint32_t edge) const;

  // Throws DataError naming the first broken cross reference.
  void validate() const;
};

} // namespace cellroute
