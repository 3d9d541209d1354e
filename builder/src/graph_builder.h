#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "cellroute/cell_id.h"
#include "cellroute/graph_store.h"
#include "cellroute/mode_profile.h"
#include "cellroute/snap_buckets.h"

namespace cellroute {

// Intersection (or any point the ingestion layer gives an id to).
struct NodeRecord {
  int64_t id {0};
  double lat {0.0};
  double lng {0.0};
  Interaction control {Interaction::None}; // signal/stop/yield at the node itself
};

struct WayPoint {
  LatLng pos;
  int64_t node_id {0}; // 0: plain shape point; otherwise must exist in the node table
};

struct WayRecord {
  int64_t id {0};
  std::vector<WayPoint> points;
  std::vector<std::string> names;
  uint8_t priority {0};
  RoadClass road_class {RoadClass::Residential};
  bool oneway {false};
  double maxspeed_kmh {0.0};
  uint8_t mode_mask {0x0F}; // bit (1 << TravelMode) set: mode may use the way
  // point index -> control faced when arriving at that point along this way
  std::vector<std::pair<size_t, Interaction>> point_controls;
};

struct BuildOptions {
  std::string graphName = "OSM Generated Graph";
  int outerLevel = 5;
  int fineLevel = 13;
  ModeProfiles profiles = defaultModeProfiles();
};

struct BuildWarning {
  int64_t way_id {0};
  uint32_t edge {0};
  TravelMode mode {TravelMode::Car};
  double raw_cost {0.0};
  std::string message;
};

struct BuildReport {
  size_t ways {0};
  size_t nodes {0};
  size_t edges {0};
  size_t snapEntries {0};
  std::vector<BuildWarning> warnings;
};

struct BuildOutput {
  GraphStore graph;
  SnapBuckets buckets;
  BuildReport report;
};

// round() then clamp into the 13-bit cost field; sets `overflow` when the
// value had to be cut down to packed::kMaxCost.
uint32_t clampCost(double raw, bool& overflow);

// Groups (fine cell, edge) pairs of every edge point under their outer cell.
SnapBuckets buildSnapBuckets(const GraphStore& graph, int outerLevel, int fineLevel);

// Single-writer construction of a graph and its snap index. build() throws
// MalformedInputError naming the offending record; nothing partial escapes.
class GraphBuilder {
public:
  explicit GraphBuilder(BuildOptions opt = {});

  void addNode(const NodeRecord& node);
  void addWay(WayRecord way);

  size_t nodeRecordCount() const { return nodes_.size(); }
  size_t wayCount() const { return ways_.size(); }

  BuildOutput build() const;

private:
  BuildOptions opt_;
  std::unordered_map<int64_t, NodeRecord> nodes_;
  std::vector<WayRecord> ways_;
};

} // namespace cellroute
