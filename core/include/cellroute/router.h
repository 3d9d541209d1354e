#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cellroute/cell_id.h"
#include "cellroute/graph_store.h"
#include "cellroute/mode_profile.h"
#include "cellroute/route_planner.h"
#include "cellroute/snap_buckets.h"
#include "cellroute/snap_index.h"

namespace cellroute {

struct RouterOptions {
  SnapOptions snap;
  size_t maxVisited = 0;              // 0: unbounded search
  ModeProfiles profiles = defaultModeProfiles();
};

// A published graph with everything built on top of it. Immutable.
struct Snapshot {
  std::shared_ptr<const GraphStore> graph;
  std::shared_ptr<const SnapBuckets> buckets;
  SnapIndex snapIndex;
  RoutePlanner planner;

  Snapshot(std::shared_ptr<const GraphStore> g, std::shared_ptr<const SnapBuckets> b,
           const RouterOptions& opt);
};

// Query entry point for the serving layer. snap() and route() may be called
// from any number of threads; publish() swaps the whole snapshot and calls in
// flight finish against the one they started with.
class Router {
public:
  explicit Router(RouterOptions opt = {});
  // Loads and publishes a .routingdb file.
  explicit Router(const std::string& db_path, RouterOptions opt = {});
  ~Router();

  // Validates both structures, then makes them visible to new calls.
  void publish(std::shared_ptr<const GraphStore> graph, std::shared_ptr<const SnapBuckets> buckets);

  std::shared_ptr<const Snapshot> snapshot() const;

  std::optional<uint32_t> snap(double lat, double lng) const;

  RouteResult route(uint32_t startEdge, uint32_t endEdge, TravelMode mode) const;

  // Snaps every waypoint and joins the legs start..waypoints..end.
  RouteResult route(TravelMode mode, const std::vector<LatLng>& waypoints) const;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace cellroute
