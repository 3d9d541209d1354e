#include "cellroute/router.h"

#include <algorithm>
#include <atomic>
#include <limits>
#include <string>

#include "cellroute/errors.h"
#include "cellroute/routing_db.h"

namespace cellroute {

Snapshot::Snapshot(std::shared_ptr<const GraphStore> g, std::shared_ptr<const SnapBuckets> b,
                   const RouterOptions& opt)
  : graph(g), buckets(b), snapIndex(g, b, opt.snap), planner(g, opt.profiles) {}

struct Router::Impl {
  RouterOptions opt;
  std::shared_ptr<const Snapshot> current;

  explicit Impl(RouterOptions o) : opt(std::move(o)) {}

  std::shared_ptr<const Snapshot> load() const { return std::atomic_load(&current); }
};

Router::Router(RouterOptions opt)
  : impl_(std::make_unique<Impl>(std::move(opt))) {}

Router::Router(const std::string& db_path, RouterOptions opt)
  : impl_(std::make_unique<Impl>(std::move(opt))) {
  LoadedGraph loaded = loadRoutingDb(db_path);
  publish(std::move(loaded.graph), std::move(loaded.buckets));
}

Router::~Router() = default;

void Router::publish(std::shared_ptr<const GraphStore> graph, std::shared_ptr<const SnapBuckets> buckets) {
  if (!graph || !buckets) throw DataError("cannot publish an empty graph");
  graph->validate();
  buckets->validate(graph->edgeCount());
  auto snap = std::make_shared<const Snapshot>(std::move(graph), std::move(buckets), impl_->opt);
  std::atomic_store(&impl_->current, std::move(snap));
}

std::shared_ptr<const Snapshot> Router::snapshot() const {
  return impl_->load();
}

std::optional<uint32_t> Router::snap(double lat, double lng) const {
  auto s = impl_->load();
  if (!s) return std::nullopt;
  return s->snapIndex.snap(lat, lng);
}

RouteResult Router::route(uint32_t startEdge, uint32_t endEdge, TravelMode mode) const {
  auto s = impl_->load();
  if (!s) {
    RouteResult rr;
    rr.status = RouteStatus::INVALID_INPUT;
    rr.error_message = "no graph published";
    return rr;
  }
  return s->planner.route(startEdge, endEdge, mode, impl_->opt.maxVisited);
}

RouteResult Router::route(TravelMode mode, const std::vector<LatLng>& waypoints) const {
  RouteResult rr;
  if (waypoints.size() < 2) {
    rr.status = RouteStatus::INVALID_INPUT;
    rr.error_message = "need at least 2 waypoints";
    return rr;
  }
  auto s = impl_->load();
  if (!s) {
    rr.status = RouteStatus::INVALID_INPUT;
    rr.error_message = "no graph published";
    return rr;
  }

  std::vector<uint32_t> snapped;
  snapped.reserve(waypoints.size());
  for (size_t i = 0; i < waypoints.size(); ++i) {
    auto e = s->snapIndex.snap(waypoints[i].lat, waypoints[i].lng);
    if (!e) {
      rr.status = RouteStatus::UNREACHABLE;
      rr.error_message = "failed to snap waypoint " + std::to_string(i);
      return rr;
    }
    snapped.push_back(*e);
  }

  // Each leg counts both of its end edges; the edge shared by consecutive
  // legs is kept and paid for once.
  uint64_t total = 0;
  for (size_t i = 0; i + 1 < snapped.size(); ++i) {
    RouteResult leg = s->planner.route(snapped[i], snapped[i + 1], mode, impl_->opt.maxVisited);
    rr.visited += leg.visited;
    if (leg.status != RouteStatus::OK) {
      rr.status = leg.status;
      rr.error_message = "leg " + std::to_string(i) + ": " + leg.error_message;
      rr.path.clear();
      return rr;
    }
    if (i == 0) {
      rr.path = leg.path;
      total = leg.cost;
    } else {
      rr.path.insert(rr.path.end(), leg.path.begin() + 1, leg.path.end());
      total += leg.cost - packed::cost(s->graph->packedCost(snapped[i], mode));
    }
  }
  rr.cost = static_cast<uint32_t>(std::min<uint64_t>(total, std::numeric_limits<uint32_t>::max()));
  rr.status = RouteStatus::OK;
  return rr;
}

} // namespace cellroute
