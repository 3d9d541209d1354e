#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "cellroute/graph_store.h"
#include "cellroute/snap_buckets.h"

namespace cellroute {

struct SnapOptions {
  int max_fine_ring = 2;  // fine-level rings probed around the query cell
  int max_outer_ring = 2; // outer-level rings probed when no fine ring hits
  // Edges kept from the outer-ring fallback, nearest fine cells first.
  size_t max_fallback_candidates = 64;
};

struct SnapHit {
  uint32_t edge {0};
  double distance_m {0.0};
};

// Nearest-edge lookup over a published graph and its buckets.
// Holds shared ownership of both; every call works on local state only.
class SnapIndex {
public:
  SnapIndex(std::shared_ptr<const GraphStore> graph,
            std::shared_ptr<const SnapBuckets> buckets,
            SnapOptions opt = {});

  std::optional<uint32_t> snap(double lat, double lng) const;
  std::optional<SnapHit> snapWithDistance(double lat, double lng) const;

  // Candidate edges the probing collects, sorted and unique.
  // Fine rings stop at max_fine_ring unless something was found; after a hit
  // they go on while the next ring may still hold a closer point.
  std::vector<uint32_t> candidates(double lat, double lng) const;

  const SnapOptions& options() const { return opt_; }

private:
  void probeFine(CellId fine, std::vector<uint32_t>& out) const;
  void probeOuter(CellId outer, const LatLng& p, std::vector<std::pair<double, uint32_t>>& out) const;
  double distanceTo(const LatLng& p, uint32_t edge) const;

  std::shared_ptr<const GraphStore> graph_;
  std::shared_ptr<const SnapBuckets> buckets_;
  SnapOptions opt_;
};

} // namespace cellroute
