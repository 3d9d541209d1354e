#include "cellroute/snap_index.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "cellroute/geo.h"

namespace cellroute {

namespace {

// Narrowest cell width at a level under the quadratic projection.
double minCellWidthMeters(int level) {
  const double radians = 2.0 * std::sqrt(2.0) / 3.0 / static_cast<double>(uint64_t{1} << level);
  return radians * geo::kEarthRadiusM;
}

} // namespace

SnapIndex::SnapIndex(std::shared_ptr<const GraphStore> graph,
                     std::shared_ptr<const SnapBuckets> buckets,
                     SnapOptions opt)
  : graph_(std::move(graph)), buckets_(std::move(buckets)), opt_(opt) {
  if (!graph_ || !buckets_) throw std::invalid_argument("SnapIndex needs a graph and its snap buckets");
}

void SnapIndex::probeFine(CellId fine, std::vector<uint32_t>& out) const {
  const SnapBucket& b = buckets_->bucketFor(cellParentAt(fine, buckets_->outer_level));
  auto range = std::equal_range(b.fine_cell_ids.begin(), b.fine_cell_ids.end(), fine);
  const auto first = static_cast<size_t>(range.first - b.fine_cell_ids.begin());
  const auto last = static_cast<size_t>(range.second - b.fine_cell_ids.begin());
  for (size_t k = first; k < last; ++k) out.push_back(b.edge_indexes[k]);
}

void SnapIndex::probeOuter(CellId outer, const LatLng& p, std::vector<std::pair<double, uint32_t>>& out) const {
  const SnapBucket& b = buckets_->bucketFor(outer);
  // fine ids are sorted, so each distinct cell is measured once
  CellId last = 0;
  double d = 0.0;
  for (size_t k = 0; k < b.fine_cell_ids.size(); ++k) {
    if (k == 0 || b.fine_cell_ids[k] != last) {
      last = b.fine_cell_ids[k];
      d = geo::haversine(p, cellCenter(last));
    }
    out.emplace_back(d, b.edge_indexes[k]);
  }
}

double SnapIndex::distanceTo(const LatLng& p, uint32_t edge) const {
  if (edge >= graph_->edgeCount()) return HUGE_VAL;
  return geo::pointToPolylineMeters(p, graph_->edgePoints(edge));
}

std::vector<uint32_t> SnapIndex::candidates(double lat, double lng) const {
  const LatLng p{lat, lng};
  std::vector<uint32_t> found;

  // Any point of a ring-r cell is at least (r - 1) fine cells away.
  const CellId fine = cellFromLatLng(lat, lng, buckets_->fine_level);
  const double width = minCellWidthMeters(buckets_->fine_level);
  double best = HUGE_VAL;
  size_t measured = 0;
  int firstHit = -1;
  for (int r = 0;; ++r) {
    if (firstHit < 0) {
      if (r > opt_.max_fine_ring) break;
    } else if (r > firstHit + 1 && !(std::isfinite(best) && (r - 1) * width < best)) {
      break;
    }
    for (CellId c : cellRing(fine, r)) probeFine(c, found);
    for (; measured < found.size(); ++measured) best = std::min(best, distanceTo(p, found[measured]));
    if (firstHit < 0 && !found.empty()) firstHit = r;
  }

  if (found.empty()) {
    // Outer buckets span hundreds of kilometres; only the edges registered
    // in the nearest fine cells are kept.
    std::vector<std::pair<double, uint32_t>> ranked;
    const CellId outer = cellParentAt(fine, buckets_->outer_level);
    int last = opt_.max_outer_ring;
    for (int k = 0; k <= last; ++k) {
      const size_t before = ranked.size();
      for (CellId c : cellRing(outer, k)) probeOuter(c, p, ranked);
      if (before == 0 && !ranked.empty()) last = k + 1;
    }
    std::sort(ranked.begin(), ranked.end());
    for (const auto& r : ranked) {
      if (found.size() >= opt_.max_fallback_candidates) break;
      if (std::find(found.begin(), found.end(), r.second) == found.end()) found.push_back(r.second);
    }
  }

  std::sort(found.begin(), found.end());
  found.erase(std::unique(found.begin(), found.end()), found.end());
  return found;
}

std::optional<SnapHit> SnapIndex::snapWithDistance(double lat, double lng) const {
  const std::vector<uint32_t> cand = candidates(lat, lng);
  if (cand.empty()) return std::nullopt;

  const LatLng p{lat, lng};
  SnapHit best{0, HUGE_VAL};
  bool has = false;
  // candidates are ascending, so a strict comparison keeps the smallest index on ties
  for (uint32_t e : cand) {
    const double d = distanceTo(p, e);
    if (d < best.distance_m) {
      best = {e, d};
      has = true;
    }
  }
  if (!has) return std::nullopt;
  return best;
}

std::optional<uint32_t> SnapIndex::snap(double lat, double lng) const {
  auto hit = snapWithDistance(lat, lng);
  if (!hit) return std::nullopt;
  return hit->edge;
}

} // namespace cellroute
