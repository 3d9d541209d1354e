#include <algorithm>
#include <utility>
#include <vector>

#include "graph_builder.h"

namespace cellroute {

SnapBuckets buildSnapBuckets(const GraphStore& graph, int outerLevel, int fineLevel) {
  SnapBuckets sb;
  sb.outer_level = outerLevel;
  sb.fine_level = fineLevel;

  const uint64_t count = cellCountAtLevel(outerLevel);
  std::vector<std::vector<std::pair<CellId, uint32_t>>> staging(count);

  // Each point is registered under its own fine cell, not its edge's.
  for (uint32_t ei = 0; ei < graph.edgeCount(); ++ei) {
    for (const LatLng& p : graph.edgePoints(ei)) {
      const CellId fine = cellFromLatLng(p, fineLevel);
      const CellId outer = cellParentAt(fine, outerLevel);
      staging[cellDenseIndex(outer)].emplace_back(fine, ei);
    }
  }

  sb.buckets.resize(count);
  for (uint64_t idx = 0; idx < count; ++idx) {
    SnapBucket& b = sb.buckets[idx];
    b.cell_id = cellFromDenseIndex(outerLevel, idx);
    auto& entries = staging[idx];
    if (entries.empty()) continue;
    std::sort(entries.begin(), entries.end());
    entries.erase(std::unique(entries.begin(), entries.end()), entries.end());
    b.fine_cell_ids.reserve(entries.size());
    b.edge_indexes.reserve(entries.size());
    for (const auto& e : entries) {
      b.fine_cell_ids.push_back(e.first);
      b.edge_indexes.push_back(e.second);
    }
    std::vector<std::pair<CellId, uint32_t>>().swap(entries);
  }
  return sb;
}

} // namespace cellroute
