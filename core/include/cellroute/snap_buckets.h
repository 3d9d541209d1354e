#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "cellroute/cell_id.h"

namespace cellroute {

struct SnapBucket {
  CellId cell_id {0};                 // outer cell
  std::vector<CellId> fine_cell_ids;  // sorted ascending
  std::vector<uint32_t> edge_indexes; // parallel to fine_cell_ids
};

// One bucket per possible outer cell, addressed by cellDenseIndex().
struct SnapBuckets {
  int outer_level {5};
  int fine_level {13};
  std::vector<SnapBucket> buckets;

  const SnapBucket& bucketFor(CellId outer) const { return buckets[cellDenseIndex(outer)]; }

  size_t entryCount() const;

  // Throws IndexCorruptionError on the first bucket that breaks the layout:
  // wrong bucket count or key, unequal array lengths, unsorted fine ids,
  // a fine id outside its bucket, or an edge index >= edge_count.
  void validate(size_t edge_count) const;
};

} // namespace cellroute
