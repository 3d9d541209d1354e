#include "cellroute/snap_buckets.h"

#include <string>

#include "cellroute/errors.h"

namespace cellroute {

size_t SnapBuckets::entryCount() const {
  size_t n = 0;
  for (const auto& b : buckets) n += b.fine_cell_ids.size();
  return n;
}

void SnapBuckets::validate(size_t edge_count) const {
  if (outer_level < 0 || fine_level > kMaxCellLevel || outer_level > fine_level) {
    throw IndexCorruptionError("snap levels out of range: outer " + std::to_string(outer_level) +
                               ", fine " + std::to_string(fine_level));
  }
  if (buckets.size() != cellCountAtLevel(outer_level)) {
    throw IndexCorruptionError("expected " + std::to_string(cellCountAtLevel(outer_level)) +
                               " snap buckets, found " + std::to_string(buckets.size()));
  }
  for (size_t idx = 0; idx < buckets.size(); ++idx) {
    const SnapBucket& b = buckets[idx];
    const std::string where = "snap bucket " + std::to_string(idx);
    if (b.cell_id != cellFromDenseIndex(outer_level, idx)) {
      throw IndexCorruptionError(where + " has cell id " + std::to_string(b.cell_id) +
                                 " which does not match its position");
    }
    if (b.fine_cell_ids.size() != b.edge_indexes.size()) {
      throw IndexCorruptionError(where + " has " + std::to_string(b.fine_cell_ids.size()) +
                                 " fine cells but " + std::to_string(b.edge_indexes.size()) + " edges");
    }
    for (size_t k = 0; k < b.fine_cell_ids.size(); ++k) {
      const CellId fine = b.fine_cell_ids[k];
      if (k > 0 && fine < b.fine_cell_ids[k - 1]) {
        throw IndexCorruptionError(where + " fine cell ids are not sorted at entry " + std::to_string(k));
      }
      if (!cellIsValid(fine) || cellLevel(fine) != fine_level || !cellContains(b.cell_id, fine)) {
        throw IndexCorruptionError(where + " entry " + std::to_string(k) + " is not a fine cell of the bucket");
      }
      if (b.edge_indexes[k] >= edge_count) {
        throw IndexCorruptionError(where + " entry " + std::to_string(k) + " references edge " +
                                   std::to_string(b.edge_indexes[k]) + " out of range");
      }
    }
  }
}

} // namespace cellroute
