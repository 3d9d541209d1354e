#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "cellroute/graph_store.h"
#include "cellroute/snap_buckets.h"

namespace cellroute {

// Parses the graph container roots into a GraphStore. Each buffer is
// verified before it is read; location and description may be empty.
// Throws DataError on a buffer that fails verification or on a graph
// whose cross references are broken.
GraphStore readGraph(const std::vector<uint8_t>& graph_blob,
                     const std::vector<uint8_t>& location_blob,
                     const std::vector<uint8_t>& description_blob);

// Throws DataError when the buffer fails verification and
// IndexCorruptionError when a bucket breaks the sorted layout.
SnapBuckets readSnapBuckets(const std::vector<uint8_t>& blob, size_t edge_count);

} // namespace cellroute
