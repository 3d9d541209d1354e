#pragma once

#include <cstdint>
#include <vector>

#include "cellroute/graph_store.h"
#include "cellroute/snap_buckets.h"

namespace cellroute {

// FlatBuffers blobs for the graph container (schema/graph.fbs).
std::vector<uint8_t> buildGraphBlob(const GraphStore& graph);
std::vector<uint8_t> buildLocationBlob(const GraphStore& graph);
std::vector<uint8_t> buildDescriptionBlob(const GraphStore& graph);

// FlatBuffers blob for schema/snap_buckets.fbs.
std::vector<uint8_t> buildSnapBucketsBlob(const SnapBuckets& buckets);

} // namespace cellroute
