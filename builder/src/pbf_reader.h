#pragma once

#include <cstdint>
#include <string>

#include "graph_builder.h"

namespace cellroute {

struct PbfStats {
  size_t nodes_seen {0};
  size_t ways_seen {0};
  size_t ways_kept {0};
  size_t ways_skipped {0}; // fewer than 2 resolvable points
};

// Feeds highway=* ways of an .osm.pbf file and the nodes they reference into
// a GraphBuilder. Requires libosmium; without it read() throws.
class PbfReader {
public:
  explicit PbfReader(std::string input_path);

  PbfStats read(GraphBuilder& builder);

private:
  std::string input_path_;
};

// Node-level highway=traffic_signals|stop|give_way.
Interaction interactionFromHighway(const char* highway);

// Importance 0..10 used by renderers to pick edges per zoom band.
uint8_t priorityForRoadClass(RoadClass rc);

// Parses "50", "50 km/h" or "30 mph"; 0 when not understood.
double parseMaxspeedKmh(const char* value);

} // namespace cellroute
