#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "cellroute/graph_store.h"
#include "cellroute/mode_profile.h"

namespace cellroute {

enum class RouteStatus {
  OK,
  UNREACHABLE,
  TRUNCATED,
  INVALID_INPUT
};

const char* routeStatusName(RouteStatus status);

struct RouteResult {
  RouteStatus status {RouteStatus::UNREACHABLE};
  std::vector<uint32_t> path; // edge indexes, start edge first, end edge last
  uint32_t cost {0};          // sum of packed edge costs plus turn penalties
  size_t visited {0};         // settled search states
  std::string error_message;
};

// Dijkstra over edge traversals (edge, direction) of a published graph.
// Turn penalties depend on the incoming edge, so a node alone is not a
// sufficient search state; a state is keyed by the node it arrives at.
class RoutePlanner {
public:
  explicit RoutePlanner(std::shared_ptr<const GraphStore> graph,
                        ModeProfiles profiles = defaultModeProfiles());

  // max_visited == 0 means no budget.
  RouteResult route(uint32_t start_edge, uint32_t end_edge, TravelMode mode,
                    size_t max_visited = 0) const;

  const ModeProfile& profile(TravelMode mode) const { return profiles_[static_cast<size_t>(mode)]; }

private:
  bool canTraverse(uint32_t edge, bool reverse, const ModeProfile& p) const;

  std::shared_ptr<const GraphStore> graph_;
  ModeProfiles profiles_;
};

} // namespace cellroute
