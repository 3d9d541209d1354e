#include <cstdio>
#include <vector>
#include <string>
#include <cstdlib>

#include "cellroute/geo.h"
#include "cellroute/packed_cost.h"
#include "cellroute/router.h"
#include "cellroute/routing_db.h"

using namespace cellroute;

static std::string edgeNames(const GraphStore& g, uint32_t e) {
  std::string out;
  if (e >= g.descriptions.size()) return "(unnamed)";
  for (const auto& n : g.descriptions[e].names) {
    if (!out.empty()) out += " / ";
    out += n;
  }
  return out.empty() ? "(unnamed)" : out;
}

int main(int argc, char** argv) {
  if (argc < 6) {
    std::fprintf(stderr,
      "Usage: %s routingdb lat1 lon1 lat2 lon2 [mode] [--max-visited N] [--dump]\n"
      "mode: car|bike|walk|transit (default car)\n"
      "--dump  : list snap candidates around the start point\n",
      argv[0]);
    return 1;
  }
  const std::string db = argv[1];
  LatLng a{std::atof(argv[2]), std::atof(argv[3])};
  LatLng b{std::atof(argv[4]), std::atof(argv[5])};
  TravelMode mode = TravelMode::Car;
  bool dump = false;
  RouterOptions opt;
  for (int i = 6; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--dump") {
      dump = true;
    } else if (arg == "--max-visited" && i + 1 < argc) {
      opt.maxVisited = static_cast<size_t>(std::strtoull(argv[++i], nullptr, 10));
    } else if (!parseTravelMode(arg, mode)) {
      std::fprintf(stderr, "Unknown mode: %s\n", arg.c_str());
      return 1;
    }
  }

  try {
    {
      RoutingDb meta(db);
      std::fprintf(stderr, "Graph '%s': nodes=%s edges=%s levels=%s/%s\n",
                   meta.metadata("name").c_str(), meta.metadata("nodes").c_str(),
                   meta.metadata("edges").c_str(), meta.metadata("outer_level").c_str(),
                   meta.metadata("fine_level").c_str());
    }

    Router r(db, opt);
    auto snap = r.snapshot();

    if (dump) {
      for (uint32_t e : snap->snapIndex.candidates(a.lat, a.lng)) {
        const Edge& edge = snap->graph->edges[e];
        std::fprintf(stderr, "candidate %u from=%u to=%u cost=%u oneway=%d dist=%.1fm %s\n",
                     e, edge.from_node, edge.to_node,
                     packed::cost(snap->graph->packedCost(e, mode)),
                     packed::oneway(edge.cost_and_flags) ? 1 : 0,
                     geo::pointToPolylineMeters(a, snap->graph->edgePoints(e)),
                     edgeNames(*snap->graph, e).c_str());
      }
    }

    auto res = r.route(mode, {a, b});
    if (res.status != RouteStatus::OK) {
      std::fprintf(stderr, "Route failed: %s (%s), visited=%zu\n",
                   routeStatusName(res.status), res.error_message.c_str(), res.visited);
      return 2;
    }

    std::printf("mode=%s cost=%u edges=%zu visited=%zu\n",
                travelModeName(mode), res.cost, res.path.size(), res.visited);
    for (uint32_t e : res.path) {
      std::printf("%u %s\n", e, edgeNames(*snap->graph, e).c_str());
    }
    return 0;
  } catch (const std::exception& ex) {
    std::fprintf(stderr, "Error: %s\n", ex.what());
    return 2;
  }
}
