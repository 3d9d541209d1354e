#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#include "graph_builder.h"
#include "pbf_reader.h"
#include "sqlite_writer.h"

namespace fs = std::filesystem;
using namespace cellroute;

static void printUsage(const char* argv0) {
  std::fprintf(stderr, "Usage: %s [--outer N] [--fine N] [--name S] input.osm.pbf output.routingdb\n", argv0);
}

int main(int argc, char** argv) {
  if (argc < 3) {
    printUsage(argv[0]);
    return 1;
  }

  BuildOptions opt;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
  for (size_t i = 0; i < args.size();) {
    const bool known = args[i] == "--outer" || args[i] == "--fine" || args[i] == "--name";
    if (!known) {
      ++i;
      continue;
    }
    if (i + 1 >= args.size()) { printUsage(argv[0]); return 1; }
    try {
      if (args[i] == "--outer") opt.outerLevel = std::stoi(args[i + 1]);
      else if (args[i] == "--fine") opt.fineLevel = std::stoi(args[i + 1]);
      else opt.graphName = args[i + 1];
    } catch (const std::exception&) {
      std::fprintf(stderr, "Bad value for %s: %s\n", args[i].c_str(), args[i + 1].c_str());
      return 1;
    }
    args.erase(args.begin() + i, args.begin() + i + 2);
  }
  if (args.size() < 2) { printUsage(argv[0]); return 1; }

  const std::string inputPbfPath = args[0];
  const std::string outputDbPath = args[1];

  try {
    const fs::path outPath(outputDbPath);
    if (outPath.has_parent_path()) {
      fs::create_directories(outPath.parent_path());
    }

    GraphBuilder builder(opt);
    PbfReader reader(inputPbfPath);
    const PbfStats stats = reader.read(builder);
    std::printf("Read %zu nodes, %zu ways (%zu highways kept, %zu skipped)\n",
                stats.nodes_seen, stats.ways_seen, stats.ways_kept, stats.ways_skipped);

    BuildOutput out = builder.build();
    for (const auto& w : out.report.warnings) {
      std::fprintf(stderr, "warning: %s\n", w.message.c_str());
    }
    std::printf("Graph '%s': %zu nodes, %zu edges, %zu snap entries (outer %d, fine %d)\n",
                out.graph.name.c_str(), out.report.nodes, out.report.edges, out.report.snapEntries,
                opt.outerLevel, opt.fineLevel);

    writeRoutingDb(outputDbPath, out.graph, out.buckets);
    std::printf("Written %s\n", outputDbPath.c_str());
    return 0;
  } catch (const std::exception& ex) {
    std::fprintf(stderr, "Error: %s\n", ex.what());
    return 2;
  }
}
