#pragma once

#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "cellroute/graph_store.h"
#include "cellroute/snap_buckets.h"

namespace cellroute {

class SqliteError : public std::runtime_error {
public:
  explicit SqliteError(const std::string& message) : std::runtime_error(message) {}
};

// Row names in the `blobs` table.
constexpr const char* kGraphBlobName = "graph";
constexpr const char* kLocationBlobName = "location";
constexpr const char* kDescriptionBlobName = "description";
constexpr const char* kSnapBucketsBlobName = "snap_buckets";

// Read side of a .routingdb file.
class RoutingDb {
public:
  explicit RoutingDb(const std::string& db_path);
  ~RoutingDb();

  RoutingDb(const RoutingDb&) = delete;
  RoutingDb& operator=(const RoutingDb&) = delete;

  // Empty vector when the row is absent.
  std::vector<uint8_t> loadBlob(const std::string& name) const;
  std::string metadata(const std::string& key) const;

private:
  sqlite3* db_ {nullptr};
};

struct LoadedGraph {
  std::shared_ptr<const GraphStore> graph;
  std::shared_ptr<const SnapBuckets> buckets;
};

// Loads and verifies everything a Router needs. Throws SqliteError,
// DataError or IndexCorruptionError; nothing is returned half-loaded.
LoadedGraph loadRoutingDb(const std::string& db_path);

} // namespace cellroute
