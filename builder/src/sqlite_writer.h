#pragma once

#include <sqlite3.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "cellroute/graph_store.h"
#include "cellroute/routing_db.h"
#include "cellroute/snap_buckets.h"

namespace cellroute {

// Write side of a .routingdb file: one `blobs` row per container plus a
// key/value `metadata` table.
class RoutingDbWriter {
public:
  explicit RoutingDbWriter(const std::string& dbPath);
  ~RoutingDbWriter();

  RoutingDbWriter(const RoutingDbWriter&) = delete;
  RoutingDbWriter& operator=(const RoutingDbWriter&) = delete;

  void createSchemaIfNeeded();
  void writeMetadata(const std::string& key, const std::string& value);
  // Replaces any existing row with the same name.
  void writeBlob(const std::string& name, const void* data, size_t size);
  void writeBlob(const std::string& name, const std::vector<uint8_t>& data) {
    writeBlob(name, data.data(), data.size());
  }

  void begin() { exec("BEGIN TRANSACTION;"); }
  void commit() { exec("COMMIT;"); }
  void rollback();

private:
  sqlite3* db_ {nullptr};
  void exec(const char* sql);
};

// Serializes graph and buckets and stores them in one transaction.
void writeRoutingDb(const std::string& dbPath, const GraphStore& graph, const SnapBuckets& buckets);

} // namespace cellroute
