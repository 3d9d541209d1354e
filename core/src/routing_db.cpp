#include "cellroute/routing_db.h"

#include <cstring>

#include "cellroute/blob_reader.h"

namespace cellroute {

RoutingDb::RoutingDb(const std::string& db_path) {
  if (sqlite3_open_v2(db_path.c_str(), &db_, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
    std::string msg = "Failed to open routingdb: ";
    msg += db_ ? sqlite3_errmsg(db_) : "out of memory";
    if (db_) {
      sqlite3_close(db_);
      db_ = nullptr;
    }
    throw SqliteError(msg);
  }
}

RoutingDb::~RoutingDb() {
  if (db_) sqlite3_close(db_);
}

std::vector<uint8_t> RoutingDb::loadBlob(const std::string& name) const {
  static const char* sql = "SELECT data FROM blobs WHERE name=? LIMIT 1;";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    throw SqliteError(std::string("Failed to prepare blob query: ") + sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);

  std::vector<uint8_t> out;
  int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    const void* blob = sqlite3_column_blob(stmt, 0);
    int size = sqlite3_column_bytes(stmt, 0);
    if (blob && size > 0) {
      out.resize(static_cast<size_t>(size));
      std::memcpy(out.data(), blob, static_cast<size_t>(size));
    }
  } else if (rc != SQLITE_DONE) {
    std::string msg = "Failed to read blob '" + name + "': " + sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    throw SqliteError(msg);
  }
  sqlite3_finalize(stmt);
  return out;
}

std::string RoutingDb::metadata(const std::string& key) const {
  static const char* sql = "SELECT value FROM metadata WHERE key=? LIMIT 1;";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    throw SqliteError(std::string("Failed to prepare metadata query: ") + sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  std::string out;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    const unsigned char* text = sqlite3_column_text(stmt, 0);
    if (text) out = reinterpret_cast<const char*>(text);
  }
  sqlite3_finalize(stmt);
  return out;
}

LoadedGraph loadRoutingDb(const std::string& db_path) {
  RoutingDb db(db_path);
  auto graph = std::make_shared<GraphStore>(readGraph(db.loadBlob(kGraphBlobName),
                                                      db.loadBlob(kLocationBlobName),
                                                      db.loadBlob(kDescriptionBlobName)));
  auto buckets = std::make_shared<SnapBuckets>(readSnapBuckets(db.loadBlob(kSnapBucketsBlobName),
                                                               graph->edgeCount()));
  return {std::move(graph), std::move(buckets)};
}

} // namespace cellroute
