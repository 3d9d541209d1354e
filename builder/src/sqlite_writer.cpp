#include "sqlite_writer.h"

#include <string>

#include "serializer.h"

namespace cellroute {

static int noop_callback(void*, int, char**, char**) { return 0; }

RoutingDbWriter::RoutingDbWriter(const std::string& dbPath) {
  if (sqlite3_open(dbPath.c_str(), &db_) != SQLITE_OK) {
    std::string msg = "Failed to open SQLite DB: ";
    msg += db_ ? sqlite3_errmsg(db_) : "out of memory";
    if (db_) {
      sqlite3_close(db_);
      db_ = nullptr;
    }
    throw SqliteError(msg);
  }
  exec("PRAGMA journal_mode = WAL;");
  exec("PRAGMA synchronous = NORMAL;");
}

RoutingDbWriter::~RoutingDbWriter() {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

void RoutingDbWriter::exec(const char* sql) {
  char* errMsg = nullptr;
  if (sqlite3_exec(db_, sql, noop_callback, nullptr, &errMsg) != SQLITE_OK) {
    std::string msg = "SQLite error: ";
    if (errMsg) {
      msg += errMsg;
      sqlite3_free(errMsg);
    }
    throw SqliteError(msg);
  }
}

void RoutingDbWriter::rollback() {
  // Best effort: the transaction may already be gone after a failed COMMIT.
  sqlite3_exec(db_, "ROLLBACK;", noop_callback, nullptr, nullptr);
}

void RoutingDbWriter::createSchemaIfNeeded() {
  const char* create_blobs =
      "CREATE TABLE IF NOT EXISTS blobs (\n"
      "  name TEXT PRIMARY KEY,\n"
      "  data BLOB NOT NULL\n"
      ");";

  const char* create_meta =
      "CREATE TABLE IF NOT EXISTS metadata (\n"
      "  key TEXT PRIMARY KEY,\n"
      "  value TEXT\n"
      ");";

  exec("BEGIN TRANSACTION;");
  exec(create_blobs);
  exec(create_meta);
  exec("COMMIT;");
}

void RoutingDbWriter::writeMetadata(const std::string& key, const std::string& value) {
  const char* upsert_sql =
      "INSERT INTO metadata(key, value) VALUES(?, ?)\n"
      "ON CONFLICT(key) DO UPDATE SET value=excluded.value;";

  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, upsert_sql, -1, &stmt, nullptr) != SQLITE_OK) {
    std::string msg = "Failed to prepare statement: ";
    msg += sqlite3_errmsg(db_);
    throw SqliteError(msg);
  }

  if (sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK ||
      sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
    std::string msg = "Failed to bind parameters: ";
    msg += sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    throw SqliteError(msg);
  }

  if (sqlite3_step(stmt) != SQLITE_DONE) {
    std::string msg = "Failed to execute statement: ";
    msg += sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    throw SqliteError(msg);
  }

  sqlite3_finalize(stmt);
}

void RoutingDbWriter::writeBlob(const std::string& name, const void* data, size_t size) {
  const char* sql =
      "INSERT INTO blobs(name, data) VALUES(?, ?)\n"
      "ON CONFLICT(name) DO UPDATE SET data=excluded.data;";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    std::string msg = "Failed to prepare blob insert: ";
    msg += sqlite3_errmsg(db_);
    throw SqliteError(msg);
  }
  if (sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK ||
      sqlite3_bind_blob64(stmt, 2, data, static_cast<sqlite3_uint64>(size), SQLITE_TRANSIENT) != SQLITE_OK) {
    std::string msg = "Failed to bind blob '" + name + "': " + sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    throw SqliteError(msg);
  }

  if (sqlite3_step(stmt) != SQLITE_DONE) {
    std::string msg = "Failed to insert blob '" + name + "': " + sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    throw SqliteError(msg);
  }
  sqlite3_finalize(stmt);
}

void writeRoutingDb(const std::string& dbPath, const GraphStore& graph, const SnapBuckets& buckets) {
  const std::vector<uint8_t> graphBlob = buildGraphBlob(graph);
  const std::vector<uint8_t> locationBlob = buildLocationBlob(graph);
  const std::vector<uint8_t> descriptionBlob = buildDescriptionBlob(graph);
  const std::vector<uint8_t> bucketsBlob = buildSnapBucketsBlob(buckets);

  RoutingDbWriter writer(dbPath);
  writer.createSchemaIfNeeded();
  writer.begin();
  try {
    writer.writeBlob(kGraphBlobName, graphBlob);
    writer.writeBlob(kLocationBlobName, locationBlob);
    writer.writeBlob(kDescriptionBlobName, descriptionBlob);
    writer.writeBlob(kSnapBucketsBlobName, bucketsBlob);
    writer.writeMetadata("name", graph.name);
    writer.writeMetadata("nodes", std::to_string(graph.nodeCount()));
    writer.writeMetadata("edges", std::to_string(graph.edgeCount()));
    writer.writeMetadata("outer_level", std::to_string(buckets.outer_level));
    writer.writeMetadata("fine_level", std::to_string(buckets.fine_level));
    writer.commit();
  } catch (...) {
    writer.rollback();
    throw;
  }
}

} // namespace cellroute
