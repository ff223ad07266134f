#include "InitDb.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace skya {

namespace {

struct DbCloser {
  void operator()(sqlite3* db) const { sqlite3_close(db); }
};
using DbHandle = std::unique_ptr<sqlite3, DbCloser>;

void exec(sqlite3* db, const std::string& sql, const char* what) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db);
    sqlite3_free(err);
    throw std::runtime_error(std::string(what) + " failed: " + msg);
  }
}

int userVersion(sqlite3* db) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, "PRAGMA user_version;", -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("read schema version failed: ") + sqlite3_errmsg(db));
  }
  int version = 0;
  if (sqlite3_step(st) == SQLITE_ROW) version = sqlite3_column_int(st, 0);
  sqlite3_finalize(st);
  return version;
}

std::string readSchema(const std::string& schemaPath) {
  std::ifstream in(schemaPath);
  if (!in) throw std::runtime_error("cannot open schema file: " + schemaPath);
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

DbHandle openForInit(const std::string& dbPath) {
  sqlite3* raw = nullptr;
  const int rc = sqlite3_open_v2(dbPath.c_str(), &raw,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
  DbHandle db(raw);
  if (rc != SQLITE_OK) {
    throw std::runtime_error("open database " + dbPath + " failed: " +
                             (raw ? sqlite3_errmsg(raw) : "out of memory"));
  }
  return db;
}

} // namespace

int initDatabase(const std::string& dbPath, const std::string& schemaPath) {
  const auto parent = std::filesystem::path(dbPath).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent);

  const std::string schema = readSchema(schemaPath);
  DbHandle db = openForInit(dbPath);

  const int before = userVersion(db.get());
  if (before > kSchemaVersion) {
    throw std::runtime_error("database " + dbPath + " has schema version " + std::to_string(before) +
                             ", this build supports up to " + std::to_string(kSchemaVersion));
  }

  exec(db.get(), "PRAGMA busy_timeout=5000;", "set busy timeout");
  // journal_mode cannot change inside a transaction
  exec(db.get(), "PRAGMA journal_mode=WAL;", "enable WAL");
  exec(db.get(), "PRAGMA synchronous=NORMAL;", "set synchronous");

  exec(db.get(), "BEGIN IMMEDIATE;", "begin schema transaction");
  try {
    exec(db.get(), schema, "apply schema");
    exec(db.get(), "PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";", "stamp schema version");
    exec(db.get(), "COMMIT;", "commit schema");
  } catch (const std::exception&) {
    if (sqlite3_exec(db.get(), "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
      spdlog::warn("schema rollback failed: {}", sqlite3_errmsg(db.get()));
    }
    throw;
  }

  if (before != kSchemaVersion) {
    spdlog::info("database {} upgraded from schema version {} to {}", dbPath, before, kSchemaVersion);
  }
  return before;
}

} // namespace skya
