#include "ArchiveStore.hpp"
#include <stdexcept>
#include <sqlite3.h>
#include <spdlog/spdlog.h>

namespace skya {

namespace {

// Prepared statement that finalizes itself. Errors carry the operation name
// and sqlite3_errmsg.
class Stmt {
public:
  Stmt(sqlite3* db, const char* sql, const char* what) : db_(db), what_(what) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) fail();
  }
  ~Stmt() { sqlite3_finalize(st_); }

  Stmt(const Stmt&) = delete;
  Stmt& operator=(const Stmt&) = delete;

  void text(int i, const std::string& v) {
    check(sqlite3_bind_text(st_, i, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT));
  }
  void textOrNull(int i, const std::string& v) {
    if (v.empty()) check(sqlite3_bind_null(st_, i));
    else text(i, v);
  }
  void int64(int i, int64_t v) { check(sqlite3_bind_int64(st_, i, v)); }
  void int64OrNull(int i, const std::optional<int64_t>& v) {
    if (v) int64(i, *v);
    else check(sqlite3_bind_null(st_, i));
  }

  // true while rows remain
  bool step() {
    const int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    fail();
  }

  void run() {
    if (step()) throw std::runtime_error(std::string(what_) + " failed: unexpected row");
  }

  std::string colText(int c) const {
    const auto* p = sqlite3_column_text(st_, c);
    if (!p) return {};
    return std::string(reinterpret_cast<const char*>(p),
                       static_cast<size_t>(sqlite3_column_bytes(st_, c)));
  }
  int64_t colInt64(int c) const { return sqlite3_column_int64(st_, c); }
  std::optional<int64_t> colOptInt64(int c) const {
    if (sqlite3_column_type(st_, c) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int64(st_, c);
  }

private:
  void check(int rc) { if (rc != SQLITE_OK) fail(); }
  [[noreturn]] void fail() {
    throw std::runtime_error(std::string(what_) + " failed: " + sqlite3_errmsg(db_));
  }

  sqlite3*      db_;
  const char*   what_;
  sqlite3_stmt* st_ = nullptr;
};

constexpr const char* kPostColumns = R"SQL(
  uri, cid, did, text, created_at, indexed_at,
  has_media, like_count, repost_count, reply_count, quote_count,
  is_reply, reply_parent, embed_type, embed_data, labels, archived_at
)SQL";

constexpr const char* kExportColumns = R"SQL(
  id, did, format, created_at, directory_path,
  post_count, media_count, size_bytes,
  date_range_start, date_range_end, manifest_path
)SQL";

// The same predicate is used by the count and by every page, so the counted
// total and the exported rows agree.
std::string postFilter(const std::optional<DateRange>& range) {
  std::string where = " WHERE did = ?";
  if (range && range->start) where += " AND created_at >= ?";
  if (range && range->end) where += " AND created_at <= ?";
  return where;
}

int bindPostFilter(Stmt& st, const std::string& did, const std::optional<DateRange>& range) {
  int i = 1;
  st.text(i++, did);
  if (range && range->start) st.int64(i++, *range->start);
  if (range && range->end) st.int64(i++, *range->end);
  return i;
}

Post readPost(const Stmt& st) {
  Post p;
  int c = 0;
  p.uri          = st.colText(c++);
  p.cid          = st.colText(c++);
  p.did          = st.colText(c++);
  p.text         = st.colText(c++);
  p.created_at   = st.colInt64(c++);
  p.indexed_at   = st.colInt64(c++);
  p.has_media    = st.colInt64(c++) != 0;
  p.like_count   = st.colInt64(c++);
  p.repost_count = st.colInt64(c++);
  p.reply_count  = st.colInt64(c++);
  p.quote_count  = st.colInt64(c++);
  p.is_reply     = st.colInt64(c++) != 0;
  p.reply_parent = st.colText(c++);
  p.embed_type   = st.colText(c++);
  p.embed_data   = st.colText(c++);
  p.labels       = st.colText(c++);
  p.archived_at  = st.colInt64(c++);
  return p;
}

ExportRecord readExport(const Stmt& st) {
  ExportRecord e;
  int c = 0;
  e.id               = st.colText(c++);
  e.did              = st.colText(c++);
  e.format           = st.colText(c++);
  e.created_at       = st.colInt64(c++);
  e.directory_path   = st.colText(c++);
  e.post_count       = st.colInt64(c++);
  e.media_count      = st.colInt64(c++);
  e.size_bytes       = st.colInt64(c++);
  e.date_range_start = st.colOptInt64(c++);
  e.date_range_end   = st.colOptInt64(c++);
  e.manifest_path    = st.colText(c++);
  return e;
}

} // namespace

ArchiveStore::ArchiveStore(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db,
                      SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw std::runtime_error("failed to open db " + dbPath + ": " + msg);
  }
  db_ = db;
  try {
    exec("PRAGMA foreign_keys=ON;");
    exec("PRAGMA busy_timeout=5000;");
  } catch (...) {
    sqlite3_close(db);
    throw;
  }
}

ArchiveStore::~ArchiveStore() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

void ArchiveStore::exec(const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(static_cast<sqlite3*>(db_), sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw std::runtime_error("SQLite exec failed: " + msg);
  }
}

void ArchiveStore::insertPost(const Post& p) {
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    INSERT INTO posts
      (uri, cid, did, text, created_at, indexed_at,
       has_media, like_count, repost_count, reply_count, quote_count,
       is_reply, reply_parent, embed_type, embed_data, labels, archived_at)
    VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)
    ON CONFLICT(uri) DO UPDATE SET
      cid = excluded.cid,
      text = excluded.text,
      indexed_at = excluded.indexed_at,
      has_media = excluded.has_media,
      like_count = excluded.like_count,
      repost_count = excluded.repost_count,
      reply_count = excluded.reply_count,
      quote_count = excluded.quote_count,
      embed_type = excluded.embed_type,
      embed_data = excluded.embed_data,
      labels = excluded.labels
  )SQL";
  Stmt st(db, sql, "insertPost");
  int i = 1;
  st.text(i++, p.uri);
  st.text(i++, p.cid);
  st.text(i++, p.did);
  st.text(i++, p.text);
  st.int64(i++, p.created_at);
  st.int64(i++, p.indexed_at);
  st.int64(i++, p.has_media ? 1 : 0);
  st.int64(i++, p.like_count);
  st.int64(i++, p.repost_count);
  st.int64(i++, p.reply_count);
  st.int64(i++, p.quote_count);
  st.int64(i++, p.is_reply ? 1 : 0);
  st.textOrNull(i++, p.reply_parent);
  st.textOrNull(i++, p.embed_type);
  st.textOrNull(i++, p.embed_data);
  st.textOrNull(i++, p.labels);
  st.int64(i++, p.archived_at);
  st.run();
}

void ArchiveStore::insertPosts(const std::vector<Post>& posts) {
  exec("BEGIN IMMEDIATE;");
  try {
    for (const auto& p : posts) insertPost(p);
  } catch (...) {
    char* err = nullptr;
    if (sqlite3_exec(static_cast<sqlite3*>(db_), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
      spdlog::error("insertPosts rollback failed: {}", err ? err : "unknown error");
      sqlite3_free(err);
    }
    throw;
  }
  exec("COMMIT;");
}

void ArchiveStore::insertMedia(const Media& m) {
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    INSERT INTO media
      (hash, post_uri, mime_type, file_path, size_bytes, width, height, alt_text, created_at)
    VALUES (?,?,?,?,?,?,?,?,?)
    ON CONFLICT(hash) DO UPDATE SET
      post_uri = excluded.post_uri,
      mime_type = excluded.mime_type,
      file_path = excluded.file_path,
      size_bytes = excluded.size_bytes,
      width = excluded.width,
      height = excluded.height,
      alt_text = excluded.alt_text
  )SQL";
  Stmt st(db, sql, "insertMedia");
  int i = 1;
  st.text(i++, m.hash);
  st.text(i++, m.post_uri);
  st.text(i++, m.mime_type);
  st.text(i++, m.file_path);
  st.int64(i++, m.size_bytes);
  st.int64(i++, m.width);
  st.int64(i++, m.height);
  st.textOrNull(i++, m.alt_text);
  st.int64(i++, m.created_at);
  st.run();
}

int64_t ArchiveStore::countPosts(const std::string& did,
                                 const std::optional<DateRange>& range) {
  const std::string sql = "SELECT COUNT(*) FROM posts" + postFilter(range);
  Stmt st(static_cast<sqlite3*>(db_), sql.c_str(), "countPosts");
  bindPostFilter(st, did, range);
  if (!st.step()) throw std::runtime_error("countPosts failed: no result row");
  return st.colInt64(0);
}

std::vector<Post> ArchiveStore::fetchPosts(const std::string& did,
                                           const std::optional<DateRange>& range,
                                           int limit,
                                           int offset) {
  if (limit <= 0) limit = kDefaultPageSize;
  if (offset < 0) offset = 0;

  // uri breaks created_at ties so re-issued pages never skip or repeat rows
  const std::string sql = std::string("SELECT ") + kPostColumns + " FROM posts" +
                          postFilter(range) +
                          " ORDER BY created_at DESC, uri ASC LIMIT ? OFFSET ?";
  Stmt st(static_cast<sqlite3*>(db_), sql.c_str(), "fetchPosts");
  int i = bindPostFilter(st, did, range);
  st.int64(i++, limit);
  st.int64(i++, offset);

  std::vector<Post> out;
  out.reserve(static_cast<size_t>(limit));
  while (st.step()) out.push_back(readPost(st));
  return out;
}

std::vector<Media> ArchiveStore::mediaForPost(const std::string& post_uri) {
  const char* sql = R"SQL(
    SELECT hash, post_uri, mime_type, file_path, size_bytes,
           width, height, alt_text, created_at
    FROM media
    WHERE post_uri = ?
    ORDER BY created_at ASC, hash ASC
  )SQL";
  Stmt st(static_cast<sqlite3*>(db_), sql, "mediaForPost");
  st.text(1, post_uri);

  std::vector<Media> out;
  while (st.step()) {
    Media m;
    int c = 0;
    m.hash       = st.colText(c++);
    m.post_uri   = st.colText(c++);
    m.mime_type  = st.colText(c++);
    m.file_path  = st.colText(c++);
    m.size_bytes = st.colInt64(c++);
    m.width      = st.colInt64(c++);
    m.height     = st.colInt64(c++);
    m.alt_text   = st.colText(c++);
    m.created_at = st.colInt64(c++);
    out.push_back(std::move(m));
  }
  return out;
}

void ArchiveStore::createExportRecord(const ExportRecord& r) {
  r.validate();
  const std::string sql = std::string("INSERT INTO exports (") + kExportColumns +
                          ") VALUES (?,?,?,?,?,?,?,?,?,?,?)";
  Stmt st(static_cast<sqlite3*>(db_), sql.c_str(), "createExportRecord");
  int i = 1;
  st.text(i++, r.id);
  st.text(i++, r.did);
  st.text(i++, r.format);
  st.int64(i++, r.created_at);
  st.text(i++, r.directory_path);
  st.int64(i++, r.post_count);
  st.int64(i++, r.media_count);
  st.int64(i++, r.size_bytes);
  st.int64OrNull(i++, r.date_range_start);
  st.int64OrNull(i++, r.date_range_end);
  st.textOrNull(i++, r.manifest_path);
  st.run();
}

std::optional<ExportRecord> ArchiveStore::getExportById(const std::string& id) {
  const std::string sql = std::string("SELECT ") + kExportColumns + " FROM exports WHERE id = ?";
  Stmt st(static_cast<sqlite3*>(db_), sql.c_str(), "getExportById");
  st.text(1, id);
  if (!st.step()) return std::nullopt;
  return readExport(st);
}

std::vector<ExportRecord> ArchiveStore::listExportsByDid(const std::string& did,
                                                         int limit,
                                                         int offset) {
  if (limit <= 0) limit = 50;
  if (offset < 0) offset = 0;
  const std::string sql = std::string("SELECT ") + kExportColumns +
                          " FROM exports WHERE did = ? ORDER BY created_at DESC, id DESC LIMIT ? OFFSET ?";
  Stmt st(static_cast<sqlite3*>(db_), sql.c_str(), "listExportsByDid");
  st.text(1, did);
  st.int64(2, limit);
  st.int64(3, offset);

  std::vector<ExportRecord> out;
  while (st.step()) out.push_back(readExport(st));
  return out;
}

int64_t ArchiveStore::countExportsByDid(const std::string& did) {
  Stmt st(static_cast<sqlite3*>(db_), "SELECT COUNT(*) FROM exports WHERE did = ?",
          "countExportsByDid");
  st.text(1, did);
  if (!st.step()) throw std::runtime_error("countExportsByDid failed: no result row");
  return st.colInt64(0);
}

bool ArchiveStore::deleteExportRecord(const std::string& id) {
  auto* db = static_cast<sqlite3*>(db_);
  Stmt st(db, "DELETE FROM exports WHERE id = ?", "deleteExportRecord");
  st.text(1, id);
  st.run();
  return sqlite3_changes(db) > 0;
}

} // namespace skya
