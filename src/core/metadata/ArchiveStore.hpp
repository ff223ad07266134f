#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/archive/PostSource.hpp"
#include "core/export/ExportRecordStore.hpp"

namespace skya {

// SQLite-backed archive: posts and media (read by exports) and the
// exports audit table. One connection opened in serialized mode, shared by
// every export thread.
class ArchiveStore : public PostSource, public ExportRecordStore {
public:
  explicit ArchiveStore(const std::string& dbPath);
  ~ArchiveStore() override;

  ArchiveStore(const ArchiveStore&) = delete;
  ArchiveStore& operator=(const ArchiveStore&) = delete;

  // Row insertion for seeding and fixtures; the collector owns real ingestion.
  void insertPost(const Post& p);
  void insertPosts(const std::vector<Post>& posts);
  void insertMedia(const Media& m);

  // PostSource
  int64_t countPosts(const std::string& did,
                     const std::optional<DateRange>& range) override;
  std::vector<Post> fetchPosts(const std::string& did,
                               const std::optional<DateRange>& range,
                               int limit,
                               int offset) override;
  std::vector<Media> mediaForPost(const std::string& post_uri) override;

  // ExportRecordStore
  void createExportRecord(const ExportRecord& r) override;
  std::optional<ExportRecord> getExportById(const std::string& id) override;
  std::vector<ExportRecord> listExportsByDid(const std::string& did,
                                             int limit,
                                             int offset) override;
  int64_t countExportsByDid(const std::string& did) override;
  bool deleteExportRecord(const std::string& id) override;

private:
  void exec(const char* sql);

  void* db_; // sqlite3*
};

} // namespace skya
