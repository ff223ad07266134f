#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/archive/ArchiveTypes.hpp"

namespace skya {

enum class ExportFormat { Json, Csv };

enum class ExportStatus { Queued, Running, Completed, Failed };

const char* formatName(ExportFormat f);
const char* statusName(ExportStatus s);

// Accepts "json" or "csv"; throws ValidationError otherwise.
ExportFormat parseFormat(const std::string& s);

bool isActive(ExportStatus s);

// Request parameters. Built once per request and never mutated.
struct ExportOptions {
  ExportFormat             format = ExportFormat::Json;
  std::string              did;
  bool                     include_media = false;
  std::optional<DateRange> date_range;
  std::string              output_dir = "./exports";

  // Throws ValidationError.
  void validate() const;
};

struct ExportProgress {
  int64_t      posts_processed = 0;
  int64_t      posts_total = 0;
  int64_t      media_copied = 0;
  int64_t      media_total = 0;
  ExportStatus status = ExportStatus::Queued;
  std::string  error;
  std::string  message;  // informational, e.g. empty archive

  int percentComplete() const;
};

struct ExportJob {
  std::string            id;
  ExportOptions          options;
  int64_t                created_at = 0;
  std::optional<int64_t> completed_at;
  ExportProgress         progress;
  std::string            export_dir;
};

// Audit entry for a completed export; exists only while its directory does.
struct ExportRecord {
  std::string            id;      // <did>/<directory name>
  std::string            did;
  std::string            format;
  int64_t                created_at = 0;
  std::string            directory_path;
  int64_t                post_count = 0;
  int64_t                media_count = 0;
  int64_t                size_bytes = 0;
  std::optional<int64_t> date_range_start;
  std::optional<int64_t> date_range_end;
  std::string            manifest_path;

  // Throws ValidationError.
  void validate() const;
  std::string humanSize() const;
  std::string dateRangeString() const;
};

struct ExportManifest {
  std::string              export_format;
  int64_t                  export_timestamp = 0;
  int64_t                  post_count = 0;
  int64_t                  media_count = 0;
  std::optional<DateRange> date_range;
  std::string              version;
  std::vector<std::string> files;
};

// Parses a YYYY-MM-DD request parameter as UTC midnight.
// end_of_day moves the result to 23:59:59 of that day.
int64_t parseDateParam(const std::string& s, bool end_of_day);

// Builds a date range from request strings (either may be empty) and checks
// ordering and that neither bound is after `now`. Returns nullopt when both
// strings are empty. Throws ValidationError.
std::optional<DateRange> parseDateRange(const std::string& start,
                                        const std::string& end,
                                        int64_t now);

} // namespace skya
