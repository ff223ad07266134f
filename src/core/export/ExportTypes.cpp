#include "ExportTypes.hpp"

#include <cstdio>

#include "ExportErrors.hpp"
#include "core/util/TimeFormat.hpp"

namespace skya {

const char* formatName(ExportFormat f) {
  switch (f) {
    case ExportFormat::Json: return "json";
    case ExportFormat::Csv:  return "csv";
  }
  return "json";
}

const char* statusName(ExportStatus s) {
  switch (s) {
    case ExportStatus::Queued:    return "queued";
    case ExportStatus::Running:   return "running";
    case ExportStatus::Completed: return "completed";
    case ExportStatus::Failed:    return "failed";
  }
  return "queued";
}

ExportFormat parseFormat(const std::string& s) {
  if (s == "json") return ExportFormat::Json;
  if (s == "csv") return ExportFormat::Csv;
  throw ValidationError("format must be 'json' or 'csv'");
}

bool isActive(ExportStatus s) {
  return s == ExportStatus::Queued || s == ExportStatus::Running;
}

static bool unsafe_path_component(const std::string& s) {
  return s.find('/') != std::string::npos ||
         s.find('\\') != std::string::npos ||
         s.find("..") != std::string::npos ||
         s.find('\0') != std::string::npos;
}

void ExportOptions::validate() const {
  if (did.empty()) throw ValidationError("DID is required");
  if (unsafe_path_component(did)) throw ValidationError("DID contains path characters");
  if (output_dir.empty()) throw ValidationError("output directory is required");
  if (date_range && !date_range->valid()) {
    throw ValidationError("invalid date range: end date must be after start date");
  }
}

int ExportProgress::percentComplete() const {
  if (posts_total <= 0) return 0;
  return static_cast<int>((posts_processed * 100) / posts_total);
}

void ExportRecord::validate() const {
  if (id.empty()) throw ValidationError("ID is required");
  if (did.empty()) throw ValidationError("DID is required");
  if (format != "json" && format != "csv") throw ValidationError("format must be 'json' or 'csv'");
  if (post_count < 0) throw ValidationError("post count must be >= 0");
  if (media_count < 0) throw ValidationError("media count must be >= 0");
  if (size_bytes < 0) throw ValidationError("size must be >= 0");
  if (date_range_start && date_range_end && *date_range_end < *date_range_start) {
    throw ValidationError("date range end must be after start");
  }
  if (directory_path.empty()) throw ValidationError("directory path is required");
  if (directory_path.find("..") != std::string::npos) {
    throw ValidationError("invalid directory path: path traversal not allowed");
  }
  if (directory_path.find('\0') != std::string::npos) {
    throw ValidationError("invalid directory path: null bytes not allowed");
  }
}

std::string ExportRecord::humanSize() const {
  const int64_t unit = 1024;
  if (size_bytes < unit) return std::to_string(size_bytes) + " B";
  int64_t div = unit;
  int exp = 0;
  for (int64_t n = size_bytes / unit; n >= unit; n /= unit) {
    div *= unit;
    ++exp;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f %cB",
                static_cast<double>(size_bytes) / static_cast<double>(div),
                "KMGTPE"[exp]);
  return buf;
}

std::string ExportRecord::dateRangeString() const {
  if (!date_range_start && !date_range_end) return "All posts";
  if (date_range_start && date_range_end) {
    return format_date(*date_range_start) + " to " + format_date(*date_range_end);
  }
  if (date_range_start) return "From " + format_date(*date_range_start);
  return "Until " + format_date(*date_range_end);
}

int64_t parseDateParam(const std::string& s, bool end_of_day) {
  int64_t t = 0;
  if (!parse_ymd(s, t)) throw ValidationError("invalid date '" + s + "', expected YYYY-MM-DD");
  return end_of_day ? t + 23 * 3600 + 59 * 60 + 59 : t;
}

std::optional<DateRange> parseDateRange(const std::string& start,
                                        const std::string& end,
                                        int64_t now) {
  if (start.empty() && end.empty()) return std::nullopt;

  DateRange r;
  if (!start.empty()) r.start = parseDateParam(start, false);
  if (!end.empty()) r.end = parseDateParam(end, true);

  if (!r.valid()) throw ValidationError("end date must be after start date");
  if (r.start && *r.start > now) throw ValidationError("start date cannot be in the future");
  // An end date of today is extended to 23:59:59 and may lie ahead of `now`.
  if (r.end && *r.end - (23 * 3600 + 59 * 60 + 59) > now) {
    throw ValidationError("end date cannot be in the future");
  }
  return r;
}

} // namespace skya
