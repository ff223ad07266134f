#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace skya {

// One archived post. Timestamps are Unix seconds (UTC).
struct Post {
  std::string uri;
  std::string cid;
  std::string did;
  std::string text;
  int64_t     created_at = 0;
  int64_t     indexed_at = 0;
  bool        has_media = false;
  int64_t     like_count = 0;
  int64_t     repost_count = 0;
  int64_t     reply_count = 0;
  int64_t     quote_count = 0;
  bool        is_reply = false;
  std::string reply_parent;
  std::string embed_type;
  std::string embed_data;   // raw JSON, empty if none
  std::string labels;       // raw JSON, empty if none
  int64_t     archived_at = 0;
};

// One stored media blob, keyed by content hash.
struct Media {
  std::string hash;
  std::string post_uri;
  std::string mime_type;
  std::string file_path;
  int64_t     size_bytes = 0;
  int64_t     width = 0;
  int64_t     height = 0;
  std::string alt_text;
  int64_t     created_at = 0;
};

// Inclusive creation-time filter. Either bound may be absent.
struct DateRange {
  std::optional<int64_t> start;
  std::optional<int64_t> end;

  bool valid() const { return !(start && end && *end < *start); }
  bool empty() const { return !start && !end; }
};

} // namespace skya
