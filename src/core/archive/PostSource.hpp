#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ArchiveTypes.hpp"

namespace skya {

constexpr int kDefaultPageSize = 1000;

// Read side of the archive as seen by the export pipeline.
// fetchPosts must order by (created_at DESC, uri ASC).
class PostSource {
public:
  virtual ~PostSource() = default;

  virtual int64_t countPosts(const std::string& did,
                             const std::optional<DateRange>& range) = 0;

  virtual std::vector<Post> fetchPosts(const std::string& did,
                                       const std::optional<DateRange>& range,
                                       int limit,
                                       int offset) = 0;

  virtual std::vector<Media> mediaForPost(const std::string& post_uri) = 0;
};

} // namespace skya
