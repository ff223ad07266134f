#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "PostSource.hpp"

namespace skya {

// Walks one owner's posts in fixed-size pages ordered by
// (created_at DESC, uri ASC). A page shorter than the page size ends the
// walk, as does an empty page or reaching `limit` posts (when limit >= 0).
class Paginator {
public:
  Paginator(PostSource& source,
            std::string did,
            std::optional<DateRange> range,
            int pageSize = kDefaultPageSize,
            int64_t limit = -1);

  // One page at an explicit offset. Non-positive page sizes fall back to
  // kDefaultPageSize, negative offsets are clamped to zero.
  static std::vector<Post> fetchPage(PostSource& source,
                                     const std::string& did,
                                     const std::optional<DateRange>& range,
                                     int pageSize,
                                     int64_t offset);

  // Next page, or an empty vector once done().
  std::vector<Post> next();

  bool done() const { return done_; }
  int pageSize() const { return pageSize_; }
  int64_t offset() const { return offset_; }
  int rounds() const { return rounds_; }

private:
  PostSource&              source_;
  std::string              did_;
  std::optional<DateRange> range_;
  int                      pageSize_;
  int64_t                  limit_;
  int64_t                  offset_ = 0;
  int                      rounds_ = 0;
  bool                     done_ = false;
};

} // namespace skya
