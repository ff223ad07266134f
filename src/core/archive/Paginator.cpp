#include "Paginator.hpp"

#include <limits>
#include <utility>

namespace skya {

static int normalizePageSize(int pageSize) {
  return pageSize > 0 ? pageSize : kDefaultPageSize;
}

Paginator::Paginator(PostSource& source,
                     std::string did,
                     std::optional<DateRange> range,
                     int pageSize,
                     int64_t limit)
  : source_(source),
    did_(std::move(did)),
    range_(std::move(range)),
    pageSize_(normalizePageSize(pageSize)),
    limit_(limit) {
  if (limit_ == 0) done_ = true;
}

std::vector<Post> Paginator::fetchPage(PostSource& source,
                                       const std::string& did,
                                       const std::optional<DateRange>& range,
                                       int pageSize,
                                       int64_t offset) {
  if (offset < 0) offset = 0;
  if (offset > std::numeric_limits<int>::max()) return {};
  return source.fetchPosts(did, range, normalizePageSize(pageSize), static_cast<int>(offset));
}

std::vector<Post> Paginator::next() {
  if (done_) return {};

  std::vector<Post> page = fetchPage(source_, did_, range_, pageSize_, offset_);
  ++rounds_;

  if (page.size() < static_cast<size_t>(pageSize_)) done_ = true;

  // Rows added after the count are not part of this walk.
  if (limit_ >= 0) {
    const int64_t remaining = limit_ - offset_;
    if (static_cast<int64_t>(page.size()) >= remaining) {
      page.resize(static_cast<size_t>(remaining));
      done_ = true;
    }
  }

  offset_ += static_cast<int64_t>(page.size());
  if (page.empty()) done_ = true;
  return page;
}

} // namespace skya
