#pragma once
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <vector>

#include "core/archive/ArchiveTypes.hpp"

namespace skya {

// Writes posts.json one page at a time. The finished file is byte-identical
// to nlohmann::json::dump(2) of the whole array followed by a newline, no
// matter how the records were split into pages.
class JsonStreamWriter {
public:
  // Truncates/creates the file and writes the opening bracket.
  explicit JsonStreamWriter(const std::filesystem::path& path);

  JsonStreamWriter(const JsonStreamWriter&) = delete;
  JsonStreamWriter& operator=(const JsonStreamWriter&) = delete;

  void writePage(const std::vector<Post>& page);

  // Closing bracket, flush, close. Must be called exactly once.
  void finish();

  size_t recordsWritten() const { return records_; }

private:
  void checkStream(const char* what);

  std::filesystem::path path_;
  std::ofstream         out_;
  bool                  first_ = true;
  bool                  finished_ = false;
  size_t                records_ = 0;
};

} // namespace skya
