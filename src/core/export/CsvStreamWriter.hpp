#pragma once
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "core/archive/ArchiveTypes.hpp"

namespace skya {

// Writes posts.csv one page at a time: UTF-8 BOM and header once, then rows.
// The stream is flushed after every page so buffered rows never pile up
// across pages.
class CsvStreamWriter {
public:
  explicit CsvStreamWriter(const std::filesystem::path& path);

  CsvStreamWriter(const CsvStreamWriter&) = delete;
  CsvStreamWriter& operator=(const CsvStreamWriter&) = delete;

  void writePage(const std::vector<Post>& page);
  void finish();

  size_t recordsWritten() const { return records_; }

private:
  void writeRow(const std::vector<std::string>& fields);
  void checkStream(const char* what);

  std::filesystem::path path_;
  std::ofstream         out_;
  bool                  finished_ = false;
  size_t                records_ = 0;
};

} // namespace skya
