#include "CsvStreamWriter.hpp"

#include <stdexcept>

#include "PostProjection.hpp"

namespace skya {

static constexpr char kUtf8Bom[] = "\xEF\xBB\xBF";

CsvStreamWriter::CsvStreamWriter(const std::filesystem::path& path)
  : path_(path), out_(path, std::ios::binary | std::ios::trunc) {
  if (!out_) throw std::runtime_error("failed to create CSV file: " + path.string());
  // spreadsheet apps need the BOM to detect UTF-8
  out_ << kUtf8Bom;
  writeRow(csvHeader());
  out_.flush();
  checkStream("write CSV header");
}

void CsvStreamWriter::checkStream(const char* what) {
  if (!out_) throw std::runtime_error(std::string("failed to ") + what + ": " + path_.string());
}

void CsvStreamWriter::writeRow(const std::vector<std::string>& fields) {
  std::string line;
  for (size_t i = 0; i < fields.size(); ++i) {
    if (i) line += ',';
    line += csvEscape(fields[i]);
  }
  line += '\n';
  out_ << line;
}

void CsvStreamWriter::writePage(const std::vector<Post>& page) {
  if (finished_) throw std::logic_error("CsvStreamWriter used after finish");
  for (const auto& post : page) {
    writeRow(postToCsvRow(post));
    ++records_;
  }
  out_.flush();
  checkStream("write CSV rows");
}

void CsvStreamWriter::finish() {
  if (finished_) return;
  finished_ = true;
  out_.flush();
  checkStream("flush CSV file");
  out_.close();
  if (out_.fail()) throw std::runtime_error("failed to close CSV file: " + path_.string());
}

} // namespace skya
