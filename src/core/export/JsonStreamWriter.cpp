#include "JsonStreamWriter.hpp"

#include <stdexcept>
#include <string>

#include "PostProjection.hpp"

namespace skya {

JsonStreamWriter::JsonStreamWriter(const std::filesystem::path& path)
  : path_(path), out_(path, std::ios::binary | std::ios::trunc) {
  if (!out_) throw std::runtime_error("failed to create JSON file: " + path.string());
  out_ << '[';
  checkStream("write opening bracket");
}

void JsonStreamWriter::checkStream(const char* what) {
  if (!out_) throw std::runtime_error(std::string("failed to ") + what + ": " + path_.string());
}

void JsonStreamWriter::writePage(const std::vector<Post>& page) {
  if (finished_) throw std::logic_error("JsonStreamWriter used after finish");

  for (const auto& post : page) {
    // dump(2) of an array puts every element on a fresh line, indented one
    // level; nested lines of the element shift by the same two spaces.
    out_ << (first_ ? "\n" : ",\n");
    first_ = false;

    const std::string encoded = dumpRecord(postToJson(post), 2);
    std::string indented;
    indented.reserve(encoded.size() + encoded.size() / 8 + 2);
    indented += "  ";
    for (char c : encoded) {
      indented += c;
      if (c == '\n') indented += "  ";
    }
    out_ << indented;
    ++records_;
  }
  checkStream("write posts");
}

void JsonStreamWriter::finish() {
  if (finished_) return;
  finished_ = true;
  out_ << (first_ ? "]\n" : "\n]\n");
  out_.flush();
  checkStream("write closing bracket");
  out_.close();
  if (out_.fail()) throw std::runtime_error("failed to close JSON file: " + path_.string());
}

} // namespace skya
