#include "MediaCopier.hpp"

#include <fstream>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace skya {

namespace fs = std::filesystem;

void copyMediaFile(const fs::path& src, const fs::path& dst) {
  std::ifstream in(src, std::ios::binary);
  if (!in) throw std::runtime_error("failed to open source file: " + src.string());

  std::error_code ec;
  fs::create_directories(dst.parent_path(), ec);
  if (ec) throw std::runtime_error("failed to create destination directory: " + ec.message());

  std::ofstream os(dst, std::ios::binary | std::ios::trunc);
  if (!os) throw std::runtime_error("failed to create destination file: " + dst.string());

  // an empty source makes operator<< set failbit without writing anything
  if (in.peek() != std::ifstream::traits_type::eof()) os << in.rdbuf();
  os.flush();
  if (!os || in.bad()) throw std::runtime_error("failed to copy " + src.string());
}

size_t copyMediaFiles(const MediaCopyMap& files, const MediaProgressFn& onProgress) {
  size_t copied = 0;
  for (const auto& [src, dst] : files) {
    std::error_code ec;
    if (!fs::exists(src, ec)) {
      spdlog::warn("media file not found: {}", src.string());
      continue;
    }
    try {
      copyMediaFile(src, dst);
    } catch (const std::exception& e) {
      spdlog::warn("failed to copy media {}: {}", src.string(), e.what());
      continue;
    }
    ++copied;
    if (onProgress) onProgress(copied);
  }
  return copied;
}

std::string mediaExtension(const Media& m) {
  const std::string ext = fs::path(m.file_path).extension().string();
  if (ext.size() > 1) return ext.substr(1);

  if (m.mime_type == "image/jpeg") return "jpg";
  if (m.mime_type == "image/png") return "png";
  if (m.mime_type == "image/gif") return "gif";
  if (m.mime_type == "image/webp") return "webp";
  if (m.mime_type == "video/mp4") return "mp4";
  return "bin";
}

} // namespace skya
