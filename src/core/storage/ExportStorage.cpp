#include "ExportStorage.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>
#include <stdexcept>

#include "core/export/ExportErrors.hpp"
#include "core/util/TimeFormat.hpp"

namespace skya {

namespace fs = std::filesystem;

uint64_t FilesystemSpaceProbe::availableBytes(const fs::path& path) {
  std::error_code ec;
  const fs::space_info info = fs::space(path, ec);
  if (ec) throw std::runtime_error("failed to check disk space for " + path.string() + ": " + ec.message());
  return static_cast<uint64_t>(info.available);
}

uint64_t estimateExportBytes(int64_t postCount, uint64_t mediaBytes) {
  const uint64_t posts = postCount > 0 ? static_cast<uint64_t>(postCount) : 0;
  return posts * kEstimatedBytesPerPost + mediaBytes + kExportOverheadBytes;
}

void checkDiskSpace(DiskSpaceProbe& probe, const fs::path& path, uint64_t requiredBytes) {
  const uint64_t available = probe.availableBytes(path);
  if (available < requiredBytes) {
    throw InsufficientSpaceError("insufficient disk space: need " + std::to_string(requiredBytes) +
                                 " bytes, have " + std::to_string(available) + " bytes available");
  }
}

fs::path createExportDirectory(const fs::path& root, const std::string& did, int64_t now) {
  const fs::path userDir = root / did;
  std::error_code ec;
  fs::create_directories(userDir, ec);
  if (ec) throw std::runtime_error("failed to create user export directory: " + ec.message());

  // The leaf must be new: a directory that already exists belongs to another export.
  const std::string base = format_dir_timestamp(now);
  for (int n = 1; n <= kMaxDirectoryAttempts; ++n) {
    const fs::path dir = userDir / (n == 1 ? base : base + "_" + std::to_string(n));
    if (fs::create_directory(dir, ec)) return dir;
    if (ec) throw std::runtime_error("failed to create export directory: " + ec.message());
  }
  throw std::runtime_error("failed to create export directory: " + base +
                           " and its numbered variants already exist");
}

bool removeExportDirectory(const fs::path& dir) noexcept {
  if (dir.empty()) return true;
  std::error_code ec;
  fs::remove_all(dir, ec);
  if (ec) {
    spdlog::warn("failed to remove export directory {}: {}", dir.string(), ec.message());
    return false;
  }
  return true;
}

int64_t directorySize(const fs::path& dir) {
  int64_t total = 0;
  std::error_code ec;
  for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code fec;
    if (it->is_regular_file(fec)) {
      const auto sz = it->file_size(fec);
      if (!fec) total += static_cast<int64_t>(sz);
    }
  }
  if (ec) throw std::runtime_error("failed to walk export directory " + dir.string() + ": " + ec.message());
  return total;
}

std::vector<std::string> listExportFiles(const fs::path& dir) {
  std::vector<std::string> files;
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (it->is_directory()) {
      if (name != "media") continue;
      size_t count = 0;
      std::error_code mec;
      for (fs::directory_iterator m(it->path(), mec), mend; !mec && m != mend; m.increment(mec)) ++count;
      files.push_back("media/ (" + std::to_string(count) + " files)");
    } else {
      files.push_back(name);
    }
  }
  if (ec) throw std::runtime_error("failed to read export directory " + dir.string() + ": " + ec.message());
  std::sort(files.begin(), files.end());
  return files;
}

} // namespace skya
