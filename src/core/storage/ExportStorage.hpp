#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace skya {

// Rough on-disk cost of one exported post (JSON with embed, or a CSV row).
constexpr uint64_t kEstimatedBytesPerPost = 2048;
// Manifest plus filesystem slack.
constexpr uint64_t kExportOverheadBytes = 64 * 1024;

class DiskSpaceProbe {
public:
  virtual ~DiskSpaceProbe() = default;
  // Bytes available to an unprivileged writer on the filesystem holding path.
  virtual uint64_t availableBytes(const std::filesystem::path& path) = 0;
};

class FilesystemSpaceProbe : public DiskSpaceProbe {
public:
  uint64_t availableBytes(const std::filesystem::path& path) override;
};

uint64_t estimateExportBytes(int64_t postCount, uint64_t mediaBytes);

// Throws InsufficientSpaceError when fewer than requiredBytes are free.
void checkDiskSpace(DiskSpaceProbe& probe,
                    const std::filesystem::path& path,
                    uint64_t requiredBytes);

constexpr int kMaxDirectoryAttempts = 100;

// Creates <root>/<did>/<YYYY-MM-DD_HH-MM-SS> (UTC) and returns it. When that
// name is taken the next free <timestamp>_2, _3, ... is used; an existing
// directory is never reused.
std::filesystem::path createExportDirectory(const std::filesystem::path& root,
                                            const std::string& did,
                                            int64_t now);

// Best-effort recursive removal; failures are logged and reported as false.
bool removeExportDirectory(const std::filesystem::path& dir) noexcept;

// Sum of regular file sizes below dir.
int64_t directorySize(const std::filesystem::path& dir);

// Top-level files, sorted by name; a media/ subdirectory is summarized as
// "media/ (N files)".
std::vector<std::string> listExportFiles(const std::filesystem::path& dir);

} // namespace skya
