#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <string>

#include "core/archive/ArchiveTypes.hpp"

namespace skya {

// source path -> destination path, one entry per content hash
using MediaCopyMap = std::map<std::filesystem::path, std::filesystem::path>;

// Called after each successful copy with the running count. Must not block.
using MediaProgressFn = std::function<void(size_t copied)>;

// Byte-stream copy of one file; creates the destination directory.
// Throws std::runtime_error.
void copyMediaFile(const std::filesystem::path& src, const std::filesystem::path& dst);

// Copies every entry. Missing sources and failed copies are logged and
// skipped. Returns the number of files copied.
size_t copyMediaFiles(const MediaCopyMap& files, const MediaProgressFn& onProgress = {});

// File extension for a stored blob: taken from its path when it has one,
// otherwise derived from the MIME type ("bin" when unknown).
std::string mediaExtension(const Media& m);

} // namespace skya
