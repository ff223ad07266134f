#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ExportTypes.hpp"

namespace skya {

// Version stamped into every manifest (set by the build, "dev" otherwise).
const char* toolVersion();

ExportManifest generateManifest(ExportFormat format,
                                int64_t postCount,
                                int64_t mediaCount,
                                const std::optional<DateRange>& range,
                                std::vector<std::string> files,
                                int64_t now);

nlohmann::json manifestToJson(const ExportManifest& m);

// Pretty-printed manifest.json. Throws std::runtime_error.
void writeManifest(const std::filesystem::path& path, const ExportManifest& m);

} // namespace skya
