#include "ManifestWriter.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

#include "core/util/TimeFormat.hpp"

#ifndef SKYA_VERSION
#define SKYA_VERSION "dev"
#endif

using nlohmann::json;

namespace skya {

const char* toolVersion() { return SKYA_VERSION; }

ExportManifest generateManifest(ExportFormat format,
                                int64_t postCount,
                                int64_t mediaCount,
                                const std::optional<DateRange>& range,
                                std::vector<std::string> files,
                                int64_t now) {
  ExportManifest m;
  m.export_format    = formatName(format);
  m.export_timestamp = now;
  m.post_count       = postCount;
  m.media_count      = mediaCount;
  m.date_range       = range;
  m.version          = toolVersion();
  m.files            = std::move(files);
  return m;
}

json manifestToJson(const ExportManifest& m) {
  json j = {
    {"export_format", m.export_format},
    {"export_timestamp", format_iso8601(m.export_timestamp)},
    {"post_count", m.post_count},
    {"media_count", m.media_count},
    {"version", m.version},
    {"files", m.files},
  };
  if (m.date_range && !m.date_range->empty()) {
    json range = json::object();
    range["start_date"] = m.date_range->start ? json(format_iso8601(*m.date_range->start)) : json(nullptr);
    range["end_date"] = m.date_range->end ? json(format_iso8601(*m.date_range->end)) : json(nullptr);
    j["date_range"] = range;
  }
  return j;
}

void writeManifest(const std::filesystem::path& path, const ExportManifest& m) {
  std::ofstream os(path, std::ios::binary | std::ios::trunc);
  if (!os) throw std::runtime_error("failed to create manifest file: " + path.string());
  os << manifestToJson(m).dump(2) << '\n';
  os.flush();
  if (!os) throw std::runtime_error("failed to write manifest: " + path.string());
}

} // namespace skya
