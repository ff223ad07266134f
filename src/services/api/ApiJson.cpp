#include "ApiJson.hpp"

#include "core/export/ExportErrors.hpp"
#include "core/util/TimeFormat.hpp"

using nlohmann::json;

namespace skya {

static std::string string_field(const json& body, const char* key) {
  if (!body.contains(key) || body[key].is_null()) return {};
  if (!body[key].is_string()) throw ValidationError(std::string(key) + " must be a string");
  return body[key].get<std::string>();
}

ExportOptions exportRequestFromJson(const json& body, const std::string& did, int64_t now) {
  if (!body.is_object()) throw ValidationError("request body must be a JSON object");

  ExportOptions opts;
  opts.did = did;

  const std::string format = string_field(body, "format");
  opts.format = format.empty() ? ExportFormat::Json : parseFormat(format);

  if (body.contains("include_media") && !body["include_media"].is_null()) {
    if (!body["include_media"].is_boolean()) throw ValidationError("include_media must be a boolean");
    opts.include_media = body["include_media"].get<bool>();
  }

  opts.date_range = parseDateRange(string_field(body, "start_date"),
                                   string_field(body, "end_date"), now);
  return opts;
}

json progressToJson(const ExportJob& job) {
  const ExportProgress& p = job.progress;
  json j = {
    {"job_id", job.id},
    {"status", statusName(p.status)},
    {"posts_processed", p.posts_processed},
    {"posts_total", p.posts_total},
    {"media_copied", p.media_copied},
    {"media_total", p.media_total},
    {"percent_complete", p.percentComplete()},
  };
  if (!p.error.empty()) j["error"] = p.error;
  if (!p.message.empty()) j["message"] = p.message;
  if (!job.export_dir.empty()) j["export_path"] = job.export_dir;
  return j;
}

json recordToJson(const ExportRecord& r) {
  json j = {
    {"id", r.id},
    {"format", r.format},
    {"created_at", format_iso8601(r.created_at)},
    {"post_count", r.post_count},
    {"media_count", r.media_count},
    {"size_bytes", r.size_bytes},
    {"size", r.humanSize()},
    {"date_range", r.dateRangeString()},
  };
  return j;
}

json exportPageToJson(const ExportPage& page) {
  json items = json::array();
  for (const auto& r : page.records) items.push_back(recordToJson(r));
  return json{{"exports", items}, {"total", page.total}};
}

} // namespace skya
