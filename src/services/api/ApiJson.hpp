#pragma once
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "core/export/ExportService.hpp"
#include "core/export/ExportTypes.hpp"

namespace skya {

// POST /exports body: {format, include_media, start_date, end_date}.
// Missing format means json. Throws ValidationError.
ExportOptions exportRequestFromJson(const nlohmann::json& body,
                                    const std::string& did,
                                    int64_t now);

// {job_id, status, posts_processed, posts_total, media_copied, media_total,
//  percent_complete, error, message}
nlohmann::json progressToJson(const ExportJob& job);

nlohmann::json recordToJson(const ExportRecord& r);

nlohmann::json exportPageToJson(const ExportPage& page);

} // namespace skya
