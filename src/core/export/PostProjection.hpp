#pragma once
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/archive/ArchiveTypes.hpp"

namespace skya {

// Column order of posts.csv.
const std::vector<std::string>& csvHeader();

// Post -> 15 CSV fields in csvHeader() order.
std::vector<std::string> postToCsvRow(const Post& p);

// Post -> JSON object written to posts.json. embed_data and labels are
// embedded as JSON when they parse, otherwise as their raw text.
nlohmann::json postToJson(const Post& p);

// Serializes one record exactly as it appears inside the posts.json array.
std::string dumpRecord(const nlohmann::json& j, int indent);

// Content hashes referenced by an embed descriptor. Understands
// {images:[{fullsize}]}, {media:{images:[{fullsize}]}} and {external:{thumb}}.
// Anything unrecognized or malformed yields an empty list.
std::vector<std::string> extractMediaHashes(const std::string& embedJson);

// Last path segment of a CDN URL with any "@ext" suffix removed.
std::string extractHashFromUrl(const std::string& url);

// RFC 4180 style quoting for one field.
std::string csvEscape(const std::string& field);

} // namespace skya
