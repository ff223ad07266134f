#pragma once
#include <cstdint>
#include <string>

namespace skya {

int64_t now_unix();

// 2024-03-01T12:00:00Z
std::string format_iso8601(int64_t unix_seconds);

// 2024-03-01
std::string format_date(int64_t unix_seconds);

// 2024-03-01_12-00-00, safe for directory names
std::string format_dir_timestamp(int64_t unix_seconds);

// Strict YYYY-MM-DD -> UTC midnight. Returns false on malformed or
// out-of-range input (e.g. 2024-02-31).
bool parse_ymd(const std::string& s, int64_t& out);

} // namespace skya
