#include "TimeFormat.hpp"

#include <cctype>
#include <chrono>
#include <ctime>

namespace skya {

static std::tm utc_tm(int64_t unix_seconds) {
  std::time_t t = static_cast<std::time_t>(unix_seconds);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  return tm;
}

static std::string strftime_utc(int64_t unix_seconds, const char* fmt) {
  const std::tm tm = utc_tm(unix_seconds);
  char buf[64];
  const size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, n);
}

int64_t now_unix() {
  return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count());
}

std::string format_iso8601(int64_t unix_seconds) {
  return strftime_utc(unix_seconds, "%Y-%m-%dT%H:%M:%SZ");
}

std::string format_date(int64_t unix_seconds) {
  return strftime_utc(unix_seconds, "%Y-%m-%d");
}

std::string format_dir_timestamp(int64_t unix_seconds) {
  return strftime_utc(unix_seconds, "%Y-%m-%d_%H-%M-%S");
}

bool parse_ymd(const std::string& s, int64_t& out) {
  if (s.size() != 10 || s[4] != '-' || s[7] != '-') return false;
  for (size_t i = 0; i < s.size(); ++i) {
    if (i == 4 || i == 7) continue;
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
  }
  const int year  = std::stoi(s.substr(0, 4));
  const int month = std::stoi(s.substr(5, 2));
  const int day   = std::stoi(s.substr(8, 2));
  if (month < 1 || month > 12 || day < 1 || day > 31) return false;

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon  = month - 1;
  tm.tm_mday = day;
#ifdef _WIN32
  const std::time_t t = _mkgmtime(&tm);
#else
  const std::time_t t = timegm(&tm);
#endif
  if (t == static_cast<std::time_t>(-1)) return false;

  // timegm normalizes 02-31 into March; reject anything that moved.
  const std::tm back = utc_tm(static_cast<int64_t>(t));
  if (back.tm_year != year - 1900 || back.tm_mon != month - 1 || back.tm_mday != day) {
    return false;
  }
  out = static_cast<int64_t>(t);
  return true;
}

} // namespace skya
