#pragma once
#include <string>

namespace skya {

std::string get_env_or(const char* key, const std::string& defval);

// Runtime settings, all from SKYA_* environment variables.
struct ServiceConfig {
  std::string dbPath     = "data/archive.db";
  std::string exportRoot = "./exports";
  int         port       = 8080;
  std::string apiKey;           // empty = auth disabled
  int         pageSize   = 1000;
  std::string logLevel   = "info";
};

// Malformed numbers fall back to the defaults above.
ServiceConfig loadConfigFromEnv();

// Applies SKYA_LOG_LEVEL style names to the default spdlog logger.
// Unknown names leave the level at info.
void configureLogging(const std::string& level);

} // namespace skya
