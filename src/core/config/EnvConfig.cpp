#include "EnvConfig.hpp"

#include <cstdlib>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace skya {

std::string get_env_or(const char* key, const std::string& defval) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return defval;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
#endif
}

static int env_int_or(const char* key, int defval) {
  const std::string raw = get_env_or(key, "");
  if (raw.empty()) return defval;
  try {
    size_t used = 0;
    const int v = std::stoi(raw, &used);
    if (used != raw.size() || v <= 0) throw std::invalid_argument(raw);
    return v;
  } catch (const std::exception&) {
    spdlog::warn("{}={} is not a positive integer, using {}", key, raw, defval);
    return defval;
  }
}

ServiceConfig loadConfigFromEnv() {
  ServiceConfig cfg;
  cfg.dbPath     = get_env_or("SKYA_DB_PATH", cfg.dbPath);
  cfg.exportRoot = get_env_or("SKYA_EXPORT_ROOT", cfg.exportRoot);
  cfg.port       = env_int_or("SKYA_PORT", cfg.port);
  cfg.apiKey     = get_env_or("SKYA_API_KEY", "");
  cfg.pageSize   = env_int_or("SKYA_PAGE_SIZE", cfg.pageSize);
  cfg.logLevel   = get_env_or("SKYA_LOG_LEVEL", cfg.logLevel);
  return cfg;
}

void configureLogging(const std::string& level) {
  auto lvl = spdlog::level::from_str(level);
  // from_str maps unknown names to off
  if (lvl == spdlog::level::off && level != "off") {
    spdlog::warn("unknown log level '{}', using info", level);
    lvl = spdlog::level::info;
  }
  spdlog::set_level(lvl);
}

} // namespace skya
