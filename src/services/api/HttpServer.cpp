#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <functional>
#include <string>

#include "ApiJson.hpp"
#include "core/export/ExportErrors.hpp"
#include "core/export/ExportService.hpp"
#include "core/util/TimeFormat.hpp"

using nlohmann::json;

// -------- helpers --------

static void send_json(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

static void send_error(httplib::Response& res, int status, const std::string& msg) {
  send_json(res, status, json{{"error", msg}});
}

static bool check_api_key(const httplib::Request& req,
                          const std::string& apiKey,
                          httplib::Response& res) {
  if (apiKey.empty()) return true; // auth disabled for now
  auto k = req.get_header_value("X-API-Key");
  if (k == apiKey) return true;
  send_error(res, 401, "unauthorized");
  return false;
}

// Owner of the request; empty (with a 401 sent) when the header is missing.
static std::string require_owner(const httplib::Request& req, httplib::Response& res) {
  std::string did = req.get_header_value("X-Owner-Id");
  if (did.empty()) send_error(res, 401, "X-Owner-Id header required");
  return did;
}

static std::string param_or(const httplib::Request& req, const char* k, const std::string& def = {}) {
  if (auto it = req.params.find(k); it != req.params.end()) return it->second;
  return def;
}

static int int_param(const httplib::Request& req, const char* k, int def, int lo, int hi) {
  const std::string raw = param_or(req, k);
  if (raw.empty()) return def;
  int v = 0;
  try {
    size_t used = 0;
    v = std::stoi(raw, &used);
    if (used != raw.size()) throw std::invalid_argument(raw);
  } catch (const std::exception&) {
    throw skya::ValidationError(std::string(k) + " must be an integer");
  }
  if (v < lo) return lo;
  if (v > hi) return hi;
  return v;
}

// Runs a handler body and maps the export error types to status codes.
static void guarded(httplib::Response& res, const char* route, const std::function<void()>& fn) {
  try {
    fn();
  } catch (const skya::ValidationError& e) {
    send_error(res, 400, e.what());
  } catch (const skya::ForbiddenError& e) {
    send_error(res, 403, e.what());
  } catch (const skya::NotFoundError& e) {
    send_error(res, 404, e.what());
  } catch (const skya::ConflictError& e) {
    send_error(res, 409, e.what());
  } catch (const skya::InsufficientSpaceError& e) {
    send_error(res, 507, e.what());
  } catch (const json::exception& e) {
    send_error(res, 400, std::string("invalid JSON: ") + e.what());
  } catch (const std::exception& e) {
    spdlog::error("{} failed: {}", route, e.what());
    send_error(res, 500, "internal error");
  }
}

// -------- server --------

namespace skya {

void run_http_server(ExportService& exports,
                     int port,
                     const std::string& apiKey) {
  httplib::Server svr;

  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // POST /exports
  // Body: {"format":"json|csv","include_media":bool,"start_date":"YYYY-MM-DD","end_date":"YYYY-MM-DD"}
  svr.Post("/exports", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    const std::string did = require_owner(req, res);
    if (did.empty()) return;

    guarded(res, "POST /exports", [&] {
      const json body = req.body.empty() ? json::object() : json::parse(req.body);
      const std::string jobId = exports.startExport(exportRequestFromJson(body, did, now_unix()));
      send_json(res, 202, json{{"job_id", jobId}, {"status", statusName(ExportStatus::Queued)}});
    });
  });

  // GET /exports/jobs/{id}
  svr.Get(R"(/exports/jobs/([^/]+))", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    const std::string did = require_owner(req, res);
    if (did.empty()) return;

    guarded(res, "GET /exports/jobs", [&] {
      send_json(res, 200, progressToJson(exports.progress(did, req.matches[1])));
    });
  });

  // POST /exports/jobs/{id}/cancel
  svr.Post(R"(/exports/jobs/([^/]+)/cancel)", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    const std::string did = require_owner(req, res);
    if (did.empty()) return;

    guarded(res, "POST /exports/jobs/cancel", [&] {
      const std::string jobId = req.matches[1];
      const bool requested = exports.cancel(did, jobId);
      send_json(res, requested ? 202 : 409,
                json{{"job_id", jobId}, {"cancel_requested", requested}});
    });
  });

  // GET /exports?limit=&offset=
  svr.Get("/exports", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    const std::string did = require_owner(req, res);
    if (did.empty()) return;

    guarded(res, "GET /exports", [&] {
      const int limit = int_param(req, "limit", 50, 1, 100);
      const int offset = int_param(req, "offset", 0, 0, 1 << 30);
      send_json(res, 200, exportPageToJson(exports.listExports(did, limit, offset)));
    });
  });

  // DELETE /exports/records/{owner}/{dir}
  svr.Delete(R"(/exports/records/([^/]+)/([^/]+))", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    const std::string did = require_owner(req, res);
    if (did.empty()) return;

    guarded(res, "DELETE /exports/records", [&] {
      const std::string exportId = std::string(req.matches[1]) + "/" + std::string(req.matches[2]);
      exports.deleteExport(did, exportId);
      send_json(res, 200, json{{"id", exportId}, {"deleted", true}});
    });
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) res.set_content("not found", "text/plain");
  });

  spdlog::info("HTTP server listening on http://0.0.0.0:{}", port);
  if (!svr.listen("0.0.0.0", port)) {
    spdlog::error("Failed to bind port {}", port);
  }
}

} // namespace skya
