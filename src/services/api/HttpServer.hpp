#pragma once
#include <string>

namespace skya {

class ExportService;

// Start a blocking HTTP server exposing the export endpoints.
// apiKey: if empty, auth is disabled (useful for early integration).
// The caller's account is read from the X-Owner-Id header.
void run_http_server(ExportService& exports,
                     int port,
                     const std::string& apiKey);

} // namespace skya
