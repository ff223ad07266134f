// src/main.cpp
#include <chrono>
#include <string>
#include <iostream>
#include <filesystem>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "core/config/EnvConfig.hpp"
#include "core/export/ExportService.hpp"
#include "core/export/JobRegistry.hpp"
#include "core/metadata/ArchiveStore.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/storage/ExportStorage.hpp"
#include "services/api/HttpServer.hpp"

// ---------- helpers ----------

// Look for schema.sql in CWD first (the build copies it there), then fallback.
static std::string findSchemaPath() {
  namespace fs = std::filesystem;
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/metadata/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in working directory and src/core/metadata)");
}

static void ensure_dirs_for(const std::string& file_path) {
  namespace fs = std::filesystem;
  fs::path parent = fs::path(file_path).parent_path();
  if (!parent.empty()) fs::create_directories(parent);
}

static void openDatabase(const skya::ServiceConfig& cfg) {
  ensure_dirs_for(cfg.dbPath);
  skya::initDatabase(cfg.dbPath, findSchemaPath());
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init                              # create/upgrade SQLite schema\n"
            << "  " << argv0 << " --serve                             # start HTTP server (SKYA_PORT or 8080)\n"
            << "  " << argv0 << " --export <did> [json|csv] [--media] # run one export and wait for it\n";
}

// Runs one export in the foreground. Returns the process exit code.
static int runExportCommand(const skya::ServiceConfig& cfg, int argc, char** argv) {
  if (argc < 3) throw std::runtime_error("--export needs an account DID");

  skya::ExportOptions opts;
  opts.did = argv[2];
  for (int i = 3; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--media") opts.include_media = true;
    else opts.format = skya::parseFormat(arg);
  }

  skya::ArchiveStore store(cfg.dbPath);
  skya::FilesystemSpaceProbe disk;
  skya::JobRegistry registry;
  skya::ExportService service(store, store, disk, registry, cfg.exportRoot, cfg.pageSize);

  const std::string jobId = service.startExport(opts);
  if (!service.waitForJob(jobId, std::chrono::hours(24))) {
    throw std::runtime_error("export " + jobId + " did not finish");
  }

  const skya::ExportJob job = service.progress(opts.did, jobId);
  if (job.progress.status != skya::ExportStatus::Completed) {
    std::cerr << "Export failed: " << job.progress.error << "\n";
    return 1;
  }
  if (!job.progress.message.empty()) std::cout << job.progress.message << "\n";
  std::cout << "Exported " << job.progress.posts_processed << " posts, "
            << job.progress.media_copied << " media files to " << job.export_dir << "\n";
  return 0;
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const skya::ServiceConfig cfg = skya::loadConfigFromEnv();
    skya::configureLogging(cfg.logLevel);

    if (argc > 1 && std::string(argv[1]) == "--init") {
      openDatabase(cfg);
      std::cout << "DB initialized at: " << cfg.dbPath << "\n";
      return 0;
    }

    if (argc > 1 && std::string(argv[1]) == "--serve") {
      // Self-heal DB on startup (idempotent)
      openDatabase(cfg);
      std::filesystem::create_directories(cfg.exportRoot);

      // Construct services
      skya::ArchiveStore store(cfg.dbPath);
      skya::FilesystemSpaceProbe disk;
      skya::JobRegistry registry;
      skya::ExportService service(store, store, disk, registry, cfg.exportRoot, cfg.pageSize);

      spdlog::info("exports written under {}", cfg.exportRoot);
      skya::run_http_server(service, cfg.port, cfg.apiKey);
      return 0;
    }

    if (argc > 1 && std::string(argv[1]) == "--export") {
      openDatabase(cfg);
      return runExportCommand(cfg, argc, argv);
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
