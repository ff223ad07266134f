#pragma once
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "ExportRecordStore.hpp"
#include "ExportTypes.hpp"
#include "JobRegistry.hpp"
#include "core/archive/PostSource.hpp"
#include "core/storage/ExportStorage.hpp"

namespace skya {

constexpr size_t kProgressChannelCapacity = 100;

struct ExportPage {
  std::vector<ExportRecord> records;
  int64_t                   total = 0;
};

// Entry point for export requests. Accepts a request, runs it on a worker
// thread of its own and answers progress, cancel, list and delete calls.
class ExportService {
public:
  ExportService(PostSource& posts,
                ExportRecordStore& records,
                DiskSpaceProbe& disk,
                JobRegistry& registry,
                std::string exportRoot,
                int pageSize = kDefaultPageSize);
  // Joins every worker.
  ~ExportService();

  ExportService(const ExportService&) = delete;
  ExportService& operator=(const ExportService&) = delete;

  // Validates, preflights free space under the export root, registers the job
  // and starts it. Returns the job id without waiting for the export.
  // Throws ValidationError, InsufficientSpaceError, ConflictError.
  std::string startExport(ExportOptions options);

  // Throws NotFoundError, or ForbiddenError when the job is someone else's.
  ExportJob progress(const std::string& did, const std::string& jobId) const;

  // Returns false when the job already finished.
  bool cancel(const std::string& did, const std::string& jobId);

  ExportPage listExports(const std::string& did, int limit = 50, int offset = 0);

  // Removes the bundle directory (logged on failure) and the record.
  // Throws NotFoundError, ForbiddenError.
  void deleteExport(const std::string& did, const std::string& exportId);

  bool waitForJob(const std::string& jobId, std::chrono::milliseconds timeout) const;

  const std::string& exportRoot() const { return exportRoot_; }

  // Worker threads not yet joined.
  size_t workerCount() const;

private:
  struct Worker {
    std::string jobId;
    std::thread thread;
  };

  void runJob(ExportJob job);
  // Joins workers whose job has reached a terminal state.
  void reapFinishedWorkers();

  PostSource&        posts_;
  ExportRecordStore& records_;
  DiskSpaceProbe&    disk_;
  JobRegistry&       registry_;
  std::string        exportRoot_;
  int                pageSize_;

  mutable std::mutex  workersMu_;
  std::vector<Worker> workers_;
};

} // namespace skya
