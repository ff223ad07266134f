#include "ExportService.hpp"

#include <filesystem>
#include <spdlog/spdlog.h>
#include <system_error>
#include <utility>

#include "ExportErrors.hpp"
#include "ExportRunner.hpp"
#include "ProgressChannel.hpp"
#include "core/util/TimeFormat.hpp"

namespace skya {

namespace fs = std::filesystem;

ExportService::ExportService(PostSource& posts,
                             ExportRecordStore& records,
                             DiskSpaceProbe& disk,
                             JobRegistry& registry,
                             std::string exportRoot,
                             int pageSize)
  : posts_(posts), records_(records), disk_(disk), registry_(registry),
    exportRoot_(std::move(exportRoot)),
    pageSize_(pageSize > 0 ? pageSize : kDefaultPageSize) {}

ExportService::~ExportService() {
  std::vector<Worker> workers;
  {
    std::lock_guard<std::mutex> lk(workersMu_);
    workers.swap(workers_);
  }
  for (auto& w : workers) {
    if (w.thread.joinable()) w.thread.join();
  }
}

void ExportService::reapFinishedWorkers() {
  std::vector<Worker> done;
  {
    std::lock_guard<std::mutex> lk(workersMu_);
    auto it = workers_.begin();
    while (it != workers_.end()) {
      // finish() is the worker's last step, so the join below is short
      if (registry_.waitForTerminal(it->jobId, std::chrono::milliseconds(0))) {
        done.push_back(std::move(*it));
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& w : done) {
    if (w.thread.joinable()) w.thread.join();
  }
}

size_t ExportService::workerCount() const {
  std::lock_guard<std::mutex> lk(workersMu_);
  return workers_.size();
}

std::string ExportService::startExport(ExportOptions options) {
  reapFinishedWorkers();

  options.output_dir = exportRoot_;
  options.validate();

  std::error_code ec;
  fs::create_directories(exportRoot_, ec);
  if (ec) throw std::runtime_error("failed to create export root " + exportRoot_ + ": " + ec.message());

  const int64_t count = posts_.countPosts(options.did, options.date_range);
  checkDiskSpace(disk_, exportRoot_, estimateExportBytes(count, 0));

  ExportJob job = registry_.tryRegister(options, now_unix());
  spdlog::info("export job {} accepted for {} ({} posts, format={})",
               job.id, options.did, count, formatName(options.format));

  try {
    std::lock_guard<std::mutex> lk(workersMu_);
    workers_.reserve(workers_.size() + 1);
    workers_.push_back(Worker{job.id, std::thread(&ExportService::runJob, this, job)});
  } catch (const std::system_error& e) {
    job.progress.status = ExportStatus::Failed;
    job.progress.error = std::string("failed to start export worker: ") + e.what();
    registry_.finish(job);
    throw;
  }
  return job.id;
}

void ExportService::runJob(ExportJob job) {
  const std::string id = job.id;
  ProgressChannel<ExportProgress> channel(kProgressChannelCapacity);
  std::thread consumer([this, id, &channel] {
    while (auto p = channel.pop()) registry_.applyProgress(id, *p);
  });

  try {
    ExportRunner runner(posts_, records_, disk_, pageSize_);
    runner.run(job, &channel, registry_.cancelFlag(id).get());
  } catch (const std::exception& e) {
    spdlog::error("export {}: worker failed: {}", id, e.what());
    job.progress.status = ExportStatus::Failed;
    job.progress.error = std::string("export worker failed: ") + e.what();
  }
  // no-op when the runner already closed it
  channel.close(job.progress);

  consumer.join();
  if (channel.dropped() > 0) {
    spdlog::debug("export {}: {} progress updates dropped", id, channel.dropped());
  }
  registry_.finish(job);
}

ExportJob ExportService::progress(const std::string& did, const std::string& jobId) const {
  auto job = registry_.snapshot(jobId);
  if (!job) throw NotFoundError("export job not found: " + jobId);
  if (job->options.did != did) throw ForbiddenError("export job belongs to another account");
  return *job;
}

bool ExportService::cancel(const std::string& did, const std::string& jobId) {
  progress(did, jobId);
  const bool requested = registry_.requestCancel(jobId);
  if (requested) spdlog::info("cancellation requested for export {}", jobId);
  return requested;
}

ExportPage ExportService::listExports(const std::string& did, int limit, int offset) {
  ExportPage page;
  page.records = records_.listExportsByDid(did, limit, offset);
  page.total = records_.countExportsByDid(did);
  return page;
}

void ExportService::deleteExport(const std::string& did, const std::string& exportId) {
  auto rec = records_.getExportById(exportId);
  if (!rec) throw NotFoundError("export not found: " + exportId);
  if (rec->did != did) throw ForbiddenError("export belongs to another account");

  if (!removeExportDirectory(rec->directory_path)) {
    spdlog::warn("export {}: directory {} could not be removed", exportId, rec->directory_path);
  }
  if (!records_.deleteExportRecord(exportId)) {
    throw NotFoundError("export not found: " + exportId);
  }
  spdlog::info("export {} deleted", exportId);
}

bool ExportService::waitForJob(const std::string& jobId, std::chrono::milliseconds timeout) const {
  return registry_.waitForTerminal(jobId, timeout);
}

} // namespace skya
