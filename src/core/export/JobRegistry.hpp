#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ExportTypes.hpp"

namespace skya {

// In-memory table of export jobs, keyed by job id. One mutex guards it; every
// accessor returns copies. Entries live until the process exits.
class JobRegistry {
public:
  JobRegistry() = default;
  JobRegistry(const JobRegistry&) = delete;
  JobRegistry& operator=(const JobRegistry&) = delete;

  // Registers a Queued job for options.did and returns it. Throws
  // ConflictError if that owner already has a Queued or Running job; the
  // check and the insert are one critical section.
  ExportJob tryRegister(const ExportOptions& options, int64_t now);

  std::optional<ExportJob> snapshot(const std::string& id) const;

  // Copies a progress snapshot into the job. Ignored once the job finished.
  void applyProgress(const std::string& id, const ExportProgress& p);

  // Stores the terminal job and wakes waiters.
  void finish(const ExportJob& job);

  // True once finish() has run for id, false on timeout or unknown id.
  bool waitForTerminal(const std::string& id, std::chrono::milliseconds timeout) const;

  // Returns false when the job is unknown or no longer active.
  bool requestCancel(const std::string& id);
  std::shared_ptr<std::atomic<bool>> cancelFlag(const std::string& id) const;

  // Oldest first.
  std::vector<ExportJob> listByOwner(const std::string& did) const;

private:
  struct Entry {
    ExportJob                          job;
    std::shared_ptr<std::atomic<bool>> cancel;
    bool                               finished = false;
  };

  mutable std::mutex              mu_;
  mutable std::condition_variable cv_;
  std::map<std::string, Entry>    jobs_;
};

} // namespace skya
