#include "JobRegistry.hpp"

#include <algorithm>

#include "ExportErrors.hpp"
#include "core/util/Ids.hpp"

namespace skya {

ExportJob JobRegistry::tryRegister(const ExportOptions& options, int64_t now) {
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto& kv : jobs_) {
    const ExportJob& existing = kv.second.job;
    if (existing.options.did == options.did && isActive(existing.progress.status)) {
      throw ConflictError("an export is already in progress for this account (job " +
                          existing.id + ")");
    }
  }

  Entry e;
  e.job.id = uuid4();
  while (jobs_.count(e.job.id)) e.job.id = uuid4();
  e.job.options = options;
  e.job.created_at = now;
  e.job.progress.status = ExportStatus::Queued;
  e.cancel = std::make_shared<std::atomic<bool>>(false);

  ExportJob out = e.job;
  jobs_.emplace(out.id, std::move(e));
  return out;
}

std::optional<ExportJob> JobRegistry::snapshot(const std::string& id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) return std::nullopt;
  return it->second.job;
}

void JobRegistry::applyProgress(const std::string& id, const ExportProgress& p) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = jobs_.find(id);
  if (it == jobs_.end() || it->second.finished) return;
  it->second.job.progress = p;
}

void JobRegistry::finish(const ExportJob& job) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    Entry& e = jobs_[job.id];
    e.job = job;
    e.finished = true;
    if (!e.cancel) e.cancel = std::make_shared<std::atomic<bool>>(false);
  }
  cv_.notify_all();
}

bool JobRegistry::waitForTerminal(const std::string& id, std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lk(mu_);
  return cv_.wait_for(lk, timeout, [&] {
    auto it = jobs_.find(id);
    return it != jobs_.end() && it->second.finished;
  });
}

bool JobRegistry::requestCancel(const std::string& id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = jobs_.find(id);
  if (it == jobs_.end() || it->second.finished) return false;
  it->second.cancel->store(true);
  return true;
}

std::shared_ptr<std::atomic<bool>> JobRegistry::cancelFlag(const std::string& id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) return nullptr;
  return it->second.cancel;
}

std::vector<ExportJob> JobRegistry::listByOwner(const std::string& did) const {
  std::vector<ExportJob> out;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& kv : jobs_) {
      if (kv.second.job.options.did == did) out.push_back(kv.second.job);
    }
  }
  std::stable_sort(out.begin(), out.end(), [](const ExportJob& a, const ExportJob& b) {
    return a.created_at < b.created_at;
  });
  return out;
}

} // namespace skya
