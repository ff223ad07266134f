#include "ExportRunner.hpp"

#include <set>
#include <spdlog/spdlog.h>
#include <stdexcept>

#include "CsvStreamWriter.hpp"
#include "JsonStreamWriter.hpp"
#include "ManifestWriter.hpp"
#include "MediaCopier.hpp"
#include "core/archive/Paginator.hpp"
#include "core/util/TimeFormat.hpp"

namespace skya {

namespace fs = std::filesystem;

const char* const kEmptyArchiveMessage =
  "No posts found in your archive matching the selected criteria. "
  "Try adjusting your date range or archive some posts first.";
const char* const kCancelledMessage = "export cancelled";

namespace {

class CancelledError : public std::runtime_error {
public:
  CancelledError() : std::runtime_error(kCancelledMessage) {}
};

void throwIfCancelled(const std::atomic<bool>* cancel) {
  if (cancel && cancel->load()) throw CancelledError();
}

void publish(ProgressChannel<ExportProgress>* channel, const ExportProgress& p) {
  if (channel) channel->offer(p);
}

template <typename Writer>
void streamPages(Writer& writer, Paginator& pager, ExportJob& job,
                 ProgressChannel<ExportProgress>* channel,
                 const std::atomic<bool>* cancel) {
  while (!pager.done()) {
    throwIfCancelled(cancel);
    std::vector<Post> page = pager.next();
    if (page.empty()) break;
    writer.writePage(page);
    job.progress.posts_processed += static_cast<int64_t>(page.size());
    publish(channel, job.progress);
  }
  writer.finish();
}

} // namespace

ExportRunner::ExportRunner(PostSource& posts,
                           ExportRecordStore& records,
                           DiskSpaceProbe& disk,
                           int pageSize)
  : posts_(posts), records_(records), disk_(disk),
    pageSize_(pageSize > 0 ? pageSize : kDefaultPageSize) {}

void ExportRunner::run(ExportJob& job,
                       ProgressChannel<ExportProgress>* channel,
                       const std::atomic<bool>* cancel) {
  Context ctx{job, channel, cancel, "start export"};

  std::string failure;
  try {
    job.progress.status = ExportStatus::Running;
    publish(channel, job.progress);
    spdlog::info("export {} started (did={}, format={}, media={})",
                 job.id, job.options.did, formatName(job.options.format),
                 job.options.include_media);
    execute(ctx);
  } catch (const CancelledError&) {
    failure = kCancelledMessage;
  } catch (const std::exception& e) {
    failure = "failed to " + ctx.stage + ": " + e.what();
  }

  if (failure.empty()) {
    spdlog::info("export {} completed: {} posts, {} media, dir={}",
                 job.id, job.progress.posts_processed, job.progress.media_copied, job.export_dir);
  } else {
    spdlog::error("export {} failed: {}", job.id, failure);
    if (!job.export_dir.empty()) {
      spdlog::info("cleaning up partial export at {}", job.export_dir);
      if (removeExportDirectory(job.export_dir)) {
        spdlog::info("partial export directory removed");
      }
    }
    job.progress.status = ExportStatus::Failed;
    job.progress.error = failure;
  }

  if (channel) channel->close(job.progress);
}

void ExportRunner::execute(Context& ctx) {
  ExportJob& job = ctx.job;
  const ExportOptions& opts = job.options;

  ctx.stage = "create export directory";
  const fs::path dir = createExportDirectory(opts.output_dir, opts.did, now_unix());
  job.export_dir = dir.string();
  if (opts.include_media) {
    ctx.stage = "create media directory";
    fs::create_directories(dir / "media");
  }

  ctx.stage = "count posts";
  const int64_t total = posts_.countPosts(opts.did, opts.date_range);
  job.progress.posts_total = total;
  publish(ctx.channel, job.progress);

  if (total == 0) {
    // Empty is a valid result: the bundle holds only its manifest.
    job.progress.message = kEmptyArchiveMessage;
    spdlog::info("export {}: no posts match, writing empty bundle", job.id);
  } else {
    ctx.stage = "check disk space";
    checkDiskSpace(disk_, dir, estimateExportBytes(total, 0));

    writePosts(ctx, dir);
    if (opts.include_media) copyMedia(ctx, dir);
  }

  ctx.stage = "write manifest";
  const fs::path manifestPath = dir / "manifest.json";
  ExportManifest manifest = generateManifest(opts.format, job.progress.posts_processed,
                                             job.progress.media_copied,
                                             opts.date_range, listExportFiles(dir), now_unix());
  writeManifest(manifestPath, manifest);

  writeRecord(ctx, dir, manifestPath);

  job.completed_at = now_unix();
  job.progress.status = ExportStatus::Completed;
}

void ExportRunner::writePosts(Context& ctx, const fs::path& dir) {
  ExportJob& job = ctx.job;
  const ExportOptions& opts = job.options;
  Paginator pager(posts_, opts.did, opts.date_range, pageSize_, job.progress.posts_total);

  if (opts.format == ExportFormat::Json) {
    ctx.stage = "export JSON";
    JsonStreamWriter writer(dir / "posts.json");
    streamPages(writer, pager, job, ctx.channel, ctx.cancel);
  } else {
    ctx.stage = "export CSV";
    CsvStreamWriter writer(dir / "posts.csv");
    streamPages(writer, pager, job, ctx.channel, ctx.cancel);
  }
  spdlog::debug("export {}: wrote {} posts in {} pages",
                job.id, job.progress.posts_processed, pager.rounds());
}

void ExportRunner::copyMedia(Context& ctx, const fs::path& dir) {
  ExportJob& job = ctx.job;
  const ExportOptions& opts = job.options;
  const fs::path mediaDir = dir / "media";

  ctx.stage = "collect media";
  MediaCopyMap files;
  std::set<std::string> seen;
  uint64_t mediaBytes = 0;

  Paginator pager(posts_, opts.did, opts.date_range, pageSize_, job.progress.posts_total);
  while (!pager.done()) {
    throwIfCancelled(ctx.cancel);
    const std::vector<Post> page = pager.next();
    for (const auto& post : page) {
      if (!post.has_media) continue;
      std::vector<Media> media;
      try {
        media = posts_.mediaForPost(post.uri);
      } catch (const std::exception& e) {
        spdlog::warn("failed to list media for post {}: {}", post.uri, e.what());
        continue;
      }
      for (const auto& m : media) {
        // content-addressed: one copy per hash however many posts use it
        if (!seen.insert(m.hash).second) continue;
        files.emplace(fs::path(m.file_path), mediaDir / (m.hash + "." + mediaExtension(m)));
        if (m.size_bytes > 0) mediaBytes += static_cast<uint64_t>(m.size_bytes);
      }
    }
  }

  job.progress.media_total = static_cast<int64_t>(files.size());
  publish(ctx.channel, job.progress);

  ctx.stage = "check disk space for media";
  checkDiskSpace(disk_, dir, mediaBytes + kExportOverheadBytes);
  throwIfCancelled(ctx.cancel);

  ctx.stage = "copy media";
  const size_t copied = copyMediaFiles(files, [&](size_t n) {
    job.progress.media_copied = static_cast<int64_t>(n);
    publish(ctx.channel, job.progress);
  });
  job.progress.media_copied = static_cast<int64_t>(copied);
  publish(ctx.channel, job.progress);

  if (copied < files.size()) {
    spdlog::warn("export {}: copied {} of {} media files", job.id, copied, files.size());
  }
}

void ExportRunner::writeRecord(Context& ctx, const fs::path& dir, const fs::path& manifestPath) {
  ExportJob& job = ctx.job;
  const ExportOptions& opts = job.options;

  ctx.stage = "measure export size";
  ExportRecord rec;
  rec.id             = opts.did + "/" + dir.filename().string();
  rec.did            = opts.did;
  rec.format         = formatName(opts.format);
  rec.created_at     = job.created_at;
  rec.directory_path = dir.string();
  rec.post_count     = job.progress.posts_processed;
  rec.media_count    = job.progress.media_copied;
  rec.size_bytes     = directorySize(dir);
  rec.manifest_path  = manifestPath.string();
  if (opts.date_range) {
    rec.date_range_start = opts.date_range->start;
    rec.date_range_end   = opts.date_range->end;
  }

  ctx.stage = "save export record";
  records_.createExportRecord(rec);
  spdlog::info("export record saved: {} ({} bytes)", rec.id, rec.size_bytes);
}

} // namespace skya
