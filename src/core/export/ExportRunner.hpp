#pragma once
#include <atomic>
#include <filesystem>
#include <string>

#include "ExportRecordStore.hpp"
#include "ExportTypes.hpp"
#include "ProgressChannel.hpp"
#include "core/archive/PostSource.hpp"
#include "core/storage/ExportStorage.hpp"

namespace skya {

extern const char* const kEmptyArchiveMessage;
extern const char* const kCancelledMessage;

// Runs one export job from Queued to Completed or Failed:
//
//   create <root>/<did>/<timestamp>[/media]
//   count posts with the export's own filter
//   check free space, then page through the posts into posts.json|csv
//   collect, dedupe and copy media (when requested)
//   write manifest.json, then the ExportRecord
//
// Any failure before the record is written leaves the job Failed and the
// directory removed, so an ExportRecord exists only for intact bundles.
// Work inside one job is strictly sequential.
class ExportRunner {
public:
  ExportRunner(PostSource& posts,
               ExportRecordStore& records,
               DiskSpaceProbe& disk,
               int pageSize = kDefaultPageSize);

  // Export failures end in job.progress (status Failed, error set) rather than
  // an exception. Every state change is offered to `channel` (dropped when it
  // is full); the channel is closed with the terminal snapshot. `cancel` is
  // polled before each page fetch and before the media copy.
  void run(ExportJob& job,
           ProgressChannel<ExportProgress>* channel = nullptr,
           const std::atomic<bool>* cancel = nullptr);

  int pageSize() const { return pageSize_; }

private:
  struct Context {
    ExportJob&                       job;
    ProgressChannel<ExportProgress>* channel;
    const std::atomic<bool>*         cancel;
    std::string                      stage;  // for failure messages
  };

  void execute(Context& ctx);
  void writePosts(Context& ctx, const std::filesystem::path& dir);
  void copyMedia(Context& ctx, const std::filesystem::path& dir);
  void writeRecord(Context& ctx, const std::filesystem::path& dir,
                   const std::filesystem::path& manifestPath);

  PostSource&        posts_;
  ExportRecordStore& records_;
  DiskSpaceProbe&    disk_;
  int                pageSize_;
};

} // namespace skya
