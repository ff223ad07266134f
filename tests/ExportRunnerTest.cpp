#include <gtest/gtest.h>

#include <atomic>
#include <nlohmann/json.hpp>

#include "TestSupport.hpp"
#include "core/export/ExportRunner.hpp"
#include "core/util/TimeFormat.hpp"

using namespace skya;
using nlohmann::json;
namespace fs = std::filesystem;

namespace {

const std::string kDid = "did:plc:runner";

// Raises the cancel flag once `afterFetches` pages have been served.
class CancellingSource : public test::MemoryPostSource {
public:
  CancellingSource(std::atomic<bool>& flag, int afterFetches) : flag_(flag), after_(afterFetches) {}

  std::vector<Post> fetchPosts(const std::string& did,
                               const std::optional<DateRange>& range,
                               int limit,
                               int offset) override {
    auto page = MemoryPostSource::fetchPosts(did, range, limit, offset);
    if (fetchCount() >= after_) flag_ = true;
    return page;
  }

private:
  std::atomic<bool>& flag_;
  int                after_;
};

// Reports more posts than it serves, as when rows are deleted after the count.
class OvercountingSource : public test::MemoryPostSource {
public:
  explicit OvercountingSource(int64_t extra) : extra_(extra) {}

  int64_t countPosts(const std::string& did, const std::optional<DateRange>& range) override {
    return MemoryPostSource::countPosts(did, range) + extra_;
  }

private:
  int64_t extra_;
};

} // namespace

class ExportRunnerTest : public ::testing::Test {
protected:
  ExportJob makeJob(ExportFormat format = ExportFormat::Json, bool media = false) {
    ExportJob job;
    job.id = "job-1";
    job.options.did = kDid;
    job.options.format = format;
    job.options.include_media = media;
    job.options.output_dir = root().string();
    job.created_at = now_unix();
    return job;
  }

  fs::path root() const { return tmp_.path() / "exports"; }

  // Drains a closed channel.
  static std::vector<ExportProgress> drain(ProgressChannel<ExportProgress>& ch) {
    std::vector<ExportProgress> out;
    while (auto p = ch.popFor(std::chrono::milliseconds(0))) out.push_back(*p);
    return out;
  }

  // Places a finished-looking bundle on every timestamp name the next few
  // seconds could produce, so a following run collides with an existing one.
  std::vector<fs::path> occupyUpcomingDirectories(int seconds) const {
    std::vector<fs::path> taken;
    const int64_t now = now_unix();
    for (int64_t t = now; t < now + seconds; ++t) {
      const fs::path dir = root() / kDid / format_dir_timestamp(t);
      if (!fs::exists(dir)) test::writeFile(dir / "manifest.json", "{\"post_count\":1}");
      taken.push_back(dir);
    }
    return taken;
  }

  bool userDirEmpty() const {
    const fs::path dir = root() / kDid;
    return !fs::exists(dir) || fs::is_empty(dir);
  }

  test::TempDir            tmp_;
  test::MemoryPostSource   source_;
  test::MemoryRecordStore  records_;
  test::FixedSpaceProbe    disk_;
};

TEST_F(ExportRunnerTest, ExportsInThreeRoundsForPartialLastPage) {
  source_.add(test::makePosts(kDid, 2500, 1700000000, 3));
  source_.add(test::makePosts("did:plc:someone-else", 40));

  ExportRunner runner(source_, records_, disk_, 1000);
  ProgressChannel<ExportProgress> channel(10000);
  ExportJob job = makeJob();
  runner.run(job, &channel);

  ASSERT_EQ(job.progress.status, ExportStatus::Completed) << job.progress.error;
  EXPECT_EQ(job.progress.posts_total, 2500);
  EXPECT_EQ(job.progress.posts_processed, 2500);
  EXPECT_EQ(source_.pageSizes(), (std::vector<size_t>{1000, 1000, 500}));
  EXPECT_TRUE(job.completed_at.has_value());

  const fs::path dir = job.export_dir;
  EXPECT_EQ(dir.parent_path(), root() / kDid);
  const json posts = json::parse(test::readFile(dir / "posts.json"));
  EXPECT_EQ(posts.size(), 2500u);

  const json manifest = json::parse(test::readFile(dir / "manifest.json"));
  EXPECT_EQ(manifest["post_count"], 2500);
  EXPECT_EQ(manifest["export_format"], "json");
  EXPECT_EQ(manifest["files"], json::array({"posts.json"}));

  ASSERT_EQ(records_.size(), 1u);
  const auto rec = records_.getExportById(kDid + "/" + dir.filename().string());
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->post_count, 2500);
  EXPECT_EQ(rec->manifest_path, (dir / "manifest.json").string());
  EXPECT_GT(rec->size_bytes, 0);

  const auto updates = drain(channel);
  ASSERT_FALSE(updates.empty());
  EXPECT_EQ(updates.front().status, ExportStatus::Running);
  EXPECT_EQ(updates.back().status, ExportStatus::Completed);
  for (size_t i = 1; i < updates.size(); ++i) {
    EXPECT_GE(updates[i].posts_processed, updates[i - 1].posts_processed);
  }
}

TEST_F(ExportRunnerTest, ExactMultipleNeedsNoExtraRound) {
  source_.add(test::makePosts(kDid, 2000));

  ExportRunner runner(source_, records_, disk_, 1000);
  ExportJob job = makeJob();
  runner.run(job);

  ASSERT_EQ(job.progress.status, ExportStatus::Completed) << job.progress.error;
  EXPECT_EQ(source_.fetchCount(), 2);
  EXPECT_EQ(job.progress.posts_processed, 2000);
}

TEST_F(ExportRunnerTest, CsvExport) {
  auto posts = test::makePosts(kDid, 12);
  posts[3].text = "comma, \"quote\"\nnewline";
  source_.add(posts);

  ExportRunner runner(source_, records_, disk_, 5);
  ExportJob job = makeJob(ExportFormat::Csv);
  runner.run(job);

  ASSERT_EQ(job.progress.status, ExportStatus::Completed) << job.progress.error;
  const auto rows = test::parseCsv(test::readFile(fs::path(job.export_dir) / "posts.csv"));
  ASSERT_EQ(rows.size(), 13u);
  EXPECT_EQ(rows[4][3], posts[3].text);
  EXPECT_EQ(records_.getExportById(kDid + "/" + fs::path(job.export_dir).filename().string())->format, "csv");
}

TEST_F(ExportRunnerTest, EmptyArchiveCompletesWithManifestOnly) {
  source_.add(test::makePosts("did:plc:other", 5));

  ExportRunner runner(source_, records_, disk_);
  ExportJob job = makeJob();
  runner.run(job);

  ASSERT_EQ(job.progress.status, ExportStatus::Completed) << job.progress.error;
  EXPECT_EQ(job.progress.message, kEmptyArchiveMessage);
  EXPECT_EQ(job.progress.posts_total, 0);
  EXPECT_EQ(source_.fetchCount(), 0);

  const fs::path dir = job.export_dir;
  const json manifest = json::parse(test::readFile(dir / "manifest.json"));
  EXPECT_EQ(manifest["post_count"], 0);
  EXPECT_EQ(manifest["media_count"], 0);
  EXPECT_EQ(records_.size(), 1u);
}

TEST_F(ExportRunnerTest, FailureMidWriteLeavesNoDirectoryAndNoRecord) {
  source_.add(test::makePosts(kDid, 2500));
  source_.failOnFetch(2);

  ExportRunner runner(source_, records_, disk_, 1000);
  ProgressChannel<ExportProgress> channel(10000);
  ExportJob job = makeJob();
  runner.run(job, &channel);

  EXPECT_EQ(job.progress.status, ExportStatus::Failed);
  EXPECT_NE(job.progress.error.find("fetchPosts failed"), std::string::npos) << job.progress.error;
  EXPECT_NE(job.progress.error.find("export JSON"), std::string::npos) << job.progress.error;
  EXPECT_FALSE(fs::exists(job.export_dir));
  EXPECT_TRUE(userDirEmpty());
  EXPECT_EQ(records_.size(), 0u);

  const auto updates = drain(channel);
  ASSERT_FALSE(updates.empty());
  EXPECT_EQ(updates.back().status, ExportStatus::Failed);
}

TEST_F(ExportRunnerTest, RecordWriteFailureFailsJobAndCleansUp) {
  source_.add(test::makePosts(kDid, 10));
  records_.failOnCreate(true);

  ExportRunner runner(source_, records_, disk_);
  ExportJob job = makeJob();
  runner.run(job);

  EXPECT_EQ(job.progress.status, ExportStatus::Failed);
  EXPECT_NE(job.progress.error.find("save export record"), std::string::npos) << job.progress.error;
  EXPECT_FALSE(fs::exists(job.export_dir));
  EXPECT_FALSE(job.completed_at.has_value());
}

TEST_F(ExportRunnerTest, InsufficientSpaceFails) {
  source_.add(test::makePosts(kDid, 100));
  disk_.set(1024);

  ExportRunner runner(source_, records_, disk_);
  ExportJob job = makeJob();
  runner.run(job);

  EXPECT_EQ(job.progress.status, ExportStatus::Failed);
  EXPECT_NE(job.progress.error.find("insufficient disk space"), std::string::npos) << job.progress.error;
  EXPECT_TRUE(userDirEmpty());
  EXPECT_EQ(source_.fetchCount(), 0);
}

TEST_F(ExportRunnerTest, CancelledBeforeStartNeverFetches) {
  source_.add(test::makePosts(kDid, 100));
  std::atomic<bool> cancel{true};

  ExportRunner runner(source_, records_, disk_);
  ExportJob job = makeJob();
  runner.run(job, nullptr, &cancel);

  EXPECT_EQ(job.progress.status, ExportStatus::Failed);
  EXPECT_EQ(job.progress.error, kCancelledMessage);
  EXPECT_EQ(source_.fetchCount(), 0);
  EXPECT_TRUE(userDirEmpty());
  EXPECT_EQ(records_.size(), 0u);
}

TEST_F(ExportRunnerTest, CancelledBetweenPages) {
  std::atomic<bool> cancel{false};
  CancellingSource source(cancel, 1);
  source.add(test::makePosts(kDid, 300));

  ExportRunner runner(source, records_, disk_, 100);
  ExportJob job = makeJob();
  runner.run(job, nullptr, &cancel);

  EXPECT_EQ(job.progress.status, ExportStatus::Failed);
  EXPECT_EQ(job.progress.error, kCancelledMessage);
  EXPECT_EQ(job.progress.posts_processed, 100);
  EXPECT_EQ(source.fetchCount(), 1);
  EXPECT_FALSE(fs::exists(job.export_dir));
}

TEST_F(ExportRunnerTest, DateRangeLimitsExport) {
  // one post per minute counting back from the base time
  source_.add(test::makePosts(kDid, 50, 1700000000));

  ExportRunner runner(source_, records_, disk_);
  ExportJob job = makeJob();
  DateRange r;
  r.start = 1700000000 - 19 * 60;
  r.end = 1700000000;
  job.options.date_range = r;
  runner.run(job);

  ASSERT_EQ(job.progress.status, ExportStatus::Completed) << job.progress.error;
  EXPECT_EQ(job.progress.posts_total, 20);

  const json manifest = json::parse(test::readFile(fs::path(job.export_dir) / "manifest.json"));
  ASSERT_TRUE(manifest.contains("date_range"));
  EXPECT_EQ(manifest["date_range"]["end_date"], "2023-11-14T22:13:20Z");
}

TEST_F(ExportRunnerTest, MediaIsDedupedAndMissingFilesSkipped) {
  auto posts = test::makePosts(kDid, 4);
  for (auto& p : posts) p.has_media = true;
  posts[3].has_media = false;
  source_.add(posts);

  const fs::path blobs = tmp_.path() / "blobs";
  test::writeFile(blobs / "shared.jpg", "shared-bytes");
  test::writeFile(blobs / "solo", "png-bytes");

  auto media = [&](const std::string& hash, const Post& p, const std::string& file,
                   const std::string& mime) {
    Media m;
    m.hash = hash;
    m.post_uri = p.uri;
    m.file_path = (blobs / file).string();
    m.mime_type = mime;
    m.size_bytes = 16;
    return m;
  };
  source_.addMedia(media("hshared", posts[0], "shared.jpg", "image/jpeg"));
  source_.addMedia(media("hshared", posts[1], "shared.jpg", "image/jpeg"));
  source_.addMedia(media("hsolo", posts[1], "solo", "image/png"));
  source_.addMedia(media("hmissing", posts[2], "gone.jpg", "image/jpeg"));
  source_.addMedia(media("hignored", posts[3], "shared.jpg", "image/jpeg"));

  ExportRunner runner(source_, records_, disk_);
  ExportJob job = makeJob(ExportFormat::Json, true);
  runner.run(job);

  ASSERT_EQ(job.progress.status, ExportStatus::Completed) << job.progress.error;
  EXPECT_EQ(job.progress.media_total, 3);
  EXPECT_EQ(job.progress.media_copied, 2);

  const fs::path mediaDir = fs::path(job.export_dir) / "media";
  EXPECT_EQ(test::readFile(mediaDir / "hshared.jpg"), "shared-bytes");
  EXPECT_EQ(test::readFile(mediaDir / "hsolo.png"), "png-bytes");
  EXPECT_FALSE(fs::exists(mediaDir / "hmissing.jpg"));
  EXPECT_FALSE(fs::exists(mediaDir / "hignored.jpg"));

  const json manifest = json::parse(test::readFile(fs::path(job.export_dir) / "manifest.json"));
  EXPECT_EQ(manifest["media_count"], 2);
  EXPECT_EQ(manifest["files"], json::array({"media/ (2 files)", "posts.json"}));
}

TEST_F(ExportRunnerTest, FailedExportNeverRemovesAnEarlierBundle) {
  source_.add(test::makePosts(kDid, 10));
  ExportRunner runner(source_, records_, disk_);

  ExportJob first = makeJob();
  runner.run(first);
  ASSERT_EQ(first.progress.status, ExportStatus::Completed) << first.progress.error;
  const auto taken = occupyUpcomingDirectories(10);

  records_.failOnCreate(true);
  ExportJob second = makeJob();
  second.id = "job-2";
  runner.run(second);

  EXPECT_EQ(second.progress.status, ExportStatus::Failed);
  EXPECT_NE(second.export_dir, first.export_dir);
  EXPECT_FALSE(fs::exists(second.export_dir));

  EXPECT_TRUE(fs::exists(fs::path(first.export_dir) / "posts.json"));
  EXPECT_TRUE(fs::exists(fs::path(first.export_dir) / "manifest.json"));
  for (const auto& dir : taken) EXPECT_TRUE(fs::exists(dir / "manifest.json")) << dir;

  ASSERT_EQ(records_.size(), 1u);
  const auto rec = records_.getExportById(kDid + "/" + fs::path(first.export_dir).filename().string());
  ASSERT_TRUE(rec.has_value());
  EXPECT_TRUE(fs::exists(rec->directory_path));
}

TEST_F(ExportRunnerTest, BackToBackExportsGetSeparateBundles) {
  source_.add(test::makePosts(kDid, 10));
  occupyUpcomingDirectories(10);
  ExportRunner runner(source_, records_, disk_);

  ExportJob first = makeJob();
  runner.run(first);
  ExportJob second = makeJob(ExportFormat::Csv);
  second.id = "job-2";
  runner.run(second);

  ASSERT_EQ(first.progress.status, ExportStatus::Completed) << first.progress.error;
  ASSERT_EQ(second.progress.status, ExportStatus::Completed) << second.progress.error;
  EXPECT_NE(first.export_dir, second.export_dir);
  EXPECT_TRUE(fs::exists(fs::path(first.export_dir) / "posts.json"));
  EXPECT_FALSE(fs::exists(fs::path(first.export_dir) / "posts.csv"));
  EXPECT_TRUE(fs::exists(fs::path(second.export_dir) / "posts.csv"));
  EXPECT_EQ(records_.size(), 2u);
}

TEST_F(ExportRunnerTest, ManifestCountsPostsActuallyWritten) {
  OvercountingSource source(7);
  source.add(test::makePosts(kDid, 30));

  ExportRunner runner(source, records_, disk_, 10);
  ExportJob job = makeJob();
  runner.run(job);

  ASSERT_EQ(job.progress.status, ExportStatus::Completed) << job.progress.error;
  EXPECT_EQ(job.progress.posts_total, 37);
  EXPECT_EQ(job.progress.posts_processed, 30);

  const fs::path dir = job.export_dir;
  const json manifest = json::parse(test::readFile(dir / "manifest.json"));
  EXPECT_EQ(manifest["post_count"], 30);
  EXPECT_EQ(json::parse(test::readFile(dir / "posts.json")).size(), 30u);
  EXPECT_EQ(records_.getExportById(kDid + "/" + dir.filename().string())->post_count, 30);
}

TEST_F(ExportRunnerTest, UnusableOutputRootStillReportsRunningThenFailed) {
  test::writeFile(root(), "not a directory");

  ExportRunner runner(source_, records_, disk_);
  ProgressChannel<ExportProgress> channel(100);
  ExportJob job = makeJob();
  runner.run(job, &channel);

  EXPECT_EQ(job.progress.status, ExportStatus::Failed);
  EXPECT_NE(job.progress.error.find("create export directory"), std::string::npos) << job.progress.error;
  EXPECT_TRUE(job.export_dir.empty());

  const auto updates = drain(channel);
  ASSERT_EQ(updates.size(), 2u);
  EXPECT_EQ(updates.front().status, ExportStatus::Running);
  EXPECT_EQ(updates.back().status, ExportStatus::Failed);
}
