#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "core/export/ExportErrors.hpp"
#include "services/api/ApiJson.hpp"

using namespace skya;
using nlohmann::json;

namespace {

// 2024-06-15T12:00:00Z
constexpr int64_t kNow = 1718452800;

} // namespace

TEST(ApiJsonTest, RequestDefaults) {
  const ExportOptions o = exportRequestFromJson(json::object(), "did:plc:a", kNow);
  EXPECT_EQ(o.did, "did:plc:a");
  EXPECT_EQ(o.format, ExportFormat::Json);
  EXPECT_FALSE(o.include_media);
  EXPECT_FALSE(o.date_range.has_value());
}

TEST(ApiJsonTest, RequestWithAllFields) {
  const json body = {
    {"format", "csv"},
    {"include_media", true},
    {"start_date", "2024-01-01"},
    {"end_date", "2024-01-31"},
  };
  const ExportOptions o = exportRequestFromJson(body, "did:plc:a", kNow);
  EXPECT_EQ(o.format, ExportFormat::Csv);
  EXPECT_TRUE(o.include_media);
  ASSERT_TRUE(o.date_range.has_value());
  EXPECT_EQ(o.date_range->start, 1704067200);
  EXPECT_EQ(o.date_range->end, 1706745599);
}

TEST(ApiJsonTest, RequestRejections) {
  EXPECT_THROW(exportRequestFromJson(json::array(), "did:plc:a", kNow), ValidationError);
  EXPECT_THROW(exportRequestFromJson({{"format", "xml"}}, "did:plc:a", kNow), ValidationError);
  EXPECT_THROW(exportRequestFromJson({{"format", 3}}, "did:plc:a", kNow), ValidationError);
  EXPECT_THROW(exportRequestFromJson({{"include_media", "yes"}}, "did:plc:a", kNow), ValidationError);
  EXPECT_THROW(exportRequestFromJson({{"start_date", "2099-01-01"}}, "did:plc:a", kNow), ValidationError);
}

TEST(ApiJsonTest, ProgressPayload) {
  ExportJob job;
  job.id = "0b0e7b4e-0000-4000-8000-000000000000";
  job.progress.status = ExportStatus::Running;
  job.progress.posts_total = 200;
  job.progress.posts_processed = 50;

  json j = progressToJson(job);
  EXPECT_EQ(j["job_id"], job.id);
  EXPECT_EQ(j["status"], "running");
  EXPECT_EQ(j["percent_complete"], 25);
  EXPECT_FALSE(j.contains("error"));

  job.progress.status = ExportStatus::Failed;
  job.progress.error = "export cancelled";
  j = progressToJson(job);
  EXPECT_EQ(j["error"], "export cancelled");
}

TEST(ApiJsonTest, ExportListPayload) {
  ExportRecord r;
  r.id = "did:plc:a/2024-01-01_00-00-00";
  r.did = "did:plc:a";
  r.format = "json";
  r.created_at = 1704067200;
  r.size_bytes = 2048;
  r.post_count = 3;

  ExportPage page;
  page.records.push_back(r);
  page.total = 7;

  const json j = exportPageToJson(page);
  EXPECT_EQ(j["total"], 7);
  ASSERT_EQ(j["exports"].size(), 1u);
  EXPECT_EQ(j["exports"][0]["id"], r.id);
  EXPECT_EQ(j["exports"][0]["created_at"], "2024-01-01T00:00:00Z");
  EXPECT_EQ(j["exports"][0]["size"], "2.0 KB");
  EXPECT_EQ(j["exports"][0]["date_range"], "All posts");
}
