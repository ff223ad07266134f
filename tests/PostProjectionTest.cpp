#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "core/export/PostProjection.hpp"

using namespace skya;

TEST(PostProjectionTest, ImageEmbedHashes) {
  const auto hashes = extractMediaHashes(
      R"({"images":[{"fullsize":"https://cdn.bsky.app/img/feed_fullsize/plain/did:plc:a/bafkreia@jpeg"},)"
      R"({"fullsize":"https://cdn.bsky.app/img/feed_fullsize/plain/did:plc:a/bafkreib@png"}]})");
  EXPECT_EQ(hashes, (std::vector<std::string>{"bafkreia", "bafkreib"}));
}

TEST(PostProjectionTest, RecordWithMediaHashes) {
  const auto hashes = extractMediaHashes(
      R"({"record":{"uri":"at://x"},"media":{"images":[{"fullsize":"https://cdn/x/bafkquoted@jpeg"}]}})");
  EXPECT_EQ(hashes, (std::vector<std::string>{"bafkquoted"}));
}

TEST(PostProjectionTest, ExternalThumbHash) {
  const auto hashes = extractMediaHashes(
      R"({"external":{"uri":"https://example.com","thumb":"https://cdn/thumb/bafkthumb@jpeg"}})");
  EXPECT_EQ(hashes, (std::vector<std::string>{"bafkthumb"}));
}

TEST(PostProjectionTest, MalformedEmbedYieldsNothing) {
  EXPECT_TRUE(extractMediaHashes("").empty());
  EXPECT_TRUE(extractMediaHashes("{not json").empty());
  EXPECT_TRUE(extractMediaHashes("[1,2,3]").empty());
  EXPECT_TRUE(extractMediaHashes(R"({"images":"nope"})").empty());
  EXPECT_TRUE(extractMediaHashes(R"({"images":[{"fullsize":42},{"thumb":"x"}]})").empty());
}

TEST(PostProjectionTest, HashFromUrl) {
  EXPECT_EQ(extractHashFromUrl("https://cdn/a/b/bafkabc@jpeg"), "bafkabc");
  EXPECT_EQ(extractHashFromUrl("https://cdn/a/b/bafkabc"), "bafkabc");
  EXPECT_EQ(extractHashFromUrl("no-slash"), "");
}

TEST(PostProjectionTest, CsvEscapeQuotesOnlyWhenNeeded) {
  EXPECT_EQ(csvEscape("plain"), "plain");
  EXPECT_EQ(csvEscape("a,b"), "\"a,b\"");
  EXPECT_EQ(csvEscape("say \"x\""), "\"say \"\"x\"\"\"");
  EXPECT_EQ(csvEscape("two\nlines"), "\"two\nlines\"");
  EXPECT_EQ(csvEscape("cr\r"), "\"cr\r\"");
}

TEST(PostProjectionTest, CsvRowListsMediaOnlyForMediaPosts) {
  Post p = test::makePost("did:plc:a", 1, 1700000000);
  p.embed_data = R"({"images":[{"fullsize":"https://cdn/x/h1@jpeg"},{"fullsize":"https://cdn/x/h2@jpeg"}]})";

  auto row = postToCsvRow(p);
  ASSERT_EQ(row.size(), csvHeader().size());
  EXPECT_EQ(row[11], "false");
  EXPECT_EQ(row[12], "");

  p.has_media = true;
  row = postToCsvRow(p);
  EXPECT_EQ(row[11], "true");
  EXPECT_EQ(row[12], "h1;h2");
  EXPECT_EQ(row[4], "2023-11-14T22:13:20Z");
}

TEST(PostProjectionTest, JsonOmitsEmptyOptionalFields) {
  const Post p = test::makePost("did:plc:a", 1, 1700000000);
  const auto j = postToJson(p);
  EXPECT_EQ(j["uri"], p.uri);
  EXPECT_EQ(j["created_at"], "2023-11-14T22:13:20Z");
  EXPECT_FALSE(j.contains("reply_parent"));
  EXPECT_FALSE(j.contains("embed_data"));
  EXPECT_FALSE(j.contains("labels"));
}

TEST(PostProjectionTest, JsonEmbedsParsedDataOrRawText) {
  Post p = test::makePost("did:plc:a", 1, 1700000000);
  p.embed_type = "external";
  p.embed_data = R"({"external":{"uri":"https://example.com"}})";
  p.labels = "not-json";

  const auto j = postToJson(p);
  EXPECT_EQ(j["embed_type"], "external");
  ASSERT_TRUE(j["embed_data"].is_object());
  EXPECT_EQ(j["embed_data"]["external"]["uri"], "https://example.com");
  EXPECT_EQ(j["labels"], "not-json");
}
