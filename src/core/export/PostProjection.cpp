#include "PostProjection.hpp"

#include "core/util/TimeFormat.hpp"

using nlohmann::json;

namespace skya {

const std::vector<std::string>& csvHeader() {
  static const std::vector<std::string> header = {
    "URI", "CID", "DID", "Text", "CreatedAt",
    "LikeCount", "RepostCount", "ReplyCount", "QuoteCount",
    "IsReply", "ReplyParent", "HasMedia", "MediaFiles", "EmbedType", "IndexedAt",
  };
  return header;
}

static std::string join(const std::vector<std::string>& parts, char sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i) out += sep;
    out += parts[i];
  }
  return out;
}

std::vector<std::string> postToCsvRow(const Post& p) {
  const std::string mediaFiles =
      p.has_media ? join(extractMediaHashes(p.embed_data), ';') : std::string();

  return {
    p.uri,
    p.cid,
    p.did,
    p.text,
    format_iso8601(p.created_at),
    std::to_string(p.like_count),
    std::to_string(p.repost_count),
    std::to_string(p.reply_count),
    std::to_string(p.quote_count),
    p.is_reply ? "true" : "false",
    p.reply_parent,
    p.has_media ? "true" : "false",
    mediaFiles,
    p.embed_type,
    format_iso8601(p.indexed_at),
  };
}

static json rawJsonOrText(const std::string& raw) {
  json parsed = json::parse(raw, nullptr, false);
  if (parsed.is_discarded()) return json(raw);
  return parsed;
}

json postToJson(const Post& p) {
  json j = {
    {"uri", p.uri},
    {"cid", p.cid},
    {"did", p.did},
    {"text", p.text},
    {"created_at", format_iso8601(p.created_at)},
    {"indexed_at", format_iso8601(p.indexed_at)},
    {"has_media", p.has_media},
    {"like_count", p.like_count},
    {"repost_count", p.repost_count},
    {"reply_count", p.reply_count},
    {"quote_count", p.quote_count},
    {"is_reply", p.is_reply},
    {"archived_at", format_iso8601(p.archived_at)},
  };
  if (!p.reply_parent.empty()) j["reply_parent"] = p.reply_parent;
  if (!p.embed_type.empty()) j["embed_type"] = p.embed_type;
  if (!p.embed_data.empty()) j["embed_data"] = rawJsonOrText(p.embed_data);
  if (!p.labels.empty()) j["labels"] = rawJsonOrText(p.labels);
  return j;
}

std::string dumpRecord(const json& j, int indent) {
  // Archived text is not guaranteed to be valid UTF-8.
  return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

static void collectImageHashes(const json& images, std::vector<std::string>& out) {
  if (!images.is_array()) return;
  for (const auto& img : images) {
    if (!img.is_object()) continue;
    auto it = img.find("fullsize");
    if (it == img.end() || !it->is_string()) continue;
    std::string hash = extractHashFromUrl(it->get<std::string>());
    if (!hash.empty()) out.push_back(std::move(hash));
  }
}

std::vector<std::string> extractMediaHashes(const std::string& embedJson) {
  std::vector<std::string> hashes;
  if (embedJson.empty()) return hashes;

  const json embed = json::parse(embedJson, nullptr, false);
  if (embed.is_discarded() || !embed.is_object()) return hashes;

  // plain image set
  if (auto it = embed.find("images"); it != embed.end()) collectImageHashes(*it, hashes);

  // record_with_media nests the image set under "media"
  if (auto it = embed.find("media"); it != embed.end() && it->is_object()) {
    if (auto imgs = it->find("images"); imgs != it->end()) collectImageHashes(*imgs, hashes);
  }

  // external link card thumbnail
  if (auto it = embed.find("external"); it != embed.end() && it->is_object()) {
    auto thumb = it->find("thumb");
    if (thumb != it->end() && thumb->is_string()) {
      std::string hash = extractHashFromUrl(thumb->get<std::string>());
      if (!hash.empty()) hashes.push_back(std::move(hash));
    }
  }
  return hashes;
}

std::string extractHashFromUrl(const std::string& url) {
  const auto slash = url.rfind('/');
  if (slash == std::string::npos) return {};
  const std::string name = url.substr(slash + 1);
  const auto at = name.find('@');
  return at == std::string::npos ? name : name.substr(0, at);
}

std::string csvEscape(const std::string& field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
  std::string out;
  out.reserve(field.size() + 2);
  out += '"';
  for (char c : field) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

} // namespace skya
