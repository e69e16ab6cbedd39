#pragma once

#include "detection/match.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace dlpgate {

// One part of a multi-part (OpenAI-style) message content array.
struct ContentPart {
  enum class Kind { kText, kImage, kOther };
  Kind kind{Kind::kOther};
  std::string text;       // kText
  std::string image_ref;  // kImage: data URI or URL
};

// A message's content, resolved once from JSON.
struct MessageContent {
  enum class Kind { kNone, kPlainText, kMultiPart };
  Kind kind{Kind::kNone};
  std::string text;                 // kPlainText
  std::vector<ContentPart> parts;   // kMultiPart
};

// Where a piece of message text landed in the joined text blob.
struct TextSegment {
  std::size_t message_index{0};
  // Index into the content array, or -1 for plain-text content.
  int part_index{-1};
  std::size_t offset{0};
  std::size_t length{0};
};

struct ExtractedContent {
  // Non-empty texts of every message, in order, joined with a single space.
  std::string text;
  std::vector<TextSegment> segments;
  // Decoded inline images, in order of appearance.
  std::vector<std::vector<uint8_t>> images;
};

// Accepts a message object ({"content": ...}) or a bare string message.
MessageContent ParseMessageContent(const nlohmann::json& message);

// Walks an OpenAI-style messages array. Non-array input yields nothing.
// Only base64 data:image URIs are decoded; remote image URLs are skipped.
ExtractedContent ExtractContent(const nlohmann::json& messages);

// Decode a base64 data URI (data:image/...;base64,...) to raw bytes.
// Returns empty vector on error; sets *error if non-null.
std::vector<uint8_t> DecodeBase64DataUri(const std::string& data_uri,
                                         std::string* error = nullptr);

// Returns a copy of `messages` with every masked kText span of the joined
// blob replaced by its placeholder inside the message text it came from.
// Overlaps are resolved on the joined blob (see ResolveSpans), then spans
// crossing a message boundary are clipped per message. Bare string
// messages are returned as {"content": ...} objects; all other fields and
// non-text parts are preserved.
nlohmann::json RewriteMessages(const nlohmann::json& messages, const ExtractedContent& content,
                               const DetectionMap& masked);

}  // namespace dlpgate
