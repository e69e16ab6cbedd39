#include "server/hook/message_content.h"

#include "redaction/redaction_engine.h"
#include "server/logging/logger.h"

#include <algorithm>

using json = nlohmann::json;

namespace dlpgate {

namespace {

int Base64CharValue(unsigned char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return 26 + (c - 'a');
  if (c >= '0' && c <= '9') return 52 + (c - '0');
  if (c == '+' || c == '-') return 62;   // + (standard) or - (URL-safe)
  if (c == '/' || c == '_') return 63;   // / (standard) or _ (URL-safe)
  return -1;
}

std::vector<uint8_t> Base64Decode(const std::string& b64) {
  std::vector<uint8_t> out;
  out.reserve((b64.size() * 3) / 4 + 1);
  int val = 0;
  int valb = -8;
  for (unsigned char c : b64) {
    if (c == '=') {
      break;
    }
    int v = Base64CharValue(c);
    if (v < 0) continue;
    val = ((val << 6) + v) & 0xFFFFFF;
    valb += 6;
    if (valb >= 0) {
      out.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
      valb -= 8;
    }
  }
  return out;
}

std::string StringField(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

ContentPart ParsePart(const json& item) {
  ContentPart part;
  if (!item.is_object()) {
    return part;
  }
  auto type = StringField(item, "type");
  if (type == "text") {
    part.kind = ContentPart::Kind::kText;
    part.text = StringField(item, "text");
  } else if (type == "image_url") {
    part.kind = ContentPart::Kind::kImage;
    auto it = item.find("image_url");
    if (it != item.end()) {
      if (it->is_object()) {
        part.image_ref = StringField(*it, "url");
      } else if (it->is_string()) {
        part.image_ref = it->get<std::string>();
      }
    }
  } else if (type == "image") {
    part.kind = ContentPart::Kind::kImage;
    part.image_ref = StringField(item, "image");
  }
  return part;
}

void AddSegment(ExtractedContent* out, std::size_t message_index, int part_index,
                const std::string& text) {
  if (text.empty()) {
    return;
  }
  if (!out->text.empty()) {
    out->text += ' ';
  }
  out->segments.push_back({message_index, part_index, out->text.size(), text.size()});
  out->text += text;
}

void AddImage(ExtractedContent* out, const std::string& ref) {
  if (ref.rfind("data:image", 0) != 0) {
    if (!ref.empty()) {
      log::Debug("hook", "skipping remote image reference");
    }
    return;
  }
  std::string error;
  auto bytes = DecodeBase64DataUri(ref, &error);
  if (bytes.empty()) {
    log::Warn("hook", "failed to decode inline image", "error=" + error);
    return;
  }
  out->images.push_back(std::move(bytes));
}

// Resolved spans of the joined blob clipped to `segment`, rebased to the
// segment's own offsets. A span crossing the segment edge keeps its label.
std::vector<RedactionSpan> ClipToSegment(const std::vector<RedactionSpan>& spans,
                                         const TextSegment& segment) {
  std::vector<RedactionSpan> clipped;
  const std::size_t begin = segment.offset;
  const std::size_t end = segment.offset + segment.length;
  for (const auto& span : spans) {
    if (span.start >= end || span.end <= begin) {
      continue;
    }
    clipped.push_back({std::max(span.start, begin) - begin, std::min(span.end, end) - begin,
                       span.category});
  }
  return clipped;
}

}  // namespace

std::vector<uint8_t> DecodeBase64DataUri(const std::string& data_uri, std::string* error) {
  // Format: data:<mediatype>;base64,<data>
  if (data_uri.substr(0, 5) != "data:") {
    if (error) *error = "not a data URI";
    return {};
  }
  auto comma = data_uri.find(',');
  if (comma == std::string::npos) {
    if (error) *error = "malformed data URI: missing comma";
    return {};
  }
  auto header = data_uri.substr(0, comma);
  if (header.find("base64") == std::string::npos) {
    if (error) *error = "data URI is not base64 encoded";
    return {};
  }
  auto bytes = Base64Decode(data_uri.substr(comma + 1));
  if (bytes.empty()) {
    if (error) *error = "base64 decode produced empty result";
    return {};
  }
  return bytes;
}

MessageContent ParseMessageContent(const json& message) {
  MessageContent content;
  if (message.is_string()) {
    content.kind = MessageContent::Kind::kPlainText;
    content.text = message.get<std::string>();
    return content;
  }
  if (!message.is_object()) {
    return content;
  }
  auto it = message.find("content");
  if (it == message.end()) {
    return content;
  }
  if (it->is_string()) {
    content.kind = MessageContent::Kind::kPlainText;
    content.text = it->get<std::string>();
  } else if (it->is_array()) {
    content.kind = MessageContent::Kind::kMultiPart;
    for (const auto& item : *it) {
      content.parts.push_back(ParsePart(item));
    }
  }
  return content;
}

ExtractedContent ExtractContent(const json& messages) {
  ExtractedContent out;
  if (!messages.is_array()) {
    return out;
  }
  for (std::size_t i = 0; i < messages.size(); ++i) {
    auto content = ParseMessageContent(messages[i]);
    switch (content.kind) {
      case MessageContent::Kind::kNone:
        break;
      case MessageContent::Kind::kPlainText:
        AddSegment(&out, i, -1, content.text);
        break;
      case MessageContent::Kind::kMultiPart:
        for (std::size_t p = 0; p < content.parts.size(); ++p) {
          const auto& part = content.parts[p];
          if (part.kind == ContentPart::Kind::kText) {
            AddSegment(&out, i, static_cast<int>(p), part.text);
          } else if (part.kind == ContentPart::Kind::kImage) {
            AddImage(&out, part.image_ref);
          }
        }
        break;
    }
  }
  return out;
}

json RewriteMessages(const json& messages, const ExtractedContent& content,
                     const DetectionMap& masked) {
  if (!messages.is_array()) {
    return messages;
  }
  json rewritten = messages;
  for (auto& message : rewritten) {
    if (message.is_string()) {
      message = json{{"content", message.get<std::string>()}};
    }
  }

  // Resolve once on the joined blob so every message agrees with the
  // redacted blob on which bytes are masked and how they are labelled.
  const auto resolved = ResolveSpans(content.text, masked);
  if (resolved.empty()) {
    return rewritten;
  }
  for (const auto& segment : content.segments) {
    auto spans = ClipToSegment(resolved, segment);
    if (spans.empty() || segment.message_index >= rewritten.size()) {
      continue;
    }
    auto redacted = ApplySpans(content.text.substr(segment.offset, segment.length), spans);
    auto& message = rewritten[segment.message_index];
    if (segment.part_index < 0) {
      message["content"] = redacted;
    } else {
      message["content"][static_cast<std::size_t>(segment.part_index)]["text"] = redacted;
    }
  }
  return rewritten;
}

}  // namespace dlpgate
