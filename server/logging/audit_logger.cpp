#include "server/logging/audit_logger.h"

#include "server/logging/logger.h"

#include <openssl/sha.h>

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace dlpgate {

const char* AuditActionName(AuditAction action) {
  switch (action) {
    case AuditAction::kObserve:
      return "observe";
    case AuditAction::kMask:
      return "mask";
    case AuditAction::kWarn:
      return "warn";
    case AuditAction::kBlock:
      return "block";
  }
  return "unknown";
}

AuditLogger::AuditLogger(const std::string& path, bool debug_mode)
    : path_(path), debug_mode_(debug_mode) {
  if (path.empty()) {
    return;
  }
  auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      log::Error("audit", "cannot create audit log directory",
                 "path=" + parent.string() + " error=" + ec.message());
    }
  }
  stream_.open(path, std::ios::app);
  if (!stream_.is_open()) {
    log::Error("audit", "cannot open audit log, auditing disabled", "path=" + path);
  }
}

std::string AuditLogger::HashContent(const std::string& content) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(content.data()), content.size(), hash);
  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
    hex << std::setw(2) << static_cast<int>(hash[i]);
  }
  return hex.str();
}

json AuditLogger::ToJson(const AuditEvent& event) const {
  auto now = std::chrono::system_clock::now();
  auto ts = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
  json j;
  j["timestamp"] = ts;
  j["user_id"] = event.user_id;
  j["category"] = event.category;
  j["action"] = AuditActionName(event.action);
  j["mode"] = ModeName(event.mode);
  j["request_id"] = event.request_id ? json(*event.request_id) : json(nullptr);
  j["item_count"] = event.items.size();
  if (debug_mode_) {
    j["items"] = event.items;
  } else {
    json hashes = json::array();
    for (const auto& item : event.items) {
      hashes.push_back(HashContent(item));
    }
    j["items_sha256"] = hashes;
  }
  return j;
}

void AuditLogger::Record(const AuditEvent& event) {
  if (!Enabled()) {
    return;
  }
  // Matched text may be cut mid-codepoint; replace rather than throw.
  auto line = ToJson(event).dump(-1, ' ', false, json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(mutex_);
  stream_ << line << "\n";
  stream_.flush();
}

}  // namespace dlpgate
