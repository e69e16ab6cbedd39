#pragma once

#include "policy/policy_types.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dlpgate {

enum class AuditAction { kObserve, kMask, kWarn, kBlock };

const char* AuditActionName(AuditAction action);

// One (category, action) fact emitted by the decision engine. Never mutated
// after emission.
struct AuditEvent {
  std::string user_id;
  // For enforce-mode blocks: every blocked category, joined with ", ".
  std::string category;
  AuditAction action{AuditAction::kObserve};
  // Original matched texts.
  std::vector<std::string> items;
  std::optional<std::string> request_id;
  Mode mode{Mode::kEnforce};
};

// Receives audit events, one call per event, in emission order per request.
// Implementations must be safe to call from concurrent requests.
class AuditSink {
 public:
  virtual ~AuditSink() = default;
  virtual void Record(const AuditEvent& event) = 0;
};

// Appends one JSON object per event to a file (JSON lines).
//
// Matched items are written as SHA-256 hex digests so sensitive values never
// reach the disk, unless debug_mode is set, in which case they are written
// verbatim. Without a path the logger is disabled and Record() is a no-op.
class AuditLogger : public AuditSink {
 public:
  AuditLogger() = default;
  explicit AuditLogger(const std::string& path, bool debug_mode = false);

  bool Enabled() const { return stream_.is_open(); }
  const std::string& Path() const { return path_; }

  void Record(const AuditEvent& event) override;

  // Serialized form of `event` as written to the file.
  nlohmann::json ToJson(const AuditEvent& event) const;

  // Hash a string to its SHA-256 hex representation (64 chars).
  static std::string HashContent(const std::string& content);

 private:
  std::string path_;
  std::ofstream stream_;
  std::mutex mutex_;
  bool debug_mode_{false};
};

}  // namespace dlpgate
