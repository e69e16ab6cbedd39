#pragma once

#include "detection/match.h"
#include "policy/policy_types.h"
#include "server/logging/audit_logger.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dlpgate {

struct EvaluationRequest {
  std::string user_id;
  std::string model;
  // The text blob text_detections' offsets refer to.
  std::string text;
  DetectionMap text_detections;
  DetectionMap image_detections;
  std::optional<std::string> request_id;
};

struct Payload {
  std::string text;
  std::map<std::string, std::string> metadata;
};

struct Decision {
  bool blocked{false};
  std::optional<std::string> message;
  // Set when the outgoing request changes: masked text and/or a warning
  // marker in metadata.
  std::optional<Payload> modified_payload;
  // Matches that were masked into modified_payload->text.
  DetectionMap masked;
  std::vector<AuditEvent> audit_events;
};

// Per-request allow / mask / block decision under the configured mode.
//
// Categories without a policy, with a disabled policy, or whose policy does
// not apply to the request's model are ignored entirely. The rest are split
// into blocked and masked buckets by policy action, then:
//   observe: one observe event per category, nothing else.
//   warn:    mask the masked bucket, warn (never block) for the blocked one,
//            mark the payload with X-DLPGate-Warning.
//   enforce: block if the blocked bucket is non-empty, else mask.
//
// Stateless per request; safe to call concurrently.
class ModeDecisionEngine {
 public:
  static constexpr const char* kWarningKey = "X-DLPGate-Warning";
  static constexpr const char* kWarningValue = "violations_detected";

  explicit ModeDecisionEngine(std::shared_ptr<const PolicySet> policies,
                              std::shared_ptr<AuditSink> audit = nullptr);

  Decision Evaluate(const EvaluationRequest& request) const;

  const PolicySet& policies() const { return *policies_; }

 private:
  struct Buckets {
    std::vector<std::string> applicable;
    std::vector<std::string> blocked;
    DetectionMap masked;
  };

  Buckets Classify(const DetectionMap& detections, const std::string& model) const;

  void Observe(const EvaluationRequest& request, const DetectionMap& detections,
               const Buckets& buckets, Decision* decision) const;
  void Warn(const EvaluationRequest& request, const DetectionMap& detections,
            const Buckets& buckets, Decision* decision) const;
  void Enforce(const EvaluationRequest& request, const Buckets& buckets,
               Decision* decision) const;
  // Redacts the masked bucket into decision->modified_payload and emits one
  // mask event per category.
  void Mask(const EvaluationRequest& request, const Buckets& buckets, Decision* decision) const;

  void Emit(const EvaluationRequest& request, std::string category, AuditAction action,
            std::vector<std::string> items, Decision* decision) const;

  std::shared_ptr<const PolicySet> policies_;
  std::shared_ptr<AuditSink> audit_;
};

}  // namespace dlpgate
