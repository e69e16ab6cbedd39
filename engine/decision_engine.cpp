#include "engine/decision_engine.h"

#include "policy/policy_resolver.h"
#include "redaction/redaction_engine.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace dlpgate {

namespace {

std::string JoinCategories(const std::vector<std::string>& categories) {
  std::string joined;
  for (const auto& category : categories) {
    if (!joined.empty()) joined += ", ";
    joined += category;
  }
  return joined;
}

}  // namespace

ModeDecisionEngine::ModeDecisionEngine(std::shared_ptr<const PolicySet> policies,
                                       std::shared_ptr<AuditSink> audit)
    : policies_(std::move(policies)), audit_(std::move(audit)) {
  if (!policies_) {
    throw std::invalid_argument("ModeDecisionEngine requires a policy set");
  }
}

Decision ModeDecisionEngine::Evaluate(const EvaluationRequest& request) const {
  auto started = std::chrono::steady_clock::now();
  Decision decision;

  DetectionMap detections = request.text_detections;
  MergeDetections(&detections, request.image_detections);
  if (CountMatches(detections) == 0) {
    GlobalMetrics().RecordDecision("allow");
    return decision;
  }
  for (const auto& [category, matches] : detections) {
    GlobalMetrics().RecordDetections(category, matches.size());
  }

  Buckets buckets = Classify(detections, request.model);
  std::string outcome = "allow";
  switch (policies_->mode) {
    case Mode::kObserve:
      Observe(request, detections, buckets, &decision);
      if (!buckets.applicable.empty()) outcome = "observe";
      break;
    case Mode::kWarn:
      Warn(request, detections, buckets, &decision);
      if (!buckets.applicable.empty()) outcome = "warn";
      break;
    case Mode::kEnforce:
      Enforce(request, buckets, &decision);
      if (decision.blocked) {
        outcome = "block";
      } else if (!buckets.masked.empty()) {
        outcome = "mask";
      }
      break;
  }

  auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() -
                                                           started);
  GlobalMetrics().RecordDecision(outcome);
  GlobalMetrics().RecordEvaluationLatency(elapsed.count());
  log::Debug("engine", "request evaluated",
             "user=" + request.user_id + " model=" + request.model + " mode=" +
                 ModeName(policies_->mode) + " outcome=" + outcome +
                 " events=" + std::to_string(decision.audit_events.size()));
  return decision;
}

ModeDecisionEngine::Buckets ModeDecisionEngine::Classify(const DetectionMap& detections,
                                                         const std::string& model) const {
  Buckets buckets;
  for (const auto& [category, matches] : detections) {
    if (matches.empty()) {
      continue;
    }
    const Policy* policy = policies_->FindPolicy(category);
    if (!policy || !policy->enabled) {
      continue;
    }
    if (!ShouldApply(*policy, model)) {
      log::Debug("engine", "policy skipped for model", "category=" + category + " model=" + model);
      continue;
    }
    buckets.applicable.push_back(category);
    if (policy->action == PolicyAction::kBlock) {
      buckets.blocked.push_back(category);
    } else {
      buckets.masked[category] = matches;
    }
  }
  return buckets;
}

void ModeDecisionEngine::Observe(const EvaluationRequest& request, const DetectionMap& detections,
                                 const Buckets& buckets, Decision* decision) const {
  for (const auto& category : buckets.applicable) {
    Emit(request, category, AuditAction::kObserve, MatchedTexts(detections.at(category)),
         decision);
  }
}

void ModeDecisionEngine::Warn(const EvaluationRequest& request, const DetectionMap& detections,
                              const Buckets& buckets, Decision* decision) const {
  if (!buckets.masked.empty()) {
    Mask(request, buckets, decision);
  }
  for (const auto& category : buckets.blocked) {
    Emit(request, category, AuditAction::kWarn, MatchedTexts(detections.at(category)), decision);
  }
  if (!buckets.blocked.empty() || !buckets.masked.empty()) {
    if (!decision->modified_payload) {
      decision->modified_payload = Payload{request.text, {}};
    }
    decision->modified_payload->metadata[kWarningKey] = kWarningValue;
    log::Warn("engine", "sensitive data allowed in warn mode",
              "user=" + request.user_id + " model=" + request.model);
  }
}

void ModeDecisionEngine::Enforce(const EvaluationRequest& request, const Buckets& buckets,
                                 Decision* decision) const {
  if (!buckets.blocked.empty()) {
    auto categories = JoinCategories(buckets.blocked);
    decision->blocked = true;
    decision->message = "Request blocked: Detected sensitive data (" + categories + ")";
    Emit(request, categories, AuditAction::kBlock, {}, decision);
    log::Info("engine", "request blocked",
              "user=" + request.user_id + " model=" + request.model + " categories=" +
                  categories);
    return;
  }
  if (!buckets.masked.empty()) {
    Mask(request, buckets, decision);
  }
}

void ModeDecisionEngine::Mask(const EvaluationRequest& request, const Buckets& buckets,
                              Decision* decision) const {
  auto outcome = Redact(request.text, buckets.masked);
  decision->modified_payload = Payload{std::move(outcome.redacted_text), {}};
  decision->masked = buckets.masked;
  for (auto& [category, items] : outcome.redacted_items) {
    Emit(request, category, AuditAction::kMask, std::move(items), decision);
  }
}

void ModeDecisionEngine::Emit(const EvaluationRequest& request, std::string category,
                              AuditAction action, std::vector<std::string> items,
                              Decision* decision) const {
  AuditEvent event;
  event.user_id = request.user_id;
  event.category = std::move(category);
  event.action = action;
  event.items = std::move(items);
  event.request_id = request.request_id;
  event.mode = policies_->mode;
  if (audit_) {
    audit_->Record(event);
  }
  decision->audit_events.push_back(std::move(event));
}

}  // namespace dlpgate
