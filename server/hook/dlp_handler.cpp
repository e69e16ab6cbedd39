#include "server/hook/dlp_handler.h"

#include "detection/pattern_detector.h"
#include "policy/policy_loader.h"
#include "server/hook/message_content.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <exception>
#include <utility>

using json = nlohmann::json;

namespace dlpgate {

namespace {

std::optional<std::string> RequestId(const json& request) {
  if (!request.is_object()) {
    return std::nullopt;
  }
  for (const char* key : {"litellm_call_id", "request_id"}) {
    auto it = request.find(key);
    if (it != request.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return std::nullopt;
}

}  // namespace

DlpHandler::DlpHandler(std::shared_ptr<const PolicySet> policies,
                       std::shared_ptr<const TextDetector> text_detector,
                       std::shared_ptr<const ImageDetector> image_detector,
                       std::shared_ptr<AuditSink> audit)
    : policies_(policies),
      text_detector_(std::move(text_detector)),
      image_detector_(std::move(image_detector)),
      engine_(std::move(policies), std::move(audit)) {}

std::unique_ptr<DlpHandler> DlpHandler::Create(
    const std::string& config_path, std::shared_ptr<const ImageDetector> image_detector) {
  PolicySet policies = config_path.empty() ? PolicyLoader::DefaultPolicySet()
                                           : PolicyLoader::LoadFile(config_path);
  if (config_path.empty()) {
    PolicyLoader::ApplyEnvOverrides(&policies);
  }
  return Create(std::move(policies), std::move(image_detector));
}

std::unique_ptr<DlpHandler> DlpHandler::Create(
    PolicySet policies, std::shared_ptr<const ImageDetector> image_detector) {
  auto shared = std::make_shared<const PolicySet>(std::move(policies));
  auto text_detector = std::make_shared<PatternDetector>(shared->enabled_types);
  std::shared_ptr<AuditSink> audit;
  if (!shared->audit_log_path.empty()) {
    audit = std::make_shared<AuditLogger>(shared->audit_log_path, shared->audit_debug);
  }
  log::Info("hook", "dlp handler ready",
            std::string("mode=") + ModeName(shared->mode) +
                " policies=" + std::to_string(shared->policies.size()) +
                " audit=" + (shared->audit_log_path.empty() ? "off" : shared->audit_log_path));
  return std::make_unique<DlpHandler>(shared, std::move(text_detector),
                                      std::move(image_detector), std::move(audit));
}

HookResult DlpHandler::PreCallHook(const std::string& user_id, const std::string& model,
                                   const json& messages, const json& request) const {
  GlobalMetrics().RecordRequest();
  try {
    return Evaluate(user_id, model, messages, request);
  } catch (const std::exception& e) {
    GlobalMetrics().RecordHookError();
    log::Error("hook", "pre-call hook failed, forwarding request unchanged",
               "user=" + user_id + " model=" + model + " error=" + e.what());
    return HookResult{std::nullopt, request};
  }
}

std::optional<std::string> DlpHandler::PostCallSuccessHook(const std::string&,
                                                           const std::string&,
                                                           const json&) const {
  return std::nullopt;
}

HookResult DlpHandler::Evaluate(const std::string& user_id, const std::string& model,
                                const json& messages, const json& request) const {
  auto content = ExtractContent(messages);

  EvaluationRequest evaluation;
  evaluation.user_id = user_id;
  evaluation.model = model;
  evaluation.request_id = RequestId(request);
  if (!content.text.empty()) {
    evaluation.text_detections = DetectText(content.text);
  }
  for (const auto& image : content.images) {
    MergeDetections(&evaluation.image_detections, DetectImage(image));
  }
  if (policies_->enabled_types) {
    evaluation.text_detections =
        FilterDetections(evaluation.text_detections, *policies_->enabled_types);
    evaluation.image_detections =
        FilterDetections(evaluation.image_detections, *policies_->enabled_types);
  }
  evaluation.text = content.text;

  Decision decision = engine_.Evaluate(evaluation);
  if (decision.blocked) {
    return HookResult{decision.message, request};
  }

  HookResult result{std::nullopt, request};
  if (!decision.modified_payload) {
    return result;
  }
  if (!decision.masked.empty()) {
    result.request["messages"] = RewriteMessages(messages, content, decision.masked);
  }
  if (!decision.modified_payload->metadata.empty()) {
    auto& headers = result.request["extra_headers"];
    if (!headers.is_object()) {
      headers = json::object();
    }
    for (const auto& [key, value] : decision.modified_payload->metadata) {
      headers[key] = value;
    }
  }
  return result;
}

DetectionMap DlpHandler::DetectText(const std::string& text) const {
  if (!text_detector_) {
    return {};
  }
  try {
    return text_detector_->Detect(text);
  } catch (const std::exception& e) {
    log::Error("detector", "text detection failed, treating as no detections",
               "detector=" + text_detector_->Name() + " error=" + e.what());
    return {};
  }
}

DetectionMap DlpHandler::DetectImage(const std::vector<uint8_t>& image) const {
  if (!image_detector_) {
    return {};
  }
  try {
    return image_detector_->Detect(image);
  } catch (const std::exception& e) {
    log::Error("detector", "image detection failed, treating as no detections",
               "detector=" + image_detector_->Name() + " error=" + e.what());
    return {};
  }
}

}  // namespace dlpgate
