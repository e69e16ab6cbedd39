#pragma once

#include "detection/detector.h"
#include "engine/decision_engine.h"
#include "policy/policy_types.h"
#include "server/logging/audit_logger.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace dlpgate {

struct HookResult {
  // Set when the request is blocked; the host returns it to the client.
  std::optional<std::string> error;
  // The request to forward: masked messages under "messages", warn markers
  // under "extra_headers".
  nlohmann::json request;
};

// Entry point called by the LLM proxy host around each completion request.
//
// Fails open: a std::exception anywhere in extraction, detection or
// evaluation is logged and the original request is forwarded unchanged.
class DlpHandler {
 public:
  DlpHandler(std::shared_ptr<const PolicySet> policies,
             std::shared_ptr<const TextDetector> text_detector,
             std::shared_ptr<const ImageDetector> image_detector = nullptr,
             std::shared_ptr<AuditSink> audit = nullptr);

  // Loads `config_path` (or the built-in defaults when empty), uses the
  // pattern detector for text and the JSON-lines audit log named by the
  // configuration. Throws PolicyConfigError on a bad configuration.
  static std::unique_ptr<DlpHandler> Create(
      const std::string& config_path = {},
      std::shared_ptr<const ImageDetector> image_detector = nullptr);
  static std::unique_ptr<DlpHandler> Create(
      PolicySet policies, std::shared_ptr<const ImageDetector> image_detector = nullptr);

  HookResult PreCallHook(const std::string& user_id, const std::string& model,
                         const nlohmann::json& messages, const nlohmann::json& request) const;

  // Responses are not inspected.
  std::optional<std::string> PostCallSuccessHook(const std::string& user_id,
                                                 const std::string& model,
                                                 const nlohmann::json& response) const;

  const PolicySet& policies() const { return *policies_; }

 private:
  HookResult Evaluate(const std::string& user_id, const std::string& model,
                      const nlohmann::json& messages, const nlohmann::json& request) const;
  DetectionMap DetectText(const std::string& text) const;
  DetectionMap DetectImage(const std::vector<uint8_t>& image) const;

  std::shared_ptr<const PolicySet> policies_;
  std::shared_ptr<const TextDetector> text_detector_;
  std::shared_ptr<const ImageDetector> image_detector_;
  ModeDecisionEngine engine_;
};

}  // namespace dlpgate
