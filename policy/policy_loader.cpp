#include "policy/policy_loader.h"

#include "server/logging/logger.h"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>

namespace dlpgate {

namespace {

Mode DefaultMode() {
  Mode mode = Mode::kEnforce;
  if (const char* env_mode = std::getenv("DLPGATE_MODE")) {
    if (!ParseMode(env_mode, &mode)) {
      log::Warn("config", "ignoring invalid DLPGATE_MODE", std::string("value=") + env_mode);
      mode = Mode::kEnforce;
    }
  }
  return mode;
}

std::string RequireTag(const std::string& category, const std::string& where) {
  if (!IsValidCategoryTag(category)) {
    throw PolicyConfigError("invalid category '" + category + "' in " + where +
                            " (expected lowercase letters, digits, underscore)");
  }
  return category;
}

// A pattern list may be a sequence or a single scalar; null means "absent".
std::optional<std::vector<std::string>> ParsePatternList(const YAML::Node& node,
                                                         const std::string& where) {
  if (!node || node.IsNull()) {
    return std::nullopt;
  }
  std::vector<std::string> patterns;
  if (node.IsScalar()) {
    patterns.push_back(node.as<std::string>());
  } else if (node.IsSequence()) {
    for (const auto& item : node) {
      patterns.push_back(item.as<std::string>());
    }
  } else {
    throw PolicyConfigError(where + " must be a list of model patterns");
  }
  return patterns;
}

void ApplyPolicyNode(const std::string& category, const YAML::Node& node, bool known,
                     Policy* policy) {
  const std::string where = "policies." + category;
  if (!node.IsMap()) {
    throw PolicyConfigError(where + " must be a mapping");
  }
  if (node["action"]) {
    PolicyAction action;
    auto text = node["action"].as<std::string>();
    if (!ParsePolicyAction(text, &action)) {
      throw PolicyConfigError("unknown action '" + text + "' in " + where +
                              " (expected block or mask)");
    }
    policy->action = action;
  } else if (!known) {
    throw PolicyConfigError(where + " is a new category and must set an action");
  }
  if (node["enabled"]) {
    policy->enabled = node["enabled"].as<bool>();
  }
  if (node["models"]) {
    const auto& models = node["models"];
    if (models.IsNull()) {
      policy->models.reset();
    } else if (models.IsMap()) {
      ModelRules rules;
      rules.allow = ParsePatternList(models["allow"], where + ".models.allow");
      rules.block = ParsePatternList(models["block"], where + ".models.block");
      policy->models = std::move(rules);
    } else {
      throw PolicyConfigError(where + ".models must be a mapping with allow/block lists");
    }
  }
}

}  // namespace

PolicySet PolicyLoader::DefaultPolicySet() {
  PolicySet set;
  set.mode = DefaultMode();
  for (const char* category : {"credit_card", "ssn", "api_key", "pem_key", "jwt_token",
                               "database_url", "cloud_credential"}) {
    set.policies[category] = Policy{PolicyAction::kBlock, true, std::nullopt};
  }
  for (const char* category : {"email", "phone"}) {
    set.policies[category] = Policy{PolicyAction::kMask, true, std::nullopt};
  }
  return set;
}

PolicySet PolicyLoader::FromNode(const YAML::Node& root) {
  PolicySet set = DefaultPolicySet();
  if (!root || root.IsNull()) {
    ApplyEnvOverrides(&set);
    return set;
  }
  if (!root.IsMap()) {
    throw PolicyConfigError("policy configuration must be a mapping");
  }
  try {
    if (root["mode"]) {
      auto text = root["mode"].as<std::string>();
      if (!ParseMode(text, &set.mode)) {
        throw PolicyConfigError("unknown mode '" + text +
                                "' (expected observe, warn or enforce)");
      }
    }
    if (root["enabled_types"] && !root["enabled_types"].IsNull()) {
      const auto& types = root["enabled_types"];
      if (!types.IsSequence()) {
        throw PolicyConfigError("enabled_types must be a list of categories");
      }
      std::set<std::string> enabled;
      for (const auto& item : types) {
        enabled.insert(RequireTag(item.as<std::string>(), "enabled_types"));
      }
      set.enabled_types = std::move(enabled);
    }
    if (root["audit_log"]) set.audit_log_path = root["audit_log"].as<std::string>();
    if (root["audit_debug"]) set.audit_debug = root["audit_debug"].as<bool>();

    if (root["policies"] && !root["policies"].IsNull()) {
      const auto& policies = root["policies"];
      if (!policies.IsMap()) {
        throw PolicyConfigError("policies must be a mapping of category to policy");
      }
      for (const auto& entry : policies) {
        auto category = RequireTag(entry.first.as<std::string>(), "policies");
        auto it = set.policies.find(category);
        bool known = it != set.policies.end();
        Policy policy = known ? it->second : Policy{};
        ApplyPolicyNode(category, entry.second, known, &policy);
        set.policies[category] = std::move(policy);
      }
    }
  } catch (const YAML::Exception& e) {
    throw PolicyConfigError(std::string("invalid policy configuration: ") + e.what());
  }
  ApplyEnvOverrides(&set);
  return set;
}

PolicySet PolicyLoader::LoadString(const std::string& yaml) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw PolicyConfigError(std::string("failed to parse policy YAML: ") + e.what());
  }
  return FromNode(root);
}

PolicySet PolicyLoader::LoadFile(const std::string& path) {
  if (!std::filesystem::exists(path)) {
    throw PolicyConfigError("policy file not found: " + path);
  }
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw PolicyConfigError("failed to parse policy file " + path + ": " + e.what());
  }
  auto set = FromNode(root);
  log::Info("config", "loaded policy file",
            "path=" + path + " mode=" + ModeName(set.mode) +
                " policies=" + std::to_string(set.policies.size()));
  return set;
}

void PolicyLoader::ApplyEnvOverrides(PolicySet* policies) {
  if (!policies) {
    return;
  }
  if (const char* env_audit = std::getenv("DLPGATE_AUDIT_LOG")) {
    policies->audit_log_path = env_audit;
  }
}

}  // namespace dlpgate
