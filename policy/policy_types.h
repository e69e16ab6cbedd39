#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dlpgate {

enum class PolicyAction { kBlock, kMask };

// Global operating posture.
//   kObserve: log only.
//   kWarn:    mask, never block; blocked categories downgrade to warnings.
//   kEnforce: block, otherwise mask.
enum class Mode { kObserve, kWarn, kEnforce };

// Model scoping for one policy. std::nullopt means "no list configured",
// which is not the same as an empty list.
struct ModelRules {
  std::optional<std::vector<std::string>> allow;
  std::optional<std::vector<std::string>> block;
};

struct Policy {
  PolicyAction action{PolicyAction::kMask};
  bool enabled{true};
  // Absent: the policy applies to every model.
  std::optional<ModelRules> models;
};

// Immutable after construction; shared read-only by every request.
struct PolicySet {
  Mode mode{Mode::kEnforce};
  // Absent: every category is enabled.
  std::optional<std::set<std::string>> enabled_types;
  std::map<std::string, Policy> policies;
  std::string audit_log_path;
  bool audit_debug{false};

  // nullptr for categories without a policy.
  const Policy* FindPolicy(const std::string& category) const;
  bool IsTypeEnabled(const std::string& category) const;
};

const char* PolicyActionName(PolicyAction action);
const char* ModeName(Mode mode);

// Case-insensitive parsers. Return false for unknown names.
bool ParsePolicyAction(const std::string& text, PolicyAction* action);
bool ParseMode(const std::string& text, Mode* mode);

// Category tags are lowercase ASCII letters, digits and underscores.
bool IsValidCategoryTag(const std::string& category);

}  // namespace dlpgate
