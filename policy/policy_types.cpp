#include "policy/policy_types.h"

#include <algorithm>
#include <cctype>

namespace dlpgate {

namespace {
std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}
}  // namespace

const Policy* PolicySet::FindPolicy(const std::string& category) const {
  auto it = policies.find(category);
  if (it == policies.end()) {
    return nullptr;
  }
  return &it->second;
}

bool PolicySet::IsTypeEnabled(const std::string& category) const {
  if (!enabled_types) {
    return true;
  }
  return enabled_types->count(category) > 0;
}

const char* PolicyActionName(PolicyAction action) {
  switch (action) {
    case PolicyAction::kBlock:
      return "block";
    case PolicyAction::kMask:
      return "mask";
  }
  return "unknown";
}

const char* ModeName(Mode mode) {
  switch (mode) {
    case Mode::kObserve:
      return "observe";
    case Mode::kWarn:
      return "warn";
    case Mode::kEnforce:
      return "enforce";
  }
  return "unknown";
}

bool ParsePolicyAction(const std::string& text, PolicyAction* action) {
  auto lowered = ToLower(text);
  if (lowered == "block") {
    *action = PolicyAction::kBlock;
  } else if (lowered == "mask") {
    *action = PolicyAction::kMask;
  } else {
    return false;
  }
  return true;
}

bool ParseMode(const std::string& text, Mode* mode) {
  auto lowered = ToLower(text);
  if (lowered == "observe") {
    *mode = Mode::kObserve;
  } else if (lowered == "warn") {
    *mode = Mode::kWarn;
  } else if (lowered == "enforce") {
    *mode = Mode::kEnforce;
  } else {
    return false;
  }
  return true;
}

bool IsValidCategoryTag(const std::string& category) {
  if (category.empty()) {
    return false;
  }
  return std::all_of(category.begin(), category.end(), [](unsigned char c) {
    return std::islower(c) || std::isdigit(c) || c == '_';
  });
}

}  // namespace dlpgate
