#include "policy/policy_resolver.h"

#include "policy/model_matcher.h"

namespace dlpgate {

bool MatchesAny(const std::vector<std::string>& patterns, const std::string& model_id) {
  for (const auto& pattern : patterns) {
    if (MatchesModel(model_id, pattern)) {
      return true;
    }
  }
  return false;
}

bool ShouldApply(const Policy& policy, const std::string& model_id) {
  if (!policy.models) {
    return true;
  }
  const auto& rules = *policy.models;
  if (rules.block && !rules.block->empty() && MatchesAny(*rules.block, model_id)) {
    return true;
  }
  if (rules.allow && !rules.allow->empty() && MatchesAny(*rules.allow, model_id)) {
    return false;
  }
  return !rules.block.has_value();
}

}  // namespace dlpgate
