#pragma once

#include "policy/policy_types.h"

#include <string>
#include <vector>

namespace dlpgate {

// Decides whether `policy`'s action is enforced for `model_id`.
//
// Resolution order, first rule that fires wins:
//   1. No model rules             -> apply (model-unaware policy).
//   2. Block list matches         -> apply (block beats allow).
//   3. Allow list matches         -> skip.
//   4. Otherwise                  -> apply only if no block list is configured.
//
// So an allow-only policy is restrictive by default, a block-only policy is
// permissive by default, and with both lists block overrides allow.
bool ShouldApply(const Policy& policy, const std::string& model_id);

// True if any pattern in `patterns` fully matches `model_id`.
bool MatchesAny(const std::vector<std::string>& patterns, const std::string& model_id);

}  // namespace dlpgate
