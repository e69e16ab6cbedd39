#pragma once

#include <cstddef>
#include <string>

namespace dlpgate {

// True when `pattern`, read as an RE2 regular expression, matches the whole
// of `model_id`. A literal identifier matches only itself.
//
// A pattern that fails to compile never matches; the failure is logged once
// per distinct pattern. Compiled patterns are cached process-wide and the
// cache is safe for concurrent callers.
bool MatchesModel(const std::string& model_id, const std::string& pattern);

// Number of distinct patterns seen so far (valid and invalid).
std::size_t ModelPatternCacheSize();

}  // namespace dlpgate
