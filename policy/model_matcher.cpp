#include "policy/model_matcher.h"

#include "server/logging/logger.h"

#include <re2/re2.h>

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace dlpgate {

namespace {

// nullptr entries record patterns that failed to compile.
class PatternCache {
 public:
  std::shared_ptr<const re2::RE2> Get(const std::string& pattern) {
    {
      std::shared_lock<std::shared_mutex> lock(mutex_);
      auto it = compiled_.find(pattern);
      if (it != compiled_.end()) {
        return it->second;
      }
    }
    re2::RE2::Options options;
    options.set_log_errors(false);
    auto regex = std::make_shared<const re2::RE2>(pattern, options);
    std::shared_ptr<const re2::RE2> entry;
    if (regex->ok()) {
      entry = regex;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto [it, inserted] = compiled_.emplace(pattern, entry);
    if (inserted && !entry) {
      log::Warn("policy", "invalid model pattern never matches",
                "pattern=" + pattern + " error=" + regex->error());
    }
    return it->second;
  }

  std::size_t Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return compiled_.size();
  }

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<const re2::RE2>> compiled_;
};

PatternCache& Cache() {
  static PatternCache cache;
  return cache;
}

}  // namespace

bool MatchesModel(const std::string& model_id, const std::string& pattern) {
  auto regex = Cache().Get(pattern);
  if (!regex) {
    return false;
  }
  return re2::RE2::FullMatch(model_id, *regex);
}

std::size_t ModelPatternCacheSize() { return Cache().Size(); }

}  // namespace dlpgate
