#pragma once

#include "detection/detector.h"

#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace re2 {
class RE2;
}

namespace dlpgate {

// Regex-based text detector for the built-in categories:
//   email, phone, ssn, credit_card (Luhn validated),
//   api_key, pem_key, jwt_token, database_url, cloud_credential.
//
// Patterns are compiled once at construction (RE2, linear-time matching) and
// the detector is immutable afterwards, so one instance can be shared by all
// requests. Matches of different categories may overlap; the redaction engine
// resolves overlaps.
class PatternDetector : public TextDetector {
 public:
  using Validator = std::function<bool(const std::string&)>;

  // enabled_types: categories to report; std::nullopt reports all built-ins.
  explicit PatternDetector(
      std::optional<std::set<std::string>> enabled_types = std::nullopt);
  ~PatternDetector() override;

  PatternDetector(const PatternDetector&) = delete;
  PatternDetector& operator=(const PatternDetector&) = delete;

  DetectionMap Detect(const std::string& text) const override;
  std::string Name() const override { return "pattern"; }

  // Categories this detector can report, independent of enabled_types.
  static const std::set<std::string>& BuiltinCategories();

  // Categories that will actually be reported.
  std::vector<std::string> ActiveCategories() const;

 private:
  struct Rule {
    std::string category;
    std::unique_ptr<re2::RE2> regex;
    Validator validator;
  };

  void AddRule(const std::string& category, const std::string& pattern,
               Validator validator = nullptr);

  std::optional<std::set<std::string>> enabled_types_;
  std::vector<Rule> rules_;
};

// Luhn checksum over the digits of `number` (separators ignored).
// Requires 13-19 digits.
bool LuhnValid(const std::string& number);

// Rejects SSNs with area 000/666/9xx, group 00 or serial 0000.
bool SsnValid(const std::string& value);

}  // namespace dlpgate
