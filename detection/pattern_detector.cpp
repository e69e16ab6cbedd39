#include "detection/pattern_detector.h"

#include "server/logging/logger.h"

#include <re2/re2.h>

#include <cctype>

namespace dlpgate {

namespace {

std::string DigitsOnly(const std::string& value) {
  std::string digits;
  digits.reserve(value.size());
  for (char c : value) {
    if (std::isdigit(static_cast<unsigned char>(c))) {
      digits += c;
    }
  }
  return digits;
}

}  // namespace

bool LuhnValid(const std::string& number) {
  auto digits = DigitsOnly(number);
  if (digits.size() < 13 || digits.size() > 19) {
    return false;
  }
  int sum = 0;
  bool double_digit = false;
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    int digit = *it - '0';
    if (double_digit) {
      digit *= 2;
      if (digit > 9) {
        digit -= 9;
      }
    }
    sum += digit;
    double_digit = !double_digit;
  }
  return sum % 10 == 0;
}

bool SsnValid(const std::string& value) {
  auto digits = DigitsOnly(value);
  if (digits.size() != 9) {
    return false;
  }
  int area = std::stoi(digits.substr(0, 3));
  int group = std::stoi(digits.substr(3, 2));
  int serial = std::stoi(digits.substr(5, 4));
  if (area == 0 || area == 666 || area >= 900) {
    return false;
  }
  return group != 0 && serial != 0;
}

PatternDetector::PatternDetector(std::optional<std::set<std::string>> enabled_types)
    : enabled_types_(std::move(enabled_types)) {
  AddRule("email", R"([A-Za-z0-9._%+-]+@[A-Za-z0-9-]+(?:\.[A-Za-z0-9-]+)*\.[A-Za-z]{2,})");
  AddRule("credit_card", R"(\b(?:\d[ -]?){12,18}\d\b)", LuhnValid);
  AddRule("ssn", R"(\b\d{3}-\d{2}-\d{4}\b)", SsnValid);
  AddRule("phone",
          R"((?:\+\d{1,3}[-. ]?)?(?:\(\d{3}\) ?|\b\d{3}[-. ])\d{3}[-. ]\d{4}\b)");
  AddRule("api_key",
          R"(\b(?:sk-[A-Za-z0-9_-]{20,}|AKIA[0-9A-Z]{16}|ghp_[A-Za-z0-9]{36}|)"
          R"(xox[abprs]-[A-Za-z0-9-]{10,}|AIza[0-9A-Za-z_-]{35})\b)");
  AddRule("pem_key",
          R"(-----BEGIN [A-Z ]*PRIVATE KEY-----[\s\S]*?-----END [A-Z ]*PRIVATE KEY-----)");
  AddRule("jwt_token", R"(\beyJ[A-Za-z0-9_-]+\.eyJ[A-Za-z0-9_-]+\.[A-Za-z0-9_-]+)");
  AddRule("database_url",
          R"(\b(?:postgres(?:ql)?|mysql|mariadb|mongodb(?:\+srv)?|redis|mssql|sqlserver))"
          R"(://[^\s:/@]+:[^\s@]+@[^\s'"]+)");
  AddRule("cloud_credential",
          R"((?i)\b(?:aws_access_key_id|aws_secret_access_key|aws_session_token))"
          R"(\s*[=:]\s*[A-Za-z0-9/+=]{16,})");
}

PatternDetector::~PatternDetector() = default;

void PatternDetector::AddRule(const std::string& category, const std::string& pattern,
                              Validator validator) {
  if (enabled_types_ && enabled_types_->count(category) == 0) {
    return;
  }
  re2::RE2::Options options;
  options.set_log_errors(false);
  auto regex = std::make_unique<re2::RE2>(pattern, options);
  if (!regex->ok()) {
    log::Error("detector", "built-in pattern failed to compile",
               "category=" + category + " error=" + regex->error());
    return;
  }
  rules_.push_back(Rule{category, std::move(regex), std::move(validator)});
}

const std::set<std::string>& PatternDetector::BuiltinCategories() {
  static const std::set<std::string> kCategories{
      "api_key", "cloud_credential", "credit_card", "database_url", "email",
      "jwt_token", "pem_key", "phone", "ssn"};
  return kCategories;
}

std::vector<std::string> PatternDetector::ActiveCategories() const {
  std::vector<std::string> categories;
  categories.reserve(rules_.size());
  for (const auto& rule : rules_) {
    categories.push_back(rule.category);
  }
  return categories;
}

DetectionMap PatternDetector::Detect(const std::string& text) const {
  DetectionMap results;
  if (text.empty()) {
    return results;
  }
  const re2::StringPiece input(text.data(), text.size());
  for (const auto& rule : rules_) {
    std::size_t pos = 0;
    re2::StringPiece found;
    while (pos <= text.size() &&
           rule.regex->Match(input, pos, text.size(), re2::RE2::UNANCHORED, &found, 1)) {
      auto start = static_cast<std::size_t>(found.data() - text.data());
      auto end = start + found.size();
      if (found.empty()) {
        pos = end + 1;
        continue;
      }
      std::string matched(found.data(), found.size());
      if (!rule.validator || rule.validator(matched)) {
        results[rule.category].emplace_back(std::move(matched), start, end);
      }
      pos = end;
    }
  }
  return results;
}

}  // namespace dlpgate
