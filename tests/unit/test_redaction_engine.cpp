#include <catch2/catch_test_macros.hpp>

#include "redaction/redaction_engine.h"

#include <algorithm>
#include <string>
#include <vector>

using namespace dlpgate;

namespace {
Match At(const std::string& text, const std::string& needle) {
  auto start = text.find(needle);
  return Match(needle, start, start + needle.size());
}
}  // namespace

TEST_CASE("PlaceholderFor upper-cases the category", "[redaction]") {
  REQUIRE(PlaceholderFor("email") == "[REDACTED_EMAIL]");
  REQUIRE(PlaceholderFor("credit_card") == "[REDACTED_CREDIT_CARD]");
}

TEST_CASE("Redact replaces a single span", "[redaction]") {
  std::string text = "My email is john@example.com";
  DetectionMap detections{{"email", {At(text, "john@example.com")}}};

  auto outcome = Redact(text, detections);
  REQUIRE(outcome.redacted_text == "My email is [REDACTED_EMAIL]");
  REQUIRE(outcome.redacted_items["email"] == std::vector<std::string>{"john@example.com"});
}

TEST_CASE("Redact preserves surrounding text for any category order", "[redaction]") {
  std::string text = "a@b.io called 555-123-4567 about 123-45-6789, then a@b.io again.";
  std::vector<std::pair<std::string, std::vector<Match>>> entries{
      {"email", {Match("a@b.io", 0, 6), Match("a@b.io", 51, 57)}},
      {"phone", {At(text, "555-123-4567")}},
      {"ssn", {At(text, "123-45-6789")}},
  };
  const std::string expected =
      "[REDACTED_EMAIL] called [REDACTED_PHONE] about [REDACTED_SSN], then [REDACTED_EMAIL] "
      "again.";
  REQUIRE(text.substr(51, 6) == "a@b.io");

  std::vector<std::size_t> order{0, 1, 2};
  do {
    DetectionMap detections;
    for (auto index : order) {
      const auto& [category, matches] = entries[index];
      // Within a category, detection order is irrelevant too.
      auto reversed = matches;
      std::reverse(reversed.begin(), reversed.end());
      detections[category] = reversed;
    }
    auto outcome = Redact(text, detections);
    REQUIRE(outcome.redacted_text == expected);
    REQUIRE(outcome.redacted_items.size() == 3);
  } while (std::next_permutation(order.begin(), order.end()));
}

TEST_CASE("Redact keeps adjacent spans intact", "[redaction]") {
  std::string text = "AAAABBBB";
  DetectionMap detections{{"a", {Match("AAAA", 0, 4)}}, {"b", {Match("BBBB", 4, 8)}}};
  REQUIRE(Redact(text, detections).redacted_text == "[REDACTED_A][REDACTED_B]");
}

TEST_CASE("Redact with no detections returns the text unchanged", "[redaction]") {
  auto outcome = Redact("nothing to see", {});
  REQUIRE(outcome.redacted_text == "nothing to see");
  REQUIRE(outcome.redacted_items.empty());
}

TEST_CASE("Overlapping spans keep the longest match", "[redaction]") {
  std::string text = "contact john.doe@example.com now";
  DetectionMap detections{
      {"email", {At(text, "john.doe@example.com")}},
      {"person", {At(text, "john.doe")}},
  };
  auto outcome = Redact(text, detections);
  REQUIRE(outcome.redacted_text == "contact [REDACTED_EMAIL] now");
  // Dropped spans are still audited.
  REQUIRE(outcome.redacted_items["person"] == std::vector<std::string>{"john.doe"});
}

TEST_CASE("Partially overlapping spans are merged into their union", "[redaction]") {
  std::string text = "key=ABCDEFGHIJ tail";
  DetectionMap detections{{"token", {Match("key=ABCDEF", 0, 10)}},
                          {"api_key", {Match("EFGHIJ", 8, 14)}}};

  auto outcome = Redact(text, detections);
  REQUIRE(outcome.redacted_text == "[REDACTED_TOKEN] tail");
  REQUIRE(outcome.redacted_items["api_key"] == std::vector<std::string>{"EFGHIJ"});
}

TEST_CASE("Merged span takes the label of its longest member", "[redaction]") {
  // "late" is longer but starts second; it still names the union.
  std::string text = "0123456789";
  DetectionMap detections{{"early", {Match("123", 1, 4)}}, {"late", {Match("23456", 2, 7)}}};
  auto spans = ResolveSpans(text, detections);
  REQUIRE(spans.size() == 1);
  REQUIRE(spans[0].start == 1);
  REQUIRE(spans[0].end == 7);
  REQUIRE(spans[0].category == "late");
  REQUIRE(ApplySpans(text, spans) == "0[REDACTED_LATE]789");
}

TEST_CASE("Equal-length overlaps are labelled by the earliest span", "[redaction]") {
  std::string text = "0123456789";
  DetectionMap detections{{"late", {Match("3456", 3, 7)}}, {"early", {Match("1234", 1, 5)}}};
  REQUIRE(Redact(text, detections).redacted_text == "0[REDACTED_EARLY]789");
}

TEST_CASE("Chains of overlaps collapse into one span", "[redaction]") {
  std::string text = "aaaa bbbb cccc dd";
  DetectionMap detections{{"x", {Match("aaaa b", 0, 6), Match("cccc", 10, 14)}},
                          {"y", {Match("bbbb cc", 5, 12)}}};
  auto spans = ResolveSpans(text, detections);
  REQUIRE(spans.size() == 1);
  REQUIRE(spans[0].end == 14);
  REQUIRE(Redact(text, detections).redacted_text == "[REDACTED_Y] dd");
}

TEST_CASE("Identical spans in two categories resolve by category name", "[redaction]") {
  std::string text = "id 4111111111111111";
  DetectionMap detections{{"credit_card", {Match("4111111111111111", 3, 19)}},
                          {"account", {Match("4111111111111111", 3, 19)}}};
  REQUIRE(Redact(text, detections).redacted_text == "id [REDACTED_ACCOUNT]");
}

TEST_CASE("Image and out-of-range matches are not applied to the text", "[redaction]") {
  std::string text = "short text";
  DetectionMap detections{
      {"email", {Match("x@y.io", 0, 6, MatchOrigin::kImage)}},
      {"ssn", {Match("123-45-6789", 5, 40)}},
      {"phone", {Match("bad", 8, 3)}},
  };
  auto outcome = Redact(text, detections);
  REQUIRE(outcome.redacted_text == text);
  REQUIRE(outcome.redacted_items.size() == 3);
  REQUIRE(outcome.redacted_items["email"] == std::vector<std::string>{"x@y.io"});
}
