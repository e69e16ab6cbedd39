#include <catch2/catch_test_macros.hpp>

#include "policy/policy_resolver.h"

using namespace dlpgate;

namespace {
Policy WithRules(std::optional<std::vector<std::string>> allow,
                 std::optional<std::vector<std::string>> block) {
  Policy policy;
  policy.action = PolicyAction::kBlock;
  policy.models = ModelRules{std::move(allow), std::move(block)};
  return policy;
}
}  // namespace

TEST_CASE("Policy without model rules applies to every model", "[policy]") {
  Policy policy;
  REQUIRE(ShouldApply(policy, "openai/gpt-4"));
  REQUIRE(ShouldApply(policy, "self-hosted/llama2"));
}

TEST_CASE("Block list takes precedence over allow list", "[policy]") {
  auto policy = WithRules(std::vector<std::string>{"openai/gpt-4"},
                          std::vector<std::string>{"openai/.*"});
  REQUIRE(ShouldApply(policy, "openai/gpt-4"));
  REQUIRE(ShouldApply(policy, "openai/gpt-3.5"));
  REQUIRE_FALSE(ShouldApply(policy, "self-hosted/llama2"));
}

TEST_CASE("Allow-only policy applies unless the model is allowed", "[policy]") {
  auto policy = WithRules(std::vector<std::string>{"self-hosted/.*"}, std::nullopt);
  REQUIRE(ShouldApply(policy, "openai/gpt-4"));
  REQUIRE_FALSE(ShouldApply(policy, "self-hosted/llama2"));
}

TEST_CASE("Block-only policy applies only to blocked models", "[policy]") {
  auto policy = WithRules(std::nullopt, std::vector<std::string>{"openai/.*"});
  REQUIRE_FALSE(ShouldApply(policy, "self-hosted/llama2"));
  REQUIRE(ShouldApply(policy, "openai/gpt-4"));
}

TEST_CASE("Empty lists differ from absent lists", "[policy]") {
  // A configured but empty block list still turns the policy into a deny-list.
  auto empty_block = WithRules(std::nullopt, std::vector<std::string>{});
  REQUIRE_FALSE(ShouldApply(empty_block, "openai/gpt-4"));

  auto empty_allow = WithRules(std::vector<std::string>{}, std::nullopt);
  REQUIRE(ShouldApply(empty_allow, "openai/gpt-4"));

  auto neither = WithRules(std::nullopt, std::nullopt);
  REQUIRE(ShouldApply(neither, "openai/gpt-4"));
}

TEST_CASE("Malformed pattern in a block list fails closed", "[policy]") {
  auto policy = WithRules(std::nullopt, std::vector<std::string>{"openai/(gpt", "anthropic/.*"});
  REQUIRE_FALSE(ShouldApply(policy, "openai/gpt-4"));
  REQUIRE(ShouldApply(policy, "anthropic/claude-3"));
  REQUIRE(MatchesAny({"x", "anthropic/.*"}, "anthropic/claude-3"));
}
