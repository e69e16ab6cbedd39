#include <catch2/catch_test_macros.hpp>

#include "policy/policy_loader.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace dlpgate;

namespace {
// Clears the environment overrides for the duration of a test.
struct ScopedEnvReset {
  ScopedEnvReset() {
    unsetenv("DLPGATE_MODE");
    unsetenv("DLPGATE_AUDIT_LOG");
  }
  ~ScopedEnvReset() {
    unsetenv("DLPGATE_MODE");
    unsetenv("DLPGATE_AUDIT_LOG");
  }
};
}  // namespace

TEST_CASE("Default policy set blocks secrets and masks contact data", "[config]") {
  ScopedEnvReset env;
  auto set = PolicyLoader::DefaultPolicySet();
  REQUIRE(set.mode == Mode::kEnforce);
  REQUIRE_FALSE(set.enabled_types.has_value());
  for (const char* category : {"credit_card", "ssn", "api_key", "pem_key", "jwt_token",
                               "database_url", "cloud_credential"}) {
    REQUIRE(set.FindPolicy(category) != nullptr);
    REQUIRE(set.FindPolicy(category)->action == PolicyAction::kBlock);
  }
  REQUIRE(set.FindPolicy("email")->action == PolicyAction::kMask);
  REQUIRE(set.FindPolicy("phone")->action == PolicyAction::kMask);
  REQUIRE(set.FindPolicy("unknown_thing") == nullptr);
}

TEST_CASE("YAML policies overlay the defaults", "[config]") {
  ScopedEnvReset env;
  auto set = PolicyLoader::LoadString(R"(
mode: warn
enabled_types: [email, credit_card, employee_id]
audit_debug: true
policies:
  email:
    action: block
    models:
      allow: ["self-hosted/.*"]
      block: ["openai/gpt-4"]
  phone:
    enabled: false
  employee_id:
    action: mask
)");
  REQUIRE(set.mode == Mode::kWarn);
  REQUIRE(set.audit_debug);
  REQUIRE(set.enabled_types->count("employee_id") == 1);
  REQUIRE(set.IsTypeEnabled("email"));
  REQUIRE_FALSE(set.IsTypeEnabled("ssn"));

  const Policy* email = set.FindPolicy("email");
  REQUIRE(email->action == PolicyAction::kBlock);
  REQUIRE(email->models.has_value());
  REQUIRE(email->models->allow->size() == 1);
  REQUIRE(email->models->block->front() == "openai/gpt-4");

  // Unspecified fields of a known category keep their defaults.
  const Policy* phone = set.FindPolicy("phone");
  REQUIRE_FALSE(phone->enabled);
  REQUIRE(phone->action == PolicyAction::kMask);

  REQUIRE(set.FindPolicy("employee_id")->action == PolicyAction::kMask);
  REQUIRE(set.FindPolicy("ssn")->action == PolicyAction::kBlock);
}

TEST_CASE("Model list may be a single pattern", "[config]") {
  ScopedEnvReset env;
  auto set = PolicyLoader::LoadString(R"(
policies:
  ssn:
    models:
      block: openai/.*
)");
  const Policy* ssn = set.FindPolicy("ssn");
  REQUIRE(ssn->models->block->size() == 1);
  REQUIRE_FALSE(ssn->models->allow.has_value());
}

TEST_CASE("Invalid configuration is rejected at load time", "[config]") {
  ScopedEnvReset env;
  REQUIRE_THROWS_AS(PolicyLoader::LoadString("mode: paranoid"), PolicyConfigError);
  REQUIRE_THROWS_AS(PolicyLoader::LoadString("policies:\n  email: {action: shred}"),
                    PolicyConfigError);
  REQUIRE_THROWS_AS(PolicyLoader::LoadString("policies:\n  Bad-Tag: {action: mask}"),
                    PolicyConfigError);
  REQUIRE_THROWS_AS(PolicyLoader::LoadString("policies:\n  custom: {enabled: true}"),
                    PolicyConfigError);
  REQUIRE_THROWS_AS(PolicyLoader::LoadString("policies:\n  email: {models: [a, b]}"),
                    PolicyConfigError);
  REQUIRE_THROWS_AS(PolicyLoader::LoadString("enabled_types: email"), PolicyConfigError);
  REQUIRE_THROWS_AS(PolicyLoader::LoadString("mode: [unterminated"), PolicyConfigError);
  REQUIRE_THROWS_AS(PolicyLoader::LoadString("policies:\n  email: {enabled: maybe}"),
                    PolicyConfigError);
  REQUIRE_THROWS_AS(PolicyLoader::LoadFile("/nonexistent/dlpgate.yaml"), PolicyConfigError);
}

TEST_CASE("Empty document yields the defaults", "[config]") {
  ScopedEnvReset env;
  auto set = PolicyLoader::LoadString("");
  REQUIRE(set.mode == Mode::kEnforce);
  REQUIRE(set.policies.size() == 9);
}

TEST_CASE("DLPGATE_MODE applies only when the file sets no mode", "[config]") {
  ScopedEnvReset env;
  setenv("DLPGATE_MODE", "observe", 1);
  REQUIRE(PolicyLoader::LoadString("audit_debug: false").mode == Mode::kObserve);
  REQUIRE(PolicyLoader::LoadString("mode: enforce").mode == Mode::kEnforce);

  setenv("DLPGATE_MODE", "bogus", 1);
  REQUIRE(PolicyLoader::DefaultPolicySet().mode == Mode::kEnforce);
}

TEST_CASE("DLPGATE_AUDIT_LOG overrides the audit path", "[config]") {
  ScopedEnvReset env;
  setenv("DLPGATE_AUDIT_LOG", "/tmp/dlpgate_env_audit.jsonl", 1);
  auto set = PolicyLoader::LoadString("audit_log: /tmp/from_file.jsonl");
  REQUIRE(set.audit_log_path == "/tmp/dlpgate_env_audit.jsonl");
}

TEST_CASE("Policy file is loaded from disk", "[config]") {
  ScopedEnvReset env;
  auto tmp_path = std::filesystem::temp_directory_path() / "dlpgate_policy_test.yaml";
  {
    std::ofstream out(tmp_path);
    out << "mode: observe\naudit_log: /tmp/dlpgate_audit.jsonl\n"
        << "policies:\n  credit_card:\n    action: mask\n";
  }
  auto set = PolicyLoader::LoadFile(tmp_path.string());
  REQUIRE(set.mode == Mode::kObserve);
  REQUIRE(set.audit_log_path == "/tmp/dlpgate_audit.jsonl");
  REQUIRE(set.FindPolicy("credit_card")->action == PolicyAction::kMask);

  std::filesystem::remove(tmp_path);
}
