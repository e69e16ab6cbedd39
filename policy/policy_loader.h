#pragma once

#include "policy/policy_types.h"

#include <stdexcept>
#include <string>

namespace YAML {
class Node;
}

namespace dlpgate {

// Thrown only while loading configuration; never on the request path.
class PolicyConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Builds a PolicySet from YAML.
//
//   mode: enforce                 # observe | warn | enforce
//   enabled_types: [email, ssn]   # optional, absent = all categories
//   audit_log: /var/log/dlpgate/audit.jsonl
//   audit_debug: false
//   policies:
//     credit_card: {action: block}
//     email:
//       action: mask
//       enabled: true
//       models: {allow: ["self-hosted/.*"], block: ["openai/gpt-4"]}
//
// Policies are overlaid on DefaultPolicySet(): a known category is updated
// field by field, a new category must name its action. When the file sets no
// mode, DLPGATE_MODE picks it (enforce if unset). DLPGATE_AUDIT_LOG overrides
// audit_log.
class PolicyLoader {
 public:
  static PolicySet LoadFile(const std::string& path);
  static PolicySet LoadString(const std::string& yaml);
  static PolicySet FromNode(const YAML::Node& root);

  // Built-in policies: block credit_card, ssn, api_key, pem_key, jwt_token,
  // database_url, cloud_credential; mask email, phone. Mode from DLPGATE_MODE.
  static PolicySet DefaultPolicySet();

  static void ApplyEnvOverrides(PolicySet* policies);
};

}  // namespace dlpgate
