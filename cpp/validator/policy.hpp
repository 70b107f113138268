#ifndef VALIDATOR_POLICY_HPP
#define VALIDATOR_POLICY_HPP

#include <set>
#include <string>
#include <vector>

#include "capnp/execution.capnp.h"

namespace validator {

// The set of symbols the static validator accepts or rejects. The allow-list
// is authoritative: a module that is neither allowed nor denied is rejected.
struct ValidationPolicy {
  struct DeniedPattern {
    std::string name;
    // ECMAScript regular expression, matched case-insensitively against the
    // raw source text.
    std::string regex;
  };

  std::set<std::string> allowed_modules;
  std::set<std::string> denied_modules;
  // Builtins that may not be called or referenced.
  std::set<std::string> denied_calls;
  // Attribute names that may not be accessed on any object.
  std::set<std::string> denied_attributes;
  std::vector<DeniedPattern> denied_patterns;

  // The built-in policy.
  static ValidationPolicy Default();

  // Reads a policy from its JSON form. Lists missing from the document keep
  // their default contents. Throws kj::Exception on malformed input.
  static ValidationPolicy FromJson(const std::string& json);
  static ValidationPolicy FromFile(const std::string& path);

  std::string ToJson() const;

  // A human-readable description of the policy, list sizes first.
  std::string Summary() const;

  void ToCapnp(capnproto::ValidationPolicy::Builder builder) const;
  static ValidationPolicy FromCapnp(capnproto::ValidationPolicy::Reader reader);
};

}  // namespace validator

#endif
