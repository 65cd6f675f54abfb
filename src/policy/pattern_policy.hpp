#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>
#include "core/config/warden_config.hpp"
#include "core/errors/warden_errors.hpp"

namespace warden::policy {

enum class RuleCategory {
    DangerousOp,
    Secret,
    Pii
};

// One pattern-based rule. Regex matching is a best-effort layer: it sees
// text, not program structure, so obfuscated calls can slip past it.
struct PolicyRule {
    std::string id;
    std::string source;
    std::regex pattern;
    RuleCategory category = RuleCategory::DangerousOp;
    // nullopt blocks; otherwise each match is replaced in place
    // (ECMAScript format, $1 refers to the first group).
    std::optional<std::string> replacement;
    bool builtin = true;
};

class PatternPolicy {
public:
    // Built-in rules only.
    PatternPolicy();

    // Built-ins followed by the audit.pii_patterns of the config. Patterns
    // that fail to compile are skipped with a warning.
    static PatternPolicy from_config(const core::config::WardenConfig& config);

    // Appends after every existing rule of the category; returns the rule id.
    core::errors::Result<std::string> add_user_rule(
        RuleCategory category, const std::string& id, const std::string& pattern,
        const std::optional<std::string>& replacement);

    const std::vector<PolicyRule>& rules(RuleCategory category) const;

private:
    std::vector<PolicyRule>& mutable_rules(RuleCategory category);

    std::vector<PolicyRule> dangerous_rules_;
    std::vector<PolicyRule> secret_rules_;
    std::vector<PolicyRule> pii_rules_;
};

std::string to_string(RuleCategory category);

// Converts a Perl-style replacement ("\\1", literal "$") to ECMAScript format.
std::string to_ecmascript_replacement(const std::string& replacement);

}  // namespace warden::policy
