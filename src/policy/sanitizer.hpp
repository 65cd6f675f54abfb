#pragma once

#include <string>
#include "policy/pattern_policy.hpp"

namespace warden::policy {

struct DangerCheck {
    bool dangerous = false;
    std::string rule_id;
};

// Applies a PatternPolicy to text. All operations are pure string
// transforms; regex evaluation failures fail closed.
class Sanitizer {
public:
    explicit Sanitizer(PatternPolicy policy = {});

    // First matching dangerous-op rule wins.
    DangerCheck is_dangerous(const std::string& text) const;

    // Replaces secret-shaped substrings. If a blocking secret rule (an
    // environment read) matches anywhere, the whole text is replaced by
    // secret_advisory(). Private key material that survives redaction
    // yields private_key_advisory(). Overlong lines are withheld.
    // Idempotent.
    std::string redact_secrets(const std::string& text) const;

    // Replaces PII with placeholder tokens. Used for audit records only.
    // Overlong lines are withheld.
    std::string redact_pii(const std::string& text) const;

    // True when redact_secrets would discard the text entirely.
    bool withholds_output(const std::string& text) const;

    const PatternPolicy& policy() const { return policy_; }

    static const std::string& secret_advisory();
    static const std::string& private_key_advisory();

private:
    std::string apply_replacements(const std::string& text, RuleCategory category,
                                   const std::string& on_failure) const;

    PatternPolicy policy_;
};

}  // namespace warden::policy
