#pragma once

#include "rulecat/core/RuleDescription.h"

#include <llvm/Support/Error.h>

#include <string>
#include <variant>
#include <vector>

namespace rulecat {

struct Config;

// Static classification of a rule type, fixed at registration time.
struct RuleCapabilities {
    bool optIn       = false;
    bool correctable = false;
    bool analyzer    = false;
};

// A rule listed as a single catalog row.
struct SimpleRow {};

// One nested sub-rule of a composite rule.
struct ChildRow {
    std::string identifier;
    std::string description;
};

// A rule that lists its configured sub-rules instead of itself.
struct CompositeRow {
    std::vector<ChildRow> children;
};

using RulePresentation = std::variant<SimpleRow, CompositeRow>;

class Rule {
public:
    virtual ~Rule() = default;

    virtual const RuleDescription &getDescription() const = 0;

    // One-line summary of the rule's current parameter values.
    virtual std::string getConfigurationDescription() const = 0;

    // Apply this rule's section of the project configuration. On error the
    // instance is left in an unspecified state and must be discarded.
    virtual llvm::Error configure(const Config &cfg) = 0;

    virtual RulePresentation getPresentation() const { return SimpleRow{}; }
};

} // namespace rulecat
