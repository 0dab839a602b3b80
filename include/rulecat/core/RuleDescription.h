#pragma once

#include "rulecat/core/RuleKind.h"

#include <string>
#include <vector>

namespace rulecat {

struct RuleDescription {
    std::string identifier;
    std::string name;
    std::string description;
    RuleKind    kind = RuleKind::Lint;

    // Source snippets. Triggering examples mark the violation with U+2193.
    std::vector<std::string> nonTriggeringExamples;
    std::vector<std::string> triggeringExamples;

    // "<name> (<identifier>): <description>"
    std::string consoleDescription() const {
        return name + " (" + identifier + "): " + description;
    }
};

} // namespace rulecat
