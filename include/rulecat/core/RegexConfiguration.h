#pragma once

#include "rulecat/core/Severity.h"

#include <string>

namespace rulecat {

// A user-defined pattern rule declared under `custom_rules`.
struct RegexConfiguration {
    std::string identifier;   // key in the custom_rules mapping
    std::string name;
    std::string message;
    std::string regex;
    Severity    severity = Severity::Medium;
};

} // namespace rulecat
