#pragma once

#include <cstdint>
#include <string_view>

namespace rulecat {

// Category a rule is listed under in the catalog.
enum class RuleKind : uint8_t {
    Lint,
    Idiomatic,
    Style,
    Metrics,
    Performance,
};

constexpr std::string_view ruleKindToString(RuleKind k) {
    switch (k) {
        case RuleKind::Lint:        return "lint";
        case RuleKind::Idiomatic:   return "idiomatic";
        case RuleKind::Style:       return "style";
        case RuleKind::Metrics:     return "metrics";
        case RuleKind::Performance: return "performance";
    }
    return "lint";
}

} // namespace rulecat
