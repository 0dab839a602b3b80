#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace rulecat {

enum class Severity : uint8_t {
    Informational = 0,
    Medium        = 1,
    High          = 2,
    Critical      = 3,
};

constexpr std::string_view severityToString(Severity s) {
    switch (s) {
        case Severity::Informational: return "informational";
        case Severity::Medium:        return "medium";
        case Severity::High:          return "high";
        case Severity::Critical:      return "critical";
    }
    return "unknown";
}

constexpr std::optional<Severity> parseSeverity(std::string_view s) {
    if (s == "critical")      return Severity::Critical;
    if (s == "high")          return Severity::High;
    if (s == "medium")        return Severity::Medium;
    if (s == "informational") return Severity::Informational;
    return std::nullopt;
}

} // namespace rulecat
