#pragma once

#include "rulecat/core/ResolvedConfiguration.h"
#include "rulecat/core/RuleRegistry.h"

#include <cstdint>
#include <vector>

namespace rulecat {

enum class FilterMode : uint8_t {
    All,
    OnlyEnabled,
    OnlyDisabled,
};

// Registry entries selected by `mode`, in registry order.
std::vector<const RuleEntry *> filterCatalog(FilterMode mode,
                                             const RuleRegistry &registry,
                                             const ResolvedConfiguration &resolved);

} // namespace rulecat
