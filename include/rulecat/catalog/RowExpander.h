#pragma once

#include "rulecat/core/ResolvedConfiguration.h"
#include "rulecat/core/RuleKind.h"
#include "rulecat/core/RuleRegistry.h"

#include <string>
#include <vector>

namespace rulecat {

// One line of the rule catalog.
struct PresentableRow {
    std::string identifier;
    bool        optIn       = false;
    bool        correctable = false;
    bool        configured  = false;   // enabled in the project config
    RuleKind    kind        = RuleKind::Lint;
    bool        analyzer    = false;
    std::string description;           // configuration summary, untruncated
};

// Rows for one registry entry. A composite rule with configured children
// yields one row per child; everything else yields a single row.
std::vector<PresentableRow> expandRule(const RuleEntry &entry,
                                       const ResolvedConfiguration &resolved);

std::vector<PresentableRow> expandCatalog(const std::vector<const RuleEntry *> &entries,
                                          const ResolvedConfiguration &resolved);

// Stable sort by identifier, byte order.
void sortRows(std::vector<PresentableRow> &rows);

} // namespace rulecat
