#include "rulecat/catalog/RowExpander.h"

#include <algorithm>
#include <iterator>
#include <type_traits>
#include <variant>

namespace rulecat {

std::vector<PresentableRow> expandRule(const RuleEntry &entry,
                                       const ResolvedConfiguration &resolved) {
    // Capabilities and kind describe the rule type; the description comes
    // from the configured instance when there is one.
    auto defaultRule = entry.factory();
    const Rule *configured = resolved.findActive(entry.identifier);
    const Rule &effective = configured ? *configured : *defaultRule;
    const RuleKind kind = defaultRule->getDescription().kind;

    std::vector<PresentableRow> rows;

    std::visit(
        [&](const auto &presentation) {
            using T = std::decay_t<decltype(presentation)>;
            if constexpr (std::is_same_v<T, CompositeRow>) {
                for (const auto &child : presentation.children) {
                    PresentableRow row;
                    row.identifier  = child.identifier;
                    row.configured  = true;
                    row.kind        = kind;
                    row.description = child.description;
                    rows.push_back(std::move(row));
                }
            }
        },
        effective.getPresentation());

    if (rows.empty()) {
        PresentableRow row;
        row.identifier  = entry.identifier;
        row.optIn       = entry.capabilities.optIn;
        row.correctable = entry.capabilities.correctable;
        row.configured  = configured != nullptr;
        row.kind        = kind;
        row.analyzer    = entry.capabilities.analyzer;
        row.description = effective.getConfigurationDescription();
        rows.push_back(std::move(row));
    }

    return rows;
}

std::vector<PresentableRow> expandCatalog(const std::vector<const RuleEntry *> &entries,
                                          const ResolvedConfiguration &resolved) {
    std::vector<PresentableRow> rows;
    rows.reserve(entries.size());

    for (const auto *entry : entries) {
        auto expanded = expandRule(*entry, resolved);
        std::move(expanded.begin(), expanded.end(), std::back_inserter(rows));
    }

    return rows;
}

void sortRows(std::vector<PresentableRow> &rows) {
    std::stable_sort(rows.begin(), rows.end(),
                     [](const PresentableRow &a, const PresentableRow &b) {
                         return a.identifier < b.identifier;
                     });
}

} // namespace rulecat
