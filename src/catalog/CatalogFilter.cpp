#include "rulecat/catalog/CatalogFilter.h"

namespace rulecat {

std::vector<const RuleEntry *> filterCatalog(FilterMode mode,
                                             const RuleRegistry &registry,
                                             const ResolvedConfiguration &resolved) {
    std::vector<const RuleEntry *> out;
    out.reserve(registry.size());

    for (const auto &entry : registry.entries()) {
        bool active = mode != FilterMode::All && resolved.isActive(entry.identifier);

        if (mode == FilterMode::OnlyEnabled && !active)
            continue;
        if (mode == FilterMode::OnlyDisabled && active)
            continue;

        out.push_back(&entry);
    }

    return out;
}

} // namespace rulecat
