#include "rulecat/core/RuleRegistry.h"

#include <algorithm>

namespace rulecat {

RuleRegistry &RuleRegistry::instance() {
    static RuleRegistry registry;
    return registry;
}

bool RuleRegistry::registerRule(RuleEntry entry) {
    if (entry.identifier.empty() || !entry.factory)
        return false;
    if (findByID(entry.identifier))
        return false;

    entries_.push_back(std::move(entry));
    return true;
}

const RuleEntry *RuleRegistry::findByID(std::string_view id) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [id](const auto &e) { return e.identifier == id; });
    return (it != entries_.end()) ? &*it : nullptr;
}

} // namespace rulecat
