#pragma once

#include "rulecat/core/Config.h"
#include "rulecat/core/Rule.h"
#include "rulecat/core/RuleRegistry.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/raw_ostream.h>

#include <memory>
#include <vector>

namespace rulecat {

// The rules a project has active, each configured from the project config.
class ResolvedConfiguration {
public:
    ResolvedConfiguration() = default;
    explicit ResolvedConfiguration(std::vector<std::unique_ptr<Rule>> activeRules)
        : activeRules_(std::move(activeRules)) {}

    // Selection order:
    //   only_rules set: exactly those rules.
    //   otherwise: default rules + opt_in_rules + analyzer_rules - disabled_rules.
    // Problems with the config are reported to `diag` and skipped.
    static ResolvedConfiguration resolve(const Config &cfg,
                                         const RuleRegistry &registry,
                                         llvm::raw_ostream &diag = llvm::errs());

    // Active instance for `identifier`, or null if the rule is not enabled.
    const Rule *findActive(llvm::StringRef identifier) const;

    bool isActive(llvm::StringRef identifier) const {
        return findActive(identifier) != nullptr;
    }

    const std::vector<std::unique_ptr<Rule>> &activeRules() const {
        return activeRules_;
    }

private:
    std::vector<std::unique_ptr<Rule>> activeRules_;
};

} // namespace rulecat
