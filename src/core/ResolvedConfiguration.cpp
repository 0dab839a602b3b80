#include "rulecat/core/ResolvedConfiguration.h"

#include <llvm/ADT/StringSet.h>

#include <algorithm>

namespace rulecat {

namespace {

// Returns the identifiers in `ids` that name registered rules, warning about
// unknown and duplicate entries.
llvm::StringSet<> collectKnown(const std::vector<std::string> &ids,
                               llvm::StringRef key,
                               const RuleRegistry &registry,
                               llvm::raw_ostream &diag) {
    llvm::StringSet<> known;
    for (const auto &id : ids) {
        if (!registry.findByID(id)) {
            diag << "rulecat: warning: '" << id << "' in " << key
                 << " is not a valid rule identifier\n";
            continue;
        }
        if (!known.insert(id).second)
            diag << "rulecat: warning: '" << id << "' is listed more than once in "
                 << key << "\n";
    }
    return known;
}

std::unique_ptr<Rule> instantiate(const RuleEntry &entry, const Config &cfg,
                                  llvm::raw_ostream &diag) {
    auto rule = entry.factory();
    if (auto err = rule->configure(cfg)) {
        diag << "rulecat: warning: invalid configuration for '"
             << entry.identifier << "': " << llvm::toString(std::move(err))
             << ", falling back to defaults\n";
        rule = entry.factory();
    }
    return rule;
}

} // anonymous namespace

ResolvedConfiguration ResolvedConfiguration::resolve(const Config &cfg,
                                                     const RuleRegistry &registry,
                                                     llvm::raw_ostream &diag) {
    auto disabled = collectKnown(cfg.disabledRules, "disabled_rules", registry, diag);
    auto optIn    = collectKnown(cfg.optInRules, "opt_in_rules", registry, diag);
    auto only     = collectKnown(cfg.onlyRules, "only_rules", registry, diag);
    auto analyzer = collectKnown(cfg.analyzerRules, "analyzer_rules", registry, diag);

    for (const auto &[id, options] : cfg.ruleOptions) {
        if (!registry.findByID(id))
            diag << "rulecat: warning: 'rules' section for '" << id
                 << "' does not match a rule identifier\n";
    }

    const bool whitelist = !cfg.onlyRules.empty();
    if (whitelist && (!cfg.disabledRules.empty() || !cfg.optInRules.empty())) {
        diag << "rulecat: warning: only_rules is set, ignoring "
                "disabled_rules and opt_in_rules\n";
    }

    std::vector<std::unique_ptr<Rule>> active;

    for (const auto &entry : registry.entries()) {
        const auto &id = entry.identifier;
        const auto &caps = entry.capabilities;

        if (analyzer.contains(id) && !caps.analyzer) {
            diag << "rulecat: warning: '" << id
                 << "' is not an analyzer rule, ignoring its analyzer_rules entry\n";
        }
        if (optIn.contains(id) && caps.analyzer && !whitelist) {
            diag << "rulecat: warning: '" << id
                 << "' is an analyzer rule, list it under analyzer_rules\n";
        }

        bool enabled = false;
        if (whitelist) {
            enabled = only.contains(id);
        } else if (caps.analyzer) {
            enabled = analyzer.contains(id);
        } else if (caps.optIn) {
            enabled = optIn.contains(id);
        } else {
            enabled = true;
        }

        if (!whitelist && disabled.contains(id))
            enabled = false;

        if (enabled)
            active.push_back(instantiate(entry, cfg, diag));
    }

    return ResolvedConfiguration(std::move(active));
}

const Rule *ResolvedConfiguration::findActive(llvm::StringRef identifier) const {
    auto it = std::find_if(activeRules_.begin(), activeRules_.end(),
                           [identifier](const auto &r) {
                               return r->getDescription().identifier == identifier;
                           });
    return (it != activeRules_.end()) ? it->get() : nullptr;
}

} // namespace rulecat
