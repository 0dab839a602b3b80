#include "rulecat/rules/CustomRules.h"
#include "rulecat/core/Config.h"
#include "rulecat/core/RuleRegistry.h"

namespace rulecat {

const RuleDescription &CustomRules::getDescription() const {
    static const RuleDescription desc{
        "custom_rules",
        "Custom Rules",
        "Create custom rules by providing a regex string. Optionally specify "
        "what syntax kinds to match against, the severity level, and what "
        "message to display.",
        RuleKind::Style,
        {},
        {}};
    return desc;
}

std::string CustomRules::getConfigurationDescription() const {
    std::string out = "user-defined regex rules: ";
    if (configurations_.empty())
        return out + "none";

    for (size_t i = 0; i < configurations_.size(); ++i) {
        if (i)
            out += ", ";
        out += configurations_[i].identifier;
    }
    return out;
}

llvm::Error CustomRules::configure(const Config &cfg) {
    if (cfg.findRuleOptions(getDescription().identifier)) {
        return llvm::createStringError(
            llvm::inconvertibleErrorCode(),
            "custom rules are declared under 'custom_rules', not 'rules'");
    }

    configurations_.clear();
    configurations_.reserve(cfg.customRules.size());
    for (const auto &[id, rc] : cfg.customRules) {
        configurations_.push_back(rc);
        configurations_.back().identifier = id;
    }
    return llvm::Error::success();
}

RulePresentation CustomRules::getPresentation() const {
    CompositeRow row;
    row.children.reserve(configurations_.size());
    for (const auto &rc : configurations_)
        row.children.push_back({rc.identifier, rc.regex});
    return row;
}

RULECAT_REGISTER_RULE(CustomRules)

} // namespace rulecat
