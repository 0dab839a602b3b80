#pragma once

#include "rulecat/core/RegexConfiguration.h"
#include "rulecat/core/Rule.h"

#include <string>
#include <vector>

namespace rulecat {

// Container for the user-defined regex rules of a project. Listed in the
// catalog as one row per configured regex rule.
class CustomRules : public Rule {
public:
    static constexpr RuleCapabilities kCapabilities{};

    const RuleDescription &getDescription() const override;
    std::string getConfigurationDescription() const override;
    llvm::Error configure(const Config &cfg) override;
    RulePresentation getPresentation() const override;

private:
    std::vector<RegexConfiguration> configurations_;
};

} // namespace rulecat
