#pragma once

#include "rulecat/core/RegexConfiguration.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/raw_ostream.h>

#include <map>
#include <string>
#include <vector>

namespace rulecat {

// Parameter values for a single rule, keyed by parameter name.
using RuleOptions = std::map<std::string, std::string>;

struct Config {
    // Rule selection
    std::vector<std::string> disabledRules;
    std::vector<std::string> optInRules;
    std::vector<std::string> onlyRules;      // whitelist; empty = unused
    std::vector<std::string> analyzerRules;

    // Per-rule parameters, keyed by rule identifier.
    std::map<std::string, RuleOptions> ruleOptions;

    // User-defined regex rules, keyed by identifier.
    std::map<std::string, RegexConfiguration> customRules;

    const RuleOptions *findRuleOptions(llvm::StringRef ruleID) const;

    static constexpr const char *kDefaultPath = ".rulecat.yml";

    static Config loadFromFile(const std::string &path,
                               llvm::raw_ostream &diag = llvm::errs());
    static Config loadFromString(llvm::StringRef text,
                                 llvm::StringRef sourceName,
                                 llvm::raw_ostream &diag = llvm::errs());
    static Config defaults();
};

} // namespace rulecat
