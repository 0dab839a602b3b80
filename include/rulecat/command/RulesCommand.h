#pragma once

#include "rulecat/core/RuleRegistry.h"
#include "rulecat/output/OutputFormatter.h"
#include "rulecat/output/Terminal.h"

#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

#include <optional>
#include <string>

namespace rulecat {

struct RulesOptions {
    std::optional<std::string> ruleID;   // show one rule instead of the catalog
    std::string configurationFile;       // empty = Config::kDefaultPath if present
    bool onlyEnabledRules  = false;
    bool onlyDisabledRules = false;
    OutputFormat format    = OutputFormat::Table;
};

// Writes either the documentation of `options.ruleID` or the catalog table
// to `out`. Usage problems come back as UsageError with nothing written.
llvm::Error runRulesCommand(const RulesOptions &options,
                            const RuleRegistry &registry,
                            llvm::raw_ostream &out,
                            const TerminalWidthProvider &terminalWidth = currentTerminalWidth,
                            llvm::raw_ostream &diag = llvm::errs());

} // namespace rulecat
