#include "rulecat/command/RulesCommand.h"
#include "rulecat/core/Error.h"
#include "rulecat/core/RuleRegistry.h"
#include "rulecat/core/Version.h"
#include "rulecat/output/OutputFormatter.h"

#include <llvm/Support/CommandLine.h>
#include <llvm/Support/raw_ostream.h>

#include <string>

static llvm::cl::OptionCategory RulecatCat("rulecat options");

static llvm::cl::opt<std::string> RuleID(
    llvm::cl::Positional,
    llvm::cl::desc("[rule identifier]"),
    llvm::cl::init(""),
    llvm::cl::cat(RulecatCat));

static llvm::cl::opt<std::string> ConfigPath(
    "config",
    llvm::cl::desc("Path to the project configuration (default: .rulecat.yml)"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(RulecatCat));

static llvm::cl::opt<bool> OnlyEnabled(
    "enabled",
    llvm::cl::desc("Only display enabled rules"),
    llvm::cl::cat(RulecatCat));

static llvm::cl::alias OnlyEnabledShort(
    "e",
    llvm::cl::desc("Alias for --enabled"),
    llvm::cl::aliasopt(OnlyEnabled),
    llvm::cl::cat(RulecatCat));

static llvm::cl::opt<bool> OnlyDisabled(
    "disabled",
    llvm::cl::desc("Only display disabled rules"),
    llvm::cl::cat(RulecatCat));

static llvm::cl::alias OnlyDisabledShort(
    "d",
    llvm::cl::desc("Alias for --disabled"),
    llvm::cl::aliasopt(OnlyDisabled),
    llvm::cl::cat(RulecatCat));

static llvm::cl::opt<std::string> OutputFormatOpt(
    "format",
    llvm::cl::desc("Output format (table|json)"),
    llvm::cl::init("table"),
    llvm::cl::cat(RulecatCat));

int main(int argc, const char **argv) {
    llvm::cl::HideUnrelatedOptions(RulecatCat);
    llvm::cl::SetVersionPrinter([](llvm::raw_ostream &os) {
        os << "rulecat " << rulecat::kToolVersion << "\n";
    });
    llvm::cl::ParseCommandLineOptions(
        argc, argv, "rulecat: display the list of rules and their identifiers\n");

    auto format = rulecat::parseOutputFormat(OutputFormatOpt);
    if (!format) {
        llvm::errs() << "rulecat: error: unknown output format '"
                     << OutputFormatOpt << "' (expected table or json)\n";
        return 1;
    }

    rulecat::RulesOptions options;
    if (!RuleID.empty())
        options.ruleID = RuleID.getValue();
    options.configurationFile = ConfigPath.getValue();
    options.onlyEnabledRules = OnlyEnabled;
    options.onlyDisabledRules = OnlyDisabled;
    options.format = *format;

    auto err = rulecat::runRulesCommand(options, rulecat::RuleRegistry::instance(),
                                        llvm::outs());
    if (!err)
        return 0;

    llvm::handleAllErrors(
        std::move(err),
        [](const rulecat::UsageError &e) {
            llvm::errs() << "rulecat: error: " << e.getMessage() << "\n"
                         << "Run 'rulecat --help' for usage.\n";
        },
        [](const llvm::ErrorInfoBase &e) {
            llvm::errs() << "rulecat: error: " << e.message() << "\n";
        });
    return 1;
}
