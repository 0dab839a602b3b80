#include "rulecat/command/RulesCommand.h"
#include "rulecat/catalog/CatalogFilter.h"
#include "rulecat/catalog/RowExpander.h"
#include "rulecat/core/Config.h"
#include "rulecat/core/Error.h"
#include "rulecat/core/ResolvedConfiguration.h"

#include <llvm/Support/FileSystem.h>

#include <memory>

namespace rulecat {

namespace {

Config loadProjectConfig(const std::string &path, llvm::raw_ostream &diag) {
    if (!path.empty())
        return Config::loadFromFile(path, diag);
    if (llvm::sys::fs::exists(Config::kDefaultPath))
        return Config::loadFromFile(Config::kDefaultPath, diag);
    return Config::defaults();
}

FilterMode filterMode(const RulesOptions &options) {
    if (options.onlyEnabledRules)
        return FilterMode::OnlyEnabled;
    if (options.onlyDisabledRules)
        return FilterMode::OnlyDisabled;
    return FilterMode::All;
}

std::unique_ptr<OutputFormatter> makeFormatter(OutputFormat format,
                                               const TerminalWidthProvider &width) {
    if (format == OutputFormat::JSON)
        return std::make_unique<JSONOutputFormatter>();
    return std::make_unique<TableOutputFormatter>(width ? width() : 0);
}

} // anonymous namespace

llvm::Error runRulesCommand(const RulesOptions &options,
                            const RuleRegistry &registry,
                            llvm::raw_ostream &out,
                            const TerminalWidthProvider &terminalWidth,
                            llvm::raw_ostream &diag) {
    if (options.onlyEnabledRules && options.onlyDisabledRules) {
        return llvm::make_error<UsageError>(
            "You can't use --disabled and --enabled at the same time.");
    }

    if (options.ruleID) {
        const RuleEntry *entry = registry.findByID(*options.ruleID);
        if (!entry) {
            return llvm::make_error<UsageError>(
                "No rule with identifier: " + *options.ruleID);
        }

        auto rule = entry->factory();
        auto formatter = makeFormatter(options.format, terminalWidth);
        out << formatter->formatRule(rule->getDescription());
        return llvm::Error::success();
    }

    Config cfg = loadProjectConfig(options.configurationFile, diag);
    auto resolved = ResolvedConfiguration::resolve(cfg, registry, diag);

    auto entries = filterCatalog(filterMode(options), registry, resolved);
    auto rows = expandCatalog(entries, resolved);

    auto formatter = makeFormatter(options.format, terminalWidth);
    out << formatter->formatCatalog(std::move(rows));
    return llvm::Error::success();
}

} // namespace rulecat
