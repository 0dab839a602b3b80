#include "rulecat/output/OutputFormatter.h"
#include "rulecat/output/TextTable.h"

#include <llvm/ADT/SmallVector.h>

#include <sstream>

namespace rulecat {

namespace {

const char *yesNo(bool b) { return b ? "yes" : "no"; }

std::string indent(llvm::StringRef text) {
    llvm::SmallVector<llvm::StringRef, 8> lines;
    text.split(lines, '\n');

    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i)
            out += "\n";
        out += "    ";
        out += lines[i].str();
    }
    return out;
}

} // anonymous namespace

std::optional<OutputFormat> parseOutputFormat(llvm::StringRef s) {
    if (s == "table") return OutputFormat::Table;
    if (s == "json")  return OutputFormat::JSON;
    return std::nullopt;
}

const std::vector<std::string> &TableOutputFormatter::columns() {
    static const std::vector<std::string> kColumns = {
        "identifier",
        "opt-in",
        "correctable",
        "enabled in your config",
        "kind",
        "analyzer",
        "configuration",
    };
    return kColumns;
}

std::string TableOutputFormatter::formatCatalog(std::vector<PresentableRow> rows) {
    sortRows(rows);

    TextTable table(columns());
    for (const auto &r : rows) {
        table.addRow({
            r.identifier,
            yesNo(r.optIn),
            yesNo(r.correctable),
            yesNo(r.configured),
            std::string(ruleKindToString(r.kind)),
            yesNo(r.analyzer),
            truncateDescription(r.description, terminalWidth_, layout_),
        });
    }

    return table.render();
}

std::string TableOutputFormatter::formatRule(const RuleDescription &desc) {
    std::ostringstream os;
    os << desc.consoleDescription() << "\n";

    if (desc.triggeringExamples.empty())
        return os.str();

    os << "\nTriggering Examples (violation is marked with '↓'):\n";
    for (size_t i = 0; i < desc.triggeringExamples.size(); ++i) {
        os << "\nExample #" << (i + 1) << "\n\n"
           << indent(desc.triggeringExamples[i]) << "\n";
    }

    return os.str();
}

} // namespace rulecat
