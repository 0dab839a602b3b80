#pragma once

#include "rulecat/catalog/DescriptionTruncator.h"
#include "rulecat/catalog/RowExpander.h"
#include "rulecat/core/RuleDescription.h"

#include <llvm/ADT/StringRef.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rulecat {

enum class OutputFormat : uint8_t {
    Table,
    JSON,
};

std::optional<OutputFormat> parseOutputFormat(llvm::StringRef s);

class OutputFormatter {
public:
    virtual ~OutputFormatter() = default;

    // Rows are sorted by identifier before rendering.
    virtual std::string formatCatalog(std::vector<PresentableRow> rows) = 0;

    // Full documentation of a single rule.
    virtual std::string formatRule(const RuleDescription &desc) = 0;
};

class TableOutputFormatter : public OutputFormatter {
public:
    explicit TableOutputFormatter(unsigned terminalWidth,
                                  TruncationLayout layout = TruncationLayout{})
        : terminalWidth_(terminalWidth), layout_(layout) {}

    std::string formatCatalog(std::vector<PresentableRow> rows) override;
    std::string formatRule(const RuleDescription &desc) override;

    static const std::vector<std::string> &columns();

private:
    unsigned terminalWidth_;
    TruncationLayout layout_;
};

class JSONOutputFormatter : public OutputFormatter {
public:
    std::string formatCatalog(std::vector<PresentableRow> rows) override;
    std::string formatRule(const RuleDescription &desc) override;
};

} // namespace rulecat
