#include "rulecat/output/TextTable.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Locale.h>

#include <algorithm>
#include <sstream>

namespace rulecat {

size_t displayWidth(const std::string &text) {
    int width = llvm::sys::locale::columnWidth(text);
    // Negative for invalid UTF-8 or non-printable characters.
    return width < 0 ? text.size() : static_cast<size_t>(width);
}

TextTable::TextTable(std::vector<std::string> headers)
    : headers_(std::move(headers)) {}

void TextTable::addRow(std::vector<std::string> cells) {
    cells.resize(headers_.size());
    rows_.push_back(std::move(cells));
}

std::string TextTable::render() const {
    std::vector<size_t> widths;
    widths.reserve(headers_.size());
    for (const auto &h : headers_)
        widths.push_back(displayWidth(h));

    for (const auto &row : rows_)
        for (size_t i = 0; i < row.size(); ++i)
            widths[i] = std::max(widths[i], displayWidth(row[i]));

    std::ostringstream os;

    auto fence = [&] {
        os << "+";
        for (size_t w : widths)
            os << std::string(w + 2, '-') << "+";
        os << "\n";
    };

    auto line = [&](const std::vector<std::string> &cells) {
        os << "|";
        for (size_t i = 0; i < cells.size(); ++i) {
            os << " " << cells[i]
               << std::string(widths[i] - displayWidth(cells[i]), ' ') << " |";
        }
        os << "\n";
    };

    fence();
    line(headers_);
    fence();

    if (!rows_.empty()) {
        for (const auto &row : rows_)
            line(row);
        fence();
    }

    return os.str();
}

} // namespace rulecat
