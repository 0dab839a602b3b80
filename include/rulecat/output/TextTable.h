#pragma once

#include <string>
#include <vector>

namespace rulecat {

// Bordered text table:
//
//   +------+-----+
//   | head | ... |
//   +------+-----+
//   | cell | ... |
//   +------+-----+
//
// Column width is the widest display width among the header and the cells.
class TextTable {
public:
    explicit TextTable(std::vector<std::string> headers);

    // Missing cells render empty; surplus cells are dropped.
    void addRow(std::vector<std::string> cells);

    size_t rowCount() const { return rows_.size(); }

    std::string render() const;

private:
    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// Display columns taken by UTF-8 `text`.
size_t displayWidth(const std::string &text);

} // namespace rulecat
