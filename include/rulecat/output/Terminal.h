#pragma once

#include <functional>

namespace rulecat {

using TerminalWidthProvider = std::function<unsigned()>;

// Columns of the terminal attached to stdout, or 0 when stdout is not a
// terminal. Honors COLUMNS.
unsigned currentTerminalWidth();

} // namespace rulecat
