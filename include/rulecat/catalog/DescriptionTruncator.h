#pragma once

#include <llvm/ADT/StringRef.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace rulecat {

// Geometry of the catalog table as seen by the description column.
struct TruncationLayout {
    // Column at which the configuration column starts when every other
    // column is at its usual width.
    unsigned descriptionColumn = 112;

    // Never shrink below len("configuration") - len("...").
    unsigned minimumWidth = 10;
};

inline constexpr std::string_view kEllipsis = "...";

// "\n" becomes the two characters '\' 'n'.
std::string escapeNewlines(llvm::StringRef text);

// Number of code points in UTF-8 `text`.
size_t codePointCount(llvm::StringRef text);

// Budget in code points for a terminal `terminalWidth` columns wide.
size_t descriptionBudget(unsigned terminalWidth, const TruncationLayout &layout);

// Single-line form of `text` cut to the budget, with kEllipsis appended
// when anything was cut.
std::string truncateDescription(llvm::StringRef text, unsigned terminalWidth,
                                const TruncationLayout &layout);

} // namespace rulecat
