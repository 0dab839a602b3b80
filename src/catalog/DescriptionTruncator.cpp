#include "rulecat/catalog/DescriptionTruncator.h"

#include <llvm/Support/ConvertUTF.h>

#include <algorithm>

namespace rulecat {

namespace {

// Length of the sequence starting at `offset`. Bytes that do not start a
// well-formed sequence count as one code point each.
size_t sequenceLength(llvm::StringRef text, size_t offset) {
    auto *begin = reinterpret_cast<const llvm::UTF8 *>(text.data()) + offset;
    size_t length = llvm::getNumBytesForUTF8(*begin);
    if (length <= 1 || length > text.size() - offset ||
        !llvm::isLegalUTF8Sequence(begin, begin + length))
        return 1;
    return length;
}

// Byte offset just past the first `count` code points, clamped to the end.
size_t prefixBytes(llvm::StringRef text, size_t count) {
    size_t offset = 0;
    for (size_t i = 0; i < count && offset < text.size(); ++i)
        offset += sequenceLength(text, offset);
    return std::min(offset, text.size());
}

} // anonymous namespace

std::string escapeNewlines(llvm::StringRef text) {
    std::string out;
    out.reserve(text.size() + 8);
    for (char c : text) {
        if (c == '\n')
            out += "\\n";
        else
            out += c;
    }
    return out;
}

size_t codePointCount(llvm::StringRef text) {
    size_t n = 0;
    for (size_t offset = 0; offset < text.size(); ++n)
        offset += sequenceLength(text, offset);
    return n;
}

size_t descriptionBudget(unsigned terminalWidth, const TruncationLayout &layout) {
    size_t budget = layout.minimumWidth;
    if (terminalWidth > layout.descriptionColumn)
        budget = std::max<size_t>(budget, terminalWidth - layout.descriptionColumn);
    return budget;
}

std::string truncateDescription(llvm::StringRef text, unsigned terminalWidth,
                                const TruncationLayout &layout) {
    std::string flat = escapeNewlines(text);
    size_t cut = prefixBytes(flat, descriptionBudget(terminalWidth, layout));

    if (cut >= flat.size())
        return flat;

    flat.resize(cut);
    flat += kEllipsis;
    return flat;
}

} // namespace rulecat
