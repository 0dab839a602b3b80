#include "rulecat/catalog/DescriptionTruncator.h"

#include <gtest/gtest.h>

using namespace rulecat;

namespace {

const TruncationLayout kLayout{};

} // anonymous namespace

TEST(DescriptionTruncator, ReferenceLayout) {
    EXPECT_EQ(kLayout.descriptionColumn, 112u);
    EXPECT_EQ(kLayout.minimumWidth, std::string("configuration").size() - 3);
}

TEST(DescriptionTruncator, Budget) {
    EXPECT_EQ(descriptionBudget(0, kLayout), 10u);
    EXPECT_EQ(descriptionBudget(80, kLayout), 10u);
    EXPECT_EQ(descriptionBudget(112, kLayout), 10u);
    EXPECT_EQ(descriptionBudget(121, kLayout), 10u);
    EXPECT_EQ(descriptionBudget(122, kLayout), 10u);
    EXPECT_EQ(descriptionBudget(123, kLayout), 11u);
    EXPECT_EQ(descriptionBudget(200, kLayout), 88u);

    TruncationLayout narrow{/*descriptionColumn=*/20, /*minimumWidth=*/4};
    EXPECT_EQ(descriptionBudget(22, narrow), 4u);
    EXPECT_EQ(descriptionBudget(30, narrow), 10u);
}

TEST(DescriptionTruncator, ShortTextUnchanged) {
    EXPECT_EQ(truncateDescription("warning", 200, kLayout), "warning");
    EXPECT_EQ(truncateDescription("", 0, kLayout), "");
}

TEST(DescriptionTruncator, TextExactlyAtBudgetHasNoEllipsis) {
    EXPECT_EQ(truncateDescription("0123456789", 0, kLayout), "0123456789");
}

TEST(DescriptionTruncator, LongTextCutToBudget) {
    std::string text = "high: 2048, critical: 8192";

    std::string out = truncateDescription(text, 0, kLayout);
    EXPECT_EQ(out, "high: 2048...");
    EXPECT_EQ(out.size(), 10u + kEllipsis.size());

    EXPECT_EQ(truncateDescription(text, 124, kLayout), "high: 2048, ...");
    EXPECT_EQ(truncateDescription(text, 500, kLayout), text);
}

TEST(DescriptionTruncator, NeverExceedsBudgetPlusEllipsis) {
    std::string text(300, 'x');
    for (unsigned width : {0u, 1u, 50u, 112u, 113u, 150u, 260u, 411u, 412u, 1000u}) {
        size_t budget = descriptionBudget(width, kLayout);
        std::string out = truncateDescription(text, width, kLayout);
        EXPECT_LE(out.size(), budget + kEllipsis.size()) << width;
        if (budget < text.size())
            EXPECT_EQ(out, text.substr(0, budget) + "...") << width;
        else
            EXPECT_EQ(out, text) << width;
    }
}

TEST(DescriptionTruncator, NewlinesAreEscaped) {
    EXPECT_EQ(escapeNewlines("a\nb\n"), "a\\nb\\n");
    EXPECT_EQ(truncateDescription("a\nb", 0, kLayout), "a\\nb");

    // The escape counts as two characters toward the budget.
    EXPECT_EQ(truncateDescription("abcdefgh\nij", 0, kLayout), "abcdefgh\\n...");
}

TEST(DescriptionTruncator, CutsOnCodePointBoundaries) {
    std::string text = "violation ↓ marked here";
    EXPECT_EQ(codePointCount(text), 23u);
    EXPECT_EQ(codePointCount("↓↓"), 2u);

    TruncationLayout layout{/*descriptionColumn=*/0, /*minimumWidth=*/11};
    EXPECT_EQ(truncateDescription(text, 0, layout), "violation ↓...");

    std::string arrows = "↓↓↓↓↓↓↓↓↓↓↓↓";
    EXPECT_EQ(truncateDescription(arrows, 0, kLayout),
              "↓↓↓↓↓↓↓↓↓↓...");
}

TEST(DescriptionTruncator, TruncatedLeadingByteDoesNotOverrun) {
    // Lone lead byte of a three-byte sequence at the very end.
    std::string text = "0123456789ab\xe2";
    std::string out = truncateDescription(text, 0, kLayout);
    EXPECT_EQ(out, "0123456789...");

    std::string shortText = "01234\xe2";
    EXPECT_EQ(truncateDescription(shortText, 0, kLayout), shortText);
}

TEST(DescriptionTruncator, InvalidBytesCountAsOneCodePointEach) {
    // 0xFF claims a six-byte sequence; it must not swallow the letters.
    std::string text = "\xff" "abcdefghijklmnopqrstuvwxyz";
    EXPECT_EQ(codePointCount(text), 27u);
    EXPECT_EQ(truncateDescription(text, 0, kLayout), "\xff" "abcdefghi...");

    // Lead byte followed by bytes that are not continuations.
    EXPECT_EQ(codePointCount("\xe2" "ab"), 3u);
    EXPECT_EQ(truncateDescription("\xe2" "abcdefghijkl", 0, kLayout),
              "\xe2" "abcdefghi...");
}
