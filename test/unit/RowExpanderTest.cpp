#include "TestRules.h"

#include "rulecat/catalog/RowExpander.h"
#include "rulecat/rules/CustomRules.h"

#include <gtest/gtest.h>

using namespace rulecat;
using rulecat::test::stubEntry;

namespace {

Config customRulesConfig(std::initializer_list<std::pair<const char *, const char *>> rules) {
    Config cfg;
    for (const auto &[id, regex] : rules) {
        RegexConfiguration rc;
        rc.identifier = id;
        rc.regex = regex;
        cfg.customRules[id] = rc;
    }
    return cfg;
}

ResolvedConfiguration activeCustomRules(const RuleEntry &entry, const Config &cfg) {
    auto rule = entry.factory();
    EXPECT_FALSE(llvm::errorToBool(rule->configure(cfg)));
    std::vector<std::unique_ptr<Rule>> active;
    active.push_back(std::move(rule));
    return ResolvedConfiguration(std::move(active));
}

} // anonymous namespace

TEST(RowExpander, UnconfiguredRuleUsesDefaultInstance) {
    RuleCapabilities caps{/*optIn=*/true, /*correctable=*/true, /*analyzer=*/false};
    auto entry = stubEntry("rule_a", RuleKind::Idiomatic, caps);

    auto rows = expandRule(entry, ResolvedConfiguration());
    ASSERT_EQ(rows.size(), 1u);

    const auto &row = rows[0];
    EXPECT_EQ(row.identifier, "rule_a");
    EXPECT_TRUE(row.optIn);
    EXPECT_TRUE(row.correctable);
    EXPECT_FALSE(row.configured);
    EXPECT_EQ(row.kind, RuleKind::Idiomatic);
    EXPECT_FALSE(row.analyzer);
    EXPECT_EQ(row.description, "medium");
}

TEST(RowExpander, ConfiguredInstanceProvidesDescription) {
    auto entry = stubEntry("rule_a", RuleKind::Lint, rulecat::test::kAnalyzer);

    Config cfg;
    cfg.ruleOptions["rule_a"] = {{"severity", "high"}};
    auto rule = entry.factory();
    ASSERT_FALSE(llvm::errorToBool(rule->configure(cfg)));
    std::vector<std::unique_ptr<Rule>> active;
    active.push_back(std::move(rule));
    ResolvedConfiguration resolved(std::move(active));

    auto rows = expandRule(entry, resolved);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_TRUE(rows[0].configured);
    EXPECT_TRUE(rows[0].analyzer);
    EXPECT_EQ(rows[0].description, "high");
}

TEST(RowExpander, CompositeExpandsToOneRowPerChild) {
    RuleRegistry registry;
    registry.registerRule<CustomRules>();
    const RuleEntry &entry = *registry.findByID("custom_rules");

    auto cfg = customRulesConfig({{"no_printf", "printf\\("},
                                  {"no_todo", "TODO"},
                                  {"ascii_only", "[^[:print:]]"}});
    auto rows = expandRule(entry, activeCustomRules(entry, cfg));

    ASSERT_EQ(rows.size(), 3u);
    for (const auto &row : rows) {
        EXPECT_NE(row.identifier, "custom_rules");
        EXPECT_TRUE(row.configured);
        EXPECT_FALSE(row.optIn);
        EXPECT_FALSE(row.correctable);
        EXPECT_FALSE(row.analyzer);
        EXPECT_EQ(row.kind, RuleKind::Style);
    }

    EXPECT_EQ(rows[0].identifier, "ascii_only");
    EXPECT_EQ(rows[0].description, "[^[:print:]]");
    EXPECT_EQ(rows[1].identifier, "no_printf");
    EXPECT_EQ(rows[1].description, "printf\\(");
    EXPECT_EQ(rows[2].identifier, "no_todo");
}

TEST(RowExpander, CompositeWithoutChildrenListsParent) {
    RuleRegistry registry;
    registry.registerRule<CustomRules>();
    const RuleEntry &entry = *registry.findByID("custom_rules");

    auto unconfigured = expandRule(entry, ResolvedConfiguration());
    ASSERT_EQ(unconfigured.size(), 1u);
    EXPECT_EQ(unconfigured[0].identifier, "custom_rules");
    EXPECT_FALSE(unconfigured[0].configured);
    EXPECT_EQ(unconfigured[0].description, "user-defined regex rules: none");

    auto configured = expandRule(entry, activeCustomRules(entry, Config()));
    ASSERT_EQ(configured.size(), 1u);
    EXPECT_TRUE(configured[0].configured);
}

TEST(RowExpander, ExpandCatalogConcatenatesInEntryOrder) {
    RuleRegistry registry;
    registry.registerRule(stubEntry("zulu", RuleKind::Lint));
    registry.registerRule<CustomRules>();
    registry.registerRule(stubEntry("alpha", RuleKind::Lint));

    auto cfg = customRulesConfig({{"mine", "x+"}});
    const RuleEntry &custom = *registry.findByID("custom_rules");
    auto resolved = activeCustomRules(custom, cfg);

    std::vector<const RuleEntry *> entries;
    for (const auto &e : registry.entries())
        entries.push_back(&e);

    auto rows = expandCatalog(entries, resolved);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].identifier, "zulu");
    EXPECT_EQ(rows[1].identifier, "mine");
    EXPECT_EQ(rows[2].identifier, "alpha");
}

TEST(RowExpander, SortRowsIsStableByIdentifier) {
    std::vector<PresentableRow> rows(5);
    rows[0].identifier = "beta";
    rows[1].identifier = "Zeta";
    rows[2].identifier = "alpha";
    rows[3].identifier = "beta";
    rows[3].description = "second";
    rows[4].identifier = "alpha_2";

    sortRows(rows);

    ASSERT_EQ(rows.size(), 5u);
    EXPECT_EQ(rows[0].identifier, "Zeta");   // uppercase sorts first
    EXPECT_EQ(rows[1].identifier, "alpha");
    EXPECT_EQ(rows[2].identifier, "alpha_2");
    EXPECT_EQ(rows[3].identifier, "beta");
    EXPECT_EQ(rows[3].description, "");
    EXPECT_EQ(rows[4].description, "second");
}
