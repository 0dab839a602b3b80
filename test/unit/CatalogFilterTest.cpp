#include "TestRules.h"

#include "rulecat/catalog/CatalogFilter.h"

#include <gtest/gtest.h>

using namespace rulecat;
using rulecat::test::stubEntry;

namespace {

std::vector<std::string> ids(const std::vector<const RuleEntry *> &entries) {
    std::vector<std::string> out;
    for (const auto *e : entries)
        out.push_back(e->identifier);
    return out;
}

RuleRegistry makeRegistry() {
    RuleRegistry registry;
    registry.registerRule(stubEntry("zulu", RuleKind::Lint));
    registry.registerRule(stubEntry("alpha", RuleKind::Style));
    registry.registerRule(stubEntry("mike", RuleKind::Metrics));
    registry.registerRule(stubEntry("bravo", RuleKind::Performance));
    return registry;
}

ResolvedConfiguration activate(const RuleRegistry &registry,
                               std::initializer_list<const char *> active) {
    std::vector<std::unique_ptr<Rule>> rules;
    for (const char *id : active)
        rules.push_back(registry.findByID(id)->factory());
    return ResolvedConfiguration(std::move(rules));
}

} // anonymous namespace

TEST(CatalogFilter, AllKeepsRegistryOrder) {
    auto registry = makeRegistry();
    auto resolved = activate(registry, {"alpha"});

    auto result = filterCatalog(FilterMode::All, registry, resolved);
    EXPECT_EQ(ids(result),
              (std::vector<std::string>{"zulu", "alpha", "mike", "bravo"}));
    ASSERT_EQ(result.size(), registry.size());
    EXPECT_EQ(result[0], &registry.entries()[0]);
}

TEST(CatalogFilter, OnlyEnabled) {
    auto registry = makeRegistry();
    auto resolved = activate(registry, {"bravo", "zulu"});

    EXPECT_EQ(ids(filterCatalog(FilterMode::OnlyEnabled, registry, resolved)),
              (std::vector<std::string>{"zulu", "bravo"}));
}

TEST(CatalogFilter, OnlyDisabled) {
    auto registry = makeRegistry();
    auto resolved = activate(registry, {"bravo", "zulu"});

    EXPECT_EQ(ids(filterCatalog(FilterMode::OnlyDisabled, registry, resolved)),
              (std::vector<std::string>{"alpha", "mike"}));
}

TEST(CatalogFilter, EnabledAndDisabledPartitionTheCatalog) {
    auto registry = makeRegistry();
    auto resolved = activate(registry, {"mike"});

    auto enabled = filterCatalog(FilterMode::OnlyEnabled, registry, resolved);
    auto disabled = filterCatalog(FilterMode::OnlyDisabled, registry, resolved);
    EXPECT_EQ(enabled.size() + disabled.size(), registry.size());
}

TEST(CatalogFilter, EmptyRegistry) {
    RuleRegistry registry;
    ResolvedConfiguration resolved;

    EXPECT_TRUE(filterCatalog(FilterMode::All, registry, resolved).empty());
    EXPECT_TRUE(filterCatalog(FilterMode::OnlyEnabled, registry, resolved).empty());
    EXPECT_TRUE(filterCatalog(FilterMode::OnlyDisabled, registry, resolved).empty());
}
