#include "rulecat/core/RuleConfiguration.h"

#include <gtest/gtest.h>

using namespace rulecat;

TEST(SeverityConfiguration, AppliesSeverity) {
    SeverityConfiguration config(Severity::Medium);
    EXPECT_EQ(config.describe(), "medium");

    ASSERT_FALSE(llvm::errorToBool(config.apply("rule_a", {{"severity", "critical"}})));
    EXPECT_EQ(config.getSeverity(), Severity::Critical);
    EXPECT_EQ(config.describe(), "critical");
}

TEST(SeverityConfiguration, RejectsBadValues) {
    SeverityConfiguration config(Severity::Medium);

    llvm::Error err = config.apply("rule_a", {{"severity", "loud"}});
    ASSERT_TRUE(static_cast<bool>(err));
    std::string msg = llvm::toString(std::move(err));
    EXPECT_NE(msg.find("rule_a.severity"), std::string::npos) << msg;
    EXPECT_NE(msg.find("'loud'"), std::string::npos) << msg;

    err = config.apply("rule_a", {{"threshold", "3"}});
    ASSERT_TRUE(static_cast<bool>(err));
    msg = llvm::toString(std::move(err));
    EXPECT_NE(msg.find("unknown parameter"), std::string::npos) << msg;

    EXPECT_EQ(config.getSeverity(), Severity::Medium);
}

TEST(ThresholdConfiguration, Describe) {
    ThresholdConfiguration config(64, 128);
    EXPECT_EQ(config.describe(), "high: 64, critical: 128");

    ThresholdConfiguration medium(4, 8, Severity::Medium);
    EXPECT_EQ(medium.describe(), "medium: 4, critical: 8");
}

TEST(ThresholdConfiguration, AppliesThresholds) {
    ThresholdConfiguration config(64, 128);
    ASSERT_FALSE(llvm::errorToBool(config.apply(
        "rule_a", {{"warning", "96"}, {"critical", "192"}, {"severity", "medium"}})));

    EXPECT_EQ(config.getWarning(), 96u);
    EXPECT_EQ(config.getCritical(), 192u);
    EXPECT_EQ(config.getBaseSeverity(), Severity::Medium);
    EXPECT_EQ(config.describe(), "medium: 96, critical: 192");
}

TEST(ThresholdConfiguration, RejectsInvertedThresholds) {
    ThresholdConfiguration config(64, 128);

    llvm::Error err = config.apply("rule_a", {{"warning", "256"}});
    ASSERT_TRUE(static_cast<bool>(err));
    EXPECT_NE(llvm::toString(std::move(err)).find("must not be below warning (256)"),
              std::string::npos);

    EXPECT_EQ(config.getWarning(), 64u);
    EXPECT_EQ(config.getCritical(), 128u);
}

TEST(ThresholdConfiguration, RejectsNonNumericValues) {
    ThresholdConfiguration config(64, 128);

    for (const char *bad : {"-1", "lots", "", "12kb"}) {
        llvm::Error err = config.apply("rule_a", {{"critical", bad}});
        EXPECT_TRUE(llvm::errorToBool(std::move(err))) << bad;
    }
    EXPECT_EQ(config.describe(), "high: 64, critical: 128");
}
