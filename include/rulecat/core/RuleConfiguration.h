#pragma once

#include "rulecat/core/Config.h"
#include "rulecat/core/Rule.h"
#include "rulecat/core/Severity.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <string>

namespace rulecat {

// Single `severity` parameter.
class SeverityConfiguration {
public:
    explicit SeverityConfiguration(Severity severity) : severity_(severity) {}

    llvm::Error apply(llvm::StringRef ruleID, const RuleOptions &options);
    std::string describe() const;

    Severity getSeverity() const { return severity_; }

private:
    Severity severity_;
};

// Two-level threshold: values at or above `warning` report at the base
// severity, values at or above `critical` escalate to Critical.
class ThresholdConfiguration {
public:
    ThresholdConfiguration(unsigned warning, unsigned critical,
                           Severity base = Severity::High)
        : warning_(warning), critical_(critical), base_(base) {}

    llvm::Error apply(llvm::StringRef ruleID, const RuleOptions &options);
    std::string describe() const;

    unsigned getWarning() const { return warning_; }
    unsigned getCritical() const { return critical_; }
    Severity getBaseSeverity() const { return base_; }

private:
    unsigned warning_;
    unsigned critical_;
    Severity base_;
};

// Rules whose only parameter is their severity.
class SeverityRule : public Rule {
public:
    std::string getConfigurationDescription() const override {
        return config_.describe();
    }

    llvm::Error configure(const Config &cfg) override;

    const SeverityConfiguration &getConfiguration() const { return config_; }

protected:
    explicit SeverityRule(Severity defaultSeverity) : config_(defaultSeverity) {}

private:
    SeverityConfiguration config_;
};

// Rules that measure a quantity against warning/critical thresholds.
class ThresholdRule : public Rule {
public:
    std::string getConfigurationDescription() const override {
        return config_.describe();
    }

    llvm::Error configure(const Config &cfg) override;

    const ThresholdConfiguration &getConfiguration() const { return config_; }

protected:
    ThresholdRule(unsigned warning, unsigned critical,
                  Severity base = Severity::High)
        : config_(warning, critical, base) {}

private:
    ThresholdConfiguration config_;
};

} // namespace rulecat
