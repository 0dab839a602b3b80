#include "rulecat/core/RuleConfiguration.h"

namespace rulecat {

namespace {

llvm::Error optionError(llvm::StringRef ruleID, llvm::StringRef key,
                        const llvm::Twine &reason) {
    return llvm::createStringError(
        llvm::inconvertibleErrorCode(),
        "'" + ruleID + "." + key + "': " + reason);
}

llvm::Error parseSeverityOption(llvm::StringRef ruleID,
                                const std::string &value, Severity &out) {
    auto sev = parseSeverity(value);
    if (!sev)
        return optionError(ruleID, "severity",
                           "expected informational|medium|high|critical, got '" +
                               value + "'");
    out = *sev;
    return llvm::Error::success();
}

} // anonymous namespace

llvm::Error SeverityConfiguration::apply(llvm::StringRef ruleID,
                                         const RuleOptions &options) {
    for (const auto &[key, value] : options) {
        if (key != "severity")
            return optionError(ruleID, key, "unknown parameter");
        if (auto err = parseSeverityOption(ruleID, value, severity_))
            return err;
    }
    return llvm::Error::success();
}

std::string SeverityConfiguration::describe() const {
    return std::string(severityToString(severity_));
}

llvm::Error ThresholdConfiguration::apply(llvm::StringRef ruleID,
                                          const RuleOptions &options) {
    unsigned warning = warning_;
    unsigned critical = critical_;
    Severity base = base_;

    for (const auto &[key, value] : options) {
        if (key == "severity") {
            if (auto err = parseSeverityOption(ruleID, value, base))
                return err;
            continue;
        }

        unsigned *target = nullptr;
        if (key == "warning")
            target = &warning;
        else if (key == "critical")
            target = &critical;
        else
            return optionError(ruleID, key, "unknown parameter");

        if (llvm::StringRef(value).trim().getAsInteger(10, *target))
            return optionError(ruleID, key,
                               "expected an unsigned integer, got '" + value + "'");
    }

    if (critical < warning)
        return optionError(ruleID, "critical",
                           "must not be below warning (" +
                               llvm::Twine(warning) + ")");

    warning_ = warning;
    critical_ = critical;
    base_ = base;
    return llvm::Error::success();
}

std::string ThresholdConfiguration::describe() const {
    return std::string(severityToString(base_)) + ": " +
           std::to_string(warning_) + ", " +
           std::string(severityToString(Severity::Critical)) + ": " +
           std::to_string(critical_);
}

llvm::Error SeverityRule::configure(const Config &cfg) {
    const auto *options = cfg.findRuleOptions(getDescription().identifier);
    if (!options)
        return llvm::Error::success();
    return config_.apply(getDescription().identifier, *options);
}

llvm::Error ThresholdRule::configure(const Config &cfg) {
    const auto *options = cfg.findRuleOptions(getDescription().identifier);
    if (!options)
        return llvm::Error::success();
    return config_.apply(getDescription().identifier, *options);
}

} // namespace rulecat
