#pragma once

#include "rulecat/core/RuleConfiguration.h"
#include "rulecat/core/RuleRegistry.h"

#include <memory>
#include <string>
#include <vector>

namespace rulecat::test {

// Severity-configurable rule whose description is supplied by the test.
class StubRule : public SeverityRule {
public:
    explicit StubRule(std::shared_ptr<const RuleDescription> desc)
        : SeverityRule(Severity::Medium), desc_(std::move(desc)) {}

    const RuleDescription &getDescription() const override { return *desc_; }

private:
    std::shared_ptr<const RuleDescription> desc_;
};

inline RuleEntry stubEntry(const std::string &id, RuleKind kind,
                           RuleCapabilities caps = {},
                           std::vector<std::string> triggering = {}) {
    auto desc = std::make_shared<RuleDescription>();
    desc->identifier = id;
    desc->name = "Stub " + id;
    desc->description = "Stub rule " + id + ".";
    desc->kind = kind;
    desc->triggeringExamples = std::move(triggering);

    return RuleEntry{id, caps, [desc] { return std::make_unique<StubRule>(desc); }};
}

constexpr RuleCapabilities kOptIn{/*optIn=*/true, /*correctable=*/false,
                                  /*analyzer=*/false};
constexpr RuleCapabilities kAnalyzer{/*optIn=*/false, /*correctable=*/false,
                                     /*analyzer=*/true};

} // namespace rulecat::test
