#include "rulecat/core/RuleConfiguration.h"
#include "rulecat/core/RuleRegistry.h"

namespace rulecat {

class DeepConditionalTree : public ThresholdRule {
public:
    static constexpr RuleCapabilities kCapabilities{};

    // Thresholds are nesting depths.
    DeepConditionalTree()
        : ThresholdRule(/*warning=*/4, /*critical=*/8, Severity::Medium) {}

    const RuleDescription &getDescription() const override {
        static const RuleDescription desc{
            "deep_conditional_tree",
            "Deep Conditional Tree in Hot Path",
            "Deeply nested conditionals widen the branch misprediction "
            "surface. Flatten with early returns or table-driven dispatch.",
            RuleKind::Metrics,
            {
                "if (!valid) return;\n"
                "if (!open) return;\n"
                "apply(msg);",
            },
            {
                "if (a) {\n"
                "    if (b) {\n"
                "        if (c) {\n"
                "            if (d) {\n"
                "                ↓if (e) apply(msg);\n"
                "            }\n"
                "        }\n"
                "    }\n"
                "}",
            }};
        return desc;
    }
};

RULECAT_REGISTER_RULE(DeepConditionalTree)

} // namespace rulecat
