#include "rulecat/core/RuleConfiguration.h"
#include "rulecat/core/RuleRegistry.h"

namespace rulecat {

class LargeStackFrame : public ThresholdRule {
public:
    static constexpr RuleCapabilities kCapabilities{};

    // Thresholds are frame sizes in bytes.
    LargeStackFrame()
        : ThresholdRule(/*warning=*/2048, /*critical=*/8192, Severity::Medium) {}

    const RuleDescription &getDescription() const override {
        static const RuleDescription desc{
            "large_stack_frame",
            "Large Stack Frame",
            "Functions should not reserve large local buffers. Frames "
            "spanning several pages add TLB and L1D pressure.",
            RuleKind::Metrics,
            {
                "void encode(Buffer &out) {\n"
                "    char scratch[256];\n"
                "}",
            },
            {
                "void ↓encode(Buffer &out) {\n"
                "    char scratch[16384];\n"
                "}",
            }};
        return desc;
    }
};

RULECAT_REGISTER_RULE(LargeStackFrame)

} // namespace rulecat
