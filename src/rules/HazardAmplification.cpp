#include "rulecat/core/RuleConfiguration.h"
#include "rulecat/core/RuleRegistry.h"

namespace rulecat {

// Needs compiled IR in addition to the AST, hence analyzer-only.
class HazardAmplification : public SeverityRule {
public:
    static constexpr RuleCapabilities kCapabilities{
        /*optIn=*/false, /*correctable=*/false, /*analyzer=*/true};

    HazardAmplification() : SeverityRule(Severity::Critical) {}

    const RuleDescription &getDescription() const override {
        static const RuleDescription desc{
            "hazard_amplification",
            "Hazard Amplification",
            "Several latency multipliers on one structure (cache line "
            "spanning, atomic contention, cross-thread sharing, loop usage) "
            "compound nonlinearly under load.",
            RuleKind::Performance,
            {},
            {
                "struct ↓Book {\n"
                "    std::atomic<uint64_t> seq;\n"
                "    Level levels[32];\n"
                "};\n"
                "void worker(Book &b) {\n"
                "    for (;;) b.seq.fetch_add(1);\n"
                "}",
            }};
        return desc;
    }
};

RULECAT_REGISTER_RULE(HazardAmplification)

} // namespace rulecat
