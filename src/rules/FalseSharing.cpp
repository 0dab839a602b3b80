#include "rulecat/core/RuleConfiguration.h"
#include "rulecat/core/RuleRegistry.h"

namespace rulecat {

class FalseSharing : public SeverityRule {
public:
    static constexpr RuleCapabilities kCapabilities{};

    FalseSharing() : SeverityRule(Severity::Critical) {}

    const RuleDescription &getDescription() const override {
        static const RuleDescription desc{
            "false_sharing",
            "False Sharing Candidate",
            "Fields written independently by different threads should live on "
            "separate cache lines. Shared lines cause MESI invalidation "
            "ping-pong between cores.",
            RuleKind::Performance,
            {
                "struct Counters {\n"
                "    alignas(64) std::atomic<uint64_t> produced;\n"
                "    alignas(64) std::atomic<uint64_t> consumed;\n"
                "};",
            },
            {
                "struct ↓Counters {\n"
                "    std::atomic<uint64_t> produced;\n"
                "    std::atomic<uint64_t> consumed;\n"
                "};",
            }};
        return desc;
    }
};

RULECAT_REGISTER_RULE(FalseSharing)

} // namespace rulecat
