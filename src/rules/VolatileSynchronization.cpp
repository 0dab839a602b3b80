#include "rulecat/core/RuleConfiguration.h"
#include "rulecat/core/RuleRegistry.h"

namespace rulecat {

class VolatileSynchronization : public SeverityRule {
public:
    static constexpr RuleCapabilities kCapabilities{
        /*optIn=*/false, /*correctable=*/true, /*analyzer=*/false};

    VolatileSynchronization() : SeverityRule(Severity::Critical) {}

    const RuleDescription &getDescription() const override {
        static const RuleDescription desc{
            "volatile_synchronization",
            "Volatile Used for Synchronization",
            "volatile does not order memory between threads. Flags shared "
            "across threads must be std::atomic.",
            RuleKind::Lint,
            {
                "std::atomic<bool> stop{false};",
                "volatile uint32_t *reg = mmioBase();",
            },
            {
                "↓volatile bool stop = false;\n"
                "void worker() { while (!stop) poll(); }",
            }};
        return desc;
    }
};

RULECAT_REGISTER_RULE(VolatileSynchronization)

} // namespace rulecat
