#include "rulecat/core/RuleConfiguration.h"
#include "rulecat/core/RuleRegistry.h"

namespace rulecat {

class CentralizedGlobalState : public SeverityRule {
public:
    static constexpr RuleCapabilities kCapabilities{
        /*optIn=*/true, /*correctable=*/false, /*analyzer=*/false};

    CentralizedGlobalState() : SeverityRule(Severity::High) {}

    const RuleDescription &getDescription() const override {
        static const RuleDescription desc{
            "centralized_global_state",
            "Centralized Mutable Global State",
            "Mutable globals shared by many threads become a contention point "
            "and a remote NUMA access for every other socket. Partition the "
            "state or pass it through a context object.",
            RuleKind::Lint,
            {
                "thread_local Stats stats;",
                "const Limits kLimits{100, 200};",
            },
            {
                "↓Stats gStats;\n"
                "void onFill() { gStats.fills++; }",
            }};
        return desc;
    }
};

RULECAT_REGISTER_RULE(CentralizedGlobalState)

} // namespace rulecat
