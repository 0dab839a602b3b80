#include "rulecat/core/RuleConfiguration.h"
#include "rulecat/core/RuleRegistry.h"

namespace rulecat {

class ExplicitMemoryOrder : public SeverityRule {
public:
    static constexpr RuleCapabilities kCapabilities{
        /*optIn=*/true, /*correctable=*/true, /*analyzer=*/false};

    ExplicitMemoryOrder() : SeverityRule(Severity::Informational) {}

    const RuleDescription &getDescription() const override {
        static const RuleDescription desc{
            "explicit_memory_order",
            "Explicit Memory Order",
            "Atomic operations should spell out their memory order instead of "
            "relying on the implicit seq_cst default.",
            RuleKind::Idiomatic,
            {
                "count.fetch_add(1, std::memory_order_relaxed);",
                "ready.load(std::memory_order_seq_cst);",
            },
            {
                "count.↓fetch_add(1);",
                "if (ready.↓load()) {\n"
                "    consume();\n"
                "}",
            }};
        return desc;
    }
};

RULECAT_REGISTER_RULE(ExplicitMemoryOrder)

} // namespace rulecat
