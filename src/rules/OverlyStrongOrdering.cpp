#include "rulecat/core/RuleConfiguration.h"
#include "rulecat/core/RuleRegistry.h"

namespace rulecat {

class OverlyStrongOrdering : public SeverityRule {
public:
    static constexpr RuleCapabilities kCapabilities{};

    OverlyStrongOrdering() : SeverityRule(Severity::High) {}

    const RuleDescription &getDescription() const override {
        static const RuleDescription desc{
            "overly_strong_ordering",
            "Overly Strong Atomic Ordering",
            "Prefer acquire/release or relaxed ordering over "
            "memory_order_seq_cst where total ordering is not required. "
            "seq_cst stores emit a full fence and drain the store buffer.",
            RuleKind::Performance,
            {
                "flag.store(true, std::memory_order_release);",
                "auto v = head.load(std::memory_order_acquire);",
            },
            {
                "flag.↓store(true);",
                "seq.↓fetch_add(1, std::memory_order_seq_cst);",
            }};
        return desc;
    }
};

RULECAT_REGISTER_RULE(OverlyStrongOrdering)

} // namespace rulecat
