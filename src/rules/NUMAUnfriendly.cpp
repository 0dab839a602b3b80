#include "rulecat/core/RuleConfiguration.h"
#include "rulecat/core/RuleRegistry.h"

namespace rulecat {

class NUMAUnfriendly : public SeverityRule {
public:
    static constexpr RuleCapabilities kCapabilities{
        /*optIn=*/true, /*correctable=*/false, /*analyzer=*/false};

    NUMAUnfriendly() : SeverityRule(Severity::High) {}

    const RuleDescription &getDescription() const override {
        static const RuleDescription desc{
            "numa_unfriendly",
            "NUMA-Unfriendly Shared Structure",
            "Large shared mutable structures allocated without NUMA-aware "
            "placement are accessed remotely by at least one socket.",
            RuleKind::Performance,
            {
                "auto *book = static_cast<Book *>(\n"
                "    numa_alloc_onnode(sizeof(Book), node));",
            },
            {
                "↓static Book books[4096];\n"
                "void onFill(int i) { books[i].update(); }",
            }};
        return desc;
    }
};

RULECAT_REGISTER_RULE(NUMAUnfriendly)

} // namespace rulecat
