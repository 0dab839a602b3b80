#include "rulecat/core/RuleConfiguration.h"
#include "rulecat/core/RuleRegistry.h"

namespace rulecat {

class ContendedQueue : public SeverityRule {
public:
    static constexpr RuleCapabilities kCapabilities{};

    ContendedQueue() : SeverityRule(Severity::High) {}

    const RuleDescription &getDescription() const override {
        static const RuleDescription desc{
            "contended_queue",
            "Contended Queue Pattern",
            "Queue head and tail indices on the same cache line bounce between "
            "producer and consumer cores. Pad them to separate lines.",
            RuleKind::Performance,
            {
                "struct Ring {\n"
                "    alignas(64) std::atomic<size_t> head;\n"
                "    alignas(64) std::atomic<size_t> tail;\n"
                "};",
            },
            {
                "struct ↓Ring {\n"
                "    std::atomic<size_t> head;\n"
                "    std::atomic<size_t> tail;\n"
                "    Slot slots[1024];\n"
                "};",
            }};
        return desc;
    }
};

RULECAT_REGISTER_RULE(ContendedQueue)

} // namespace rulecat
