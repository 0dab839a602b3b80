#include "rulecat/core/RuleConfiguration.h"
#include "rulecat/core/RuleRegistry.h"

namespace rulecat {

class AtomicContention : public SeverityRule {
public:
    static constexpr RuleCapabilities kCapabilities{};

    AtomicContention() : SeverityRule(Severity::Critical) {}

    const RuleDescription &getDescription() const override {
        static const RuleDescription desc{
            "atomic_contention",
            "Atomic Contention Hotspot",
            "A single atomic written from many threads forces cache line "
            "ownership transfer on every write. Shard the state per core or "
            "batch the updates.",
            RuleKind::Performance,
            {
                "thread_local uint64_t localHits;\n"
                "void record() { ++localHits; }",
            },
            {
                "std::atomic<uint64_t> hits;\n"
                "void worker() {\n"
                "    for (;;)\n"
                "        hits.↓fetch_add(1, std::memory_order_relaxed);\n"
                "}",
            }};
        return desc;
    }
};

RULECAT_REGISTER_RULE(AtomicContention)

} // namespace rulecat
