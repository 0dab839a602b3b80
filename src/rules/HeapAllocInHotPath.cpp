#include "rulecat/core/RuleConfiguration.h"
#include "rulecat/core/RuleRegistry.h"

namespace rulecat {

class HeapAllocInHotPath : public ThresholdRule {
public:
    static constexpr RuleCapabilities kCapabilities{};

    // Thresholds are allocation sizes in bytes.
    HeapAllocInHotPath()
        : ThresholdRule(/*warning=*/0, /*critical=*/256, Severity::High) {}

    const RuleDescription &getDescription() const override {
        static const RuleDescription desc{
            "heap_alloc_in_hot_path",
            "Heap Allocation in Hot Path",
            "Heap allocation on a hot path risks allocator lock contention, "
            "page faults and TLB pressure. Preallocate or use a pool.",
            RuleKind::Performance,
            {
                "void onTick(const Tick &t) {\n"
                "    buffer.push_back(t); // capacity reserved at startup\n"
                "}",
            },
            {
                "void onTick(const Tick &t) {\n"
                "    auto *copy = ↓new Tick(t);\n"
                "    dispatch(copy);\n"
                "}",
                "void onTick(const Tick &t) {\n"
                "    ↓std::vector<Level> levels(t.depth);\n"
                "}",
            }};
        return desc;
    }
};

RULECAT_REGISTER_RULE(HeapAllocInHotPath)

} // namespace rulecat
