#include "rulecat/core/RuleConfiguration.h"
#include "rulecat/core/RuleRegistry.h"

namespace rulecat {

class CacheLineSpanning : public ThresholdRule {
public:
    static constexpr RuleCapabilities kCapabilities{};

    // Thresholds are struct sizes in bytes.
    CacheLineSpanning() : ThresholdRule(/*warning=*/64, /*critical=*/128) {}

    const RuleDescription &getDescription() const override {
        static const RuleDescription desc{
            "cache_line_spanning",
            "Cache Line Spanning Struct",
            "Structs written on a hot path should fit in a single cache line. "
            "Larger footprints increase eviction probability and coherence "
            "traffic under multi-core writes.",
            RuleKind::Performance,
            {
                "struct alignas(64) Order {\n"
                "    uint64_t id;\n"
                "    uint32_t qty;\n"
                "    uint32_t price;\n"
                "};",
            },
            {
                "struct ↓OrderBook {\n"
                "    std::atomic<uint64_t> seq;\n"
                "    char symbol[64];\n"
                "    double bids[16];\n"
                "};",
                "struct ↓Session {\n"
                "    char buffer[256];\n"
                "    std::atomic<int> state;\n"
                "};",
            }};
        return desc;
    }
};

RULECAT_REGISTER_RULE(CacheLineSpanning)

} // namespace rulecat
