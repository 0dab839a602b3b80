#include "rulecat/core/RuleConfiguration.h"
#include "rulecat/core/RuleRegistry.h"

namespace rulecat {

class LockInHotPath : public SeverityRule {
public:
    static constexpr RuleCapabilities kCapabilities{};

    LockInHotPath() : SeverityRule(Severity::Critical) {}

    const RuleDescription &getDescription() const override {
        static const RuleDescription desc{
            "lock_in_hot_path",
            "Lock in Hot Path",
            "Blocking locks on a hot path serialize threads and may enter the "
            "kernel. Use lock-free structures or a single-writer design.",
            RuleKind::Performance,
            {
                "[[clang::annotate(\"rulecat_hot\")]]\n"
                "void onTick(const Tick &t) {\n"
                "    queue.try_push(t);\n"
                "}",
            },
            {
                "[[clang::annotate(\"rulecat_hot\")]]\n"
                "void onTick(const Tick &t) {\n"
                "    ↓std::lock_guard<std::mutex> lock(mu);\n"
                "    book.apply(t);\n"
                "}",
            }};
        return desc;
    }
};

RULECAT_REGISTER_RULE(LockInHotPath)

} // namespace rulecat
