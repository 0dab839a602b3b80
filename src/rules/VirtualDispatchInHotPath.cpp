#include "rulecat/core/RuleConfiguration.h"
#include "rulecat/core/RuleRegistry.h"

namespace rulecat {

class VirtualDispatchInHotPath : public SeverityRule {
public:
    static constexpr RuleCapabilities kCapabilities{};

    VirtualDispatchInHotPath() : SeverityRule(Severity::High) {}

    const RuleDescription &getDescription() const override {
        static const RuleDescription desc{
            "virtual_dispatch_in_hot_path",
            "Virtual Dispatch in Hot Path",
            "Virtual calls on a hot path need a vtable load and an indirect "
            "branch. Prefer CRTP, std::variant or template dispatch for "
            "closed type sets.",
            RuleKind::Performance,
            {
                "template <typename Handler>\n"
                "void onTick(Handler &h, const Tick &t) { h.handle(t); }",
            },
            {
                "void onTick(Handler *h, const Tick &t) {\n"
                "    h->↓handle(t);\n"
                "}",
                "for (auto *s : strategies)\n"
                "    s->↓evaluate(book);",
            }};
        return desc;
    }
};

RULECAT_REGISTER_RULE(VirtualDispatchInHotPath)

} // namespace rulecat
