#include "rulecat/core/RuleConfiguration.h"
#include "rulecat/core/RuleRegistry.h"

namespace rulecat {

class CentralizedDispatcher : public SeverityRule {
public:
    static constexpr RuleCapabilities kCapabilities{
        /*optIn=*/true, /*correctable=*/false, /*analyzer=*/false};

    CentralizedDispatcher() : SeverityRule(Severity::High) {}

    const RuleDescription &getDescription() const override {
        static const RuleDescription desc{
            "centralized_dispatcher",
            "Centralized Dispatcher Bottleneck",
            "A single fan-out dispatcher routes every message through one "
            "function, pressuring the I-cache and the branch predictor. "
            "Partition dispatch by message type or by core.",
            RuleKind::Performance,
            {},
            {
                "void ↓dispatch(const Msg &m) {\n"
                "    switch (m.type) {\n"
                "    case Type::Add:    onAdd(m); break;\n"
                "    case Type::Cancel: onCancel(m); break;\n"
                "    case Type::Fill:   onFill(m); break;\n"
                "    case Type::Quote:  onQuote(m); break;\n"
                "    }\n"
                "}",
            }};
        return desc;
    }
};

RULECAT_REGISTER_RULE(CentralizedDispatcher)

} // namespace rulecat
