#include "rulecat/core/RuleConfiguration.h"
#include "rulecat/core/RuleRegistry.h"

namespace rulecat {

class StdFunctionInHotPath : public SeverityRule {
public:
    static constexpr RuleCapabilities kCapabilities{
        /*optIn=*/true, /*correctable=*/false, /*analyzer=*/false};

    StdFunctionInHotPath() : SeverityRule(Severity::High) {}

    const RuleDescription &getDescription() const override {
        static const RuleDescription desc{
            "std_function_in_hot_path",
            "std::function in Hot Path",
            "std::function erases the callable type: invocation is an indirect "
            "call, construction may allocate and inlining is lost.",
            RuleKind::Performance,
            {
                "template <typename F>\n"
                "void forEachLevel(F &&f) { for (auto &l : levels) f(l); }",
            },
            {
                "void forEachLevel(↓std::function<void(Level &)> f) {\n"
                "    for (auto &l : levels) f(l);\n"
                "}",
            }};
        return desc;
    }
};

RULECAT_REGISTER_RULE(StdFunctionInHotPath)

} // namespace rulecat
