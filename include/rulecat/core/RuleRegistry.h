#pragma once

#include "rulecat/core/Rule.h"

#include <llvm/Support/raw_ostream.h>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace rulecat {

using RuleFactory = std::function<std::unique_ptr<Rule>()>;

struct RuleEntry {
    std::string      identifier;
    RuleCapabilities capabilities;
    RuleFactory      factory;     // builds a default-configured instance
};

class RuleRegistry {
public:
    RuleRegistry() = default;

    // Catalog of built-in rules, filled during static initialization.
    static RuleRegistry &instance();

    // Rejects entries with an empty identifier, no factory, or an
    // identifier that is already registered.
    bool registerRule(RuleEntry entry);

    template <typename RuleClass>
    bool registerRule() {
        RuleClass prototype;
        return registerRule(RuleEntry{
            prototype.getDescription().identifier,
            RuleClass::kCapabilities,
            [] { return std::unique_ptr<Rule>(std::make_unique<RuleClass>()); }});
    }

    // Insertion order.
    const std::vector<RuleEntry> &entries() const { return entries_; }

    const RuleEntry *findByID(std::string_view id) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<RuleEntry> entries_;
};

// Macro for static self-registration in rule .cpp files.
#define RULECAT_REGISTER_RULE(RuleClass)                                       \
    namespace {                                                                \
    struct RuleClass##Registrar {                                              \
        RuleClass##Registrar() {                                               \
            if (!::rulecat::RuleRegistry::instance()                           \
                     .registerRule<RuleClass>())                               \
                llvm::errs() << "rulecat: warning: rule class '" #RuleClass    \
                                "' was not registered\n";                      \
        }                                                                      \
    };                                                                         \
    static RuleClass##Registrar g_##RuleClass##Registrar;                      \
    } // anonymous namespace

} // namespace rulecat
