#include "rulecat/core/Config.h"

#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Regex.h>
#include <llvm/Support/SourceMgr.h>
#include <llvm/Support/YAMLParser.h>
#include <llvm/Support/YAMLTraits.h>

// YAML mapping for Config via llvm::yaml.

LLVM_YAML_IS_STRING_MAP(std::string)
LLVM_YAML_IS_STRING_MAP(rulecat::RuleOptions)
LLVM_YAML_IS_STRING_MAP(rulecat::RegexConfiguration)

namespace llvm {
namespace yaml {

template <>
struct ScalarEnumerationTraits<rulecat::Severity> {
    static void enumeration(IO &io, rulecat::Severity &sev) {
        io.enumCase(sev, "informational", rulecat::Severity::Informational);
        io.enumCase(sev, "medium",        rulecat::Severity::Medium);
        io.enumCase(sev, "high",          rulecat::Severity::High);
        io.enumCase(sev, "critical",      rulecat::Severity::Critical);
    }
};

template <>
struct MappingTraits<rulecat::RegexConfiguration> {
    static void mapping(IO &io, rulecat::RegexConfiguration &rc) {
        io.mapOptional("name",     rc.name);
        io.mapOptional("message",  rc.message);
        io.mapOptional("regex",    rc.regex);
        io.mapOptional("severity", rc.severity);
    }
};

template <>
struct MappingTraits<rulecat::Config> {
    static void mapping(IO &io, rulecat::Config &cfg) {
        io.mapOptional("disabled_rules", cfg.disabledRules);
        io.mapOptional("opt_in_rules",   cfg.optInRules);
        io.mapOptional("only_rules",     cfg.onlyRules);
        io.mapOptional("analyzer_rules", cfg.analyzerRules);
        io.mapOptional("rules",          cfg.ruleOptions);
        io.mapOptional("custom_rules",   cfg.customRules);
    }
};

} // namespace yaml
} // namespace llvm

namespace rulecat {

namespace {

void forwardDiagnostic(const llvm::SMDiagnostic &diag, void *ctx) {
    diag.print("rulecat", *static_cast<llvm::raw_ostream *>(ctx),
               /*ShowColors=*/false);
}

// Fill in identifiers from the mapping keys and drop unusable entries.
void validateCustomRules(Config &cfg, llvm::StringRef sourceName,
                         llvm::raw_ostream &diag) {
    for (auto it = cfg.customRules.begin(); it != cfg.customRules.end();) {
        auto &rc = it->second;
        rc.identifier = it->first;

        std::string error;
        if (it->first.empty()) {
            error = "empty identifier";
        } else if (rc.regex.empty()) {
            error = "missing regex";
        } else {
            llvm::Regex re(rc.regex);
            re.isValid(error);
        }

        if (error.empty()) {
            ++it;
            continue;
        }

        diag << "rulecat: warning: custom rule '" << it->first << "' in '"
             << sourceName << "' ignored: " << error << "\n";
        it = cfg.customRules.erase(it);
    }
}

} // anonymous namespace

const RuleOptions *Config::findRuleOptions(llvm::StringRef ruleID) const {
    auto it = ruleOptions.find(ruleID.str());
    return (it != ruleOptions.end()) ? &it->second : nullptr;
}

Config Config::defaults() {
    return Config{};
}

Config Config::loadFromString(llvm::StringRef text,
                              llvm::StringRef sourceName,
                              llvm::raw_ostream &diag) {
    if (text.trim().empty())
        return defaults();

    Config cfg = defaults();
    llvm::yaml::Input yin(text, /*Ctxt=*/nullptr, forwardDiagnostic, &diag);
    yin >> cfg;

    if (yin.error()) {
        diag << "rulecat: warning: config parse error in '"
             << sourceName << "', using defaults\n";
        return defaults();
    }

    validateCustomRules(cfg, sourceName, diag);
    return cfg;
}

Config Config::loadFromFile(const std::string &path, llvm::raw_ostream &diag) {
    auto bufOrErr = llvm::MemoryBuffer::getFile(path);
    if (!bufOrErr) {
        diag << "rulecat: warning: cannot open config '"
             << path << "', using defaults\n";
        return defaults();
    }

    return loadFromString(bufOrErr.get()->getBuffer(), path, diag);
}

} // namespace rulecat
