#include "rulecat/output/OutputFormatter.h"

#include <cstdio>
#include <sstream>

namespace rulecat {

namespace {

std::string escape(const std::string &s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x",
                             static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

const char *jsonBool(bool b) { return b ? "true" : "false"; }

void writeStringArray(std::ostringstream &os, const std::vector<std::string> &items,
                      const char *pad) {
    os << "[";
    for (size_t i = 0; i < items.size(); ++i) {
        os << "\n" << pad << "  \"" << escape(items[i]) << "\"";
        if (i + 1 < items.size()) os << ",";
    }
    if (!items.empty())
        os << "\n" << pad;
    os << "]";
}

} // anonymous namespace

std::string JSONOutputFormatter::formatCatalog(std::vector<PresentableRow> rows) {
    sortRows(rows);

    std::ostringstream os;
    os << "{\n  \"rules\": [\n";

    for (size_t i = 0; i < rows.size(); ++i) {
        const auto &r = rows[i];
        os << "    {\n";
        os << "      \"identifier\": \"" << escape(r.identifier) << "\",\n";
        os << "      \"optIn\": " << jsonBool(r.optIn) << ",\n";
        os << "      \"correctable\": " << jsonBool(r.correctable) << ",\n";
        os << "      \"enabledInYourConfig\": " << jsonBool(r.configured) << ",\n";
        os << "      \"kind\": \"" << ruleKindToString(r.kind) << "\",\n";
        os << "      \"analyzer\": " << jsonBool(r.analyzer) << ",\n";
        os << "      \"configuration\": \"" << escape(r.description) << "\"\n";
        os << "    }";
        if (i + 1 < rows.size()) os << ",";
        os << "\n";
    }

    os << "  ]\n}\n";
    return os.str();
}

std::string JSONOutputFormatter::formatRule(const RuleDescription &desc) {
    std::ostringstream os;
    os << "{\n";
    os << "  \"identifier\": \"" << escape(desc.identifier) << "\",\n";
    os << "  \"name\": \"" << escape(desc.name) << "\",\n";
    os << "  \"kind\": \"" << ruleKindToString(desc.kind) << "\",\n";
    os << "  \"description\": \"" << escape(desc.description) << "\",\n";
    os << "  \"nonTriggeringExamples\": ";
    writeStringArray(os, desc.nonTriggeringExamples, "  ");
    os << ",\n  \"triggeringExamples\": ";
    writeStringArray(os, desc.triggeringExamples, "  ");
    os << "\n}\n";
    return os.str();
}

} // namespace rulecat
