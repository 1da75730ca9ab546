#include "glot/finding.hpp"
#include <tuple>

namespace glot {

const char* kind_name(FindingKind k){
    switch(k){
        case FindingKind::hardcoded: return "hardcoded";
        case FindingKind::missing_key: return "missing-key";
        case FindingKind::unresolved_key: return "unresolved-key";
        case FindingKind::parse_error: return "parse-error";
        case FindingKind::unused_key: return "unused-key";
        case FindingKind::orphan_key: return "orphan-key";
        case FindingKind::replica_lag: return "replica-lag";
        case FindingKind::type_mismatch: return "type-mismatch";
        case FindingKind::untranslated: return "untranslated";
    }
    return "unknown";
}

std::optional<FindingKind> kind_from_name(std::string_view name){
    static const FindingKind all[] = {
        FindingKind::hardcoded, FindingKind::missing_key, FindingKind::unresolved_key, FindingKind::parse_error,
        FindingKind::unused_key, FindingKind::orphan_key, FindingKind::replica_lag, FindingKind::type_mismatch,
        FindingKind::untranslated };
    for(auto k : all) if(name == kind_name(k)) return k;
    return std::nullopt;
}

Severity severity_of(FindingKind k){
    switch(k){
        case FindingKind::hardcoded:
        case FindingKind::missing_key:
        case FindingKind::parse_error:
        case FindingKind::replica_lag:
        case FindingKind::type_mismatch:
            return Severity::error;
        default:
            return Severity::warning;
    }
}

Finding make_finding(FindingKind kind, std::string path, span where, std::string message){
    Finding f;
    f.kind = kind;
    f.severity = severity_of(kind);
    f.path = std::move(path);
    f.where = where;
    f.message = std::move(message);
    return f;
}

bool finding_less(const Finding& a, const Finding& b){
    int ak = static_cast<int>(a.kind), bk = static_cast<int>(b.kind);
    return std::tie(a.path, a.where.begin.line, a.where.begin.col, ak, a.key, a.locale)
         < std::tie(b.path, b.where.begin.line, b.where.begin.col, bk, b.key, b.locale);
}

std::map<FindingKind, std::size_t> count_by_kind(const std::vector<Finding>& findings, bool include_suppressed){
    std::map<FindingKind, std::size_t> out;
    for(const auto &f : findings) if(include_suppressed || !f.suppressed) ++out[f.kind];
    return out;
}

std::map<Severity, std::size_t> count_by_severity(const std::vector<Finding>& findings, bool include_suppressed){
    std::map<Severity, std::size_t> out;
    for(const auto &f : findings) if(include_suppressed || !f.suppressed) ++out[f.severity];
    return out;
}

} // namespace glot
