// Findings produced by the checker
#pragma once
#include "glot/source.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace glot {

enum class FindingKind {
    hardcoded, missing_key, unresolved_key, parse_error,
    unused_key, orphan_key, replica_lag, type_mismatch, untranslated
};

enum class Severity { error, warning };

const char* kind_name(FindingKind k);
std::optional<FindingKind> kind_from_name(std::string_view name);
Severity severity_of(FindingKind k);
inline const char* severity_name(Severity s){ return s == Severity::error ? "error" : "warning"; }

struct FindingNote { std::string message; std::string path; int line=-1; int col=-1; };

// Where a key is referenced from source.
struct KeyUsage {
    std::string path;
    span where;
    int anchor_line = 0;                 // set when `where` starts inside template literal text
    bool jsx_comment = false;            // a comment above the directive line must use `{/* */}`
    bool untranslated_suppressed = false;

    // The line a directive comment has to sit above.
    int directive_line() const { return anchor_line ? anchor_line : where.begin.line; }
};

struct Finding {
    FindingKind kind = FindingKind::hardcoded;
    Severity severity = Severity::error;
    std::string path;
    span where;
    std::string message;
    std::string hint;
    std::vector<FindingNote> notes;
    bool suppressed = false;

    std::string key;        // key findings
    std::string locale;     // table findings: the table located in; replica-lag: the lagging replica
    std::string text;       // hardcoded text, the callee of an unresolved call, or an untranslated value
    std::string pattern;    // unresolved template keys: inferred glob, empty when none is usable
    int anchor_line = 0;    // source findings whose line starts inside template literal text
    bool jsx_comment = false;
    std::vector<KeyUsage> usages;

    int directive_line() const { return anchor_line ? anchor_line : where.begin.line; }
};

Finding make_finding(FindingKind kind, std::string path, span where, std::string message);

// Orders by path, line, column, kind, key and locale.
bool finding_less(const Finding& a, const Finding& b);

std::map<FindingKind, std::size_t> count_by_kind(const std::vector<Finding>& findings, bool include_suppressed = false);
std::map<Severity, std::size_t> count_by_severity(const std::vector<Finding>& findings, bool include_suppressed = false);

} // namespace glot
