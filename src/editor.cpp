#include "glot/editor.hpp"
#include "glot/config.hpp"
#include "glot/directives.hpp"
#include "glot/source.hpp"
#include "glot/text.hpp"
#include <algorithm>
#include <cstdio>
#include <set>

namespace glot {

std::mutex& EditSession::lock_for(const std::string& path){
    std::lock_guard<std::mutex> lk(table_mutex_);
    auto &m = locks_[path];
    if(!m) m = std::make_unique<std::mutex>();
    return *m;
}

namespace {

struct insertion { int line; std::string body; bool jsx; };

std::string eol_of(const std::string& text){
    return text.find("\r\n") != std::string::npos ? "\r\n" : "\n";
}

std::string comment_for(const std::string& body, bool jsx){
    return jsx ? "{/* " + body + " */}" : "// " + body;
}

// Each comment goes on its own line above the target, at the target's indentation.
std::string insert_above(const std::string& text, std::vector<insertion> ins){
    line_index lines(text);
    std::string eol = eol_of(text);
    std::sort(ins.begin(), ins.end(), [](const insertion& a, const insertion& b){ return a.line > b.line; });
    std::string out = text;
    for(const auto &i : ins){
        std::string indent(indentation_of(lines.line_text(i.line)));
        out.insert(lines.line_start(i.line), indent + comment_for(i.body, i.jsx) + eol);
    }
    return out;
}

// The part of a finding's text that must still appear verbatim on its line.
std::string snippet_of(const std::string& text){
    std::string s;
    for(char c : text){
        if(c == '\n' || c == '\r' || c == '\\' || c == '"' || c == '\'' || c == '`') break;
        s += c;
    }
    return std::string(trim(s));
}

struct line_check { int line; std::string snippet; };

void verify_lines(const std::string& path, const std::string& text, const std::vector<line_check>& checks){
    line_index lines(text);
    for(const auto &c : checks){
        if(c.line < 1 || c.line > lines.line_count())
            throw edit_conflict(path + ": line " + std::to_string(c.line) + " no longer exists", path, c.line);
        if(!c.snippet.empty() && lines.line_text(c.line).find(c.snippet) == std::string_view::npos)
            throw edit_conflict(path + ":" + std::to_string(c.line) + ": expected `" + c.snippet + "` on this line",
                                path, c.line);
    }
}

DirectiveState reparse(const std::string& path, const std::string& text){
    auto unit = parse_source(path, text);
    if(!unit.ok())
        throw edit_conflict(path + ": source no longer parses: " + unit.failure->message, path, unit.failure->where.begin.line);
    return DirectiveState(unit);
}

} // namespace

std::vector<EditOutcome> EditSession::apply_suppressions(const std::vector<Finding>& findings,
                                                         const std::vector<SourceFile>& files){
    std::vector<EditOutcome> out;
    for(const auto &file : files){
        struct target { rule_set rules = 0; bool jsx = false; };
        std::map<int, target> targets;
        std::vector<line_check> checks;
        // The comment goes above `line`; `snippet` must still be found on `at`.
        auto add = [&](int line, int at, rule r, bool jsx, std::string snippet){
            auto ins = targets.emplace(line, target{});
            if(ins.second) ins.first->second.jsx = jsx;
            ins.first->second.rules |= bit(r);
            checks.push_back(line_check{ at, std::move(snippet) });
        };
        for(const auto &f : findings){
            if(f.suppressed) continue;
            switch(f.kind){
                case FindingKind::hardcoded:
                    if(f.path == file.path)
                        add(f.directive_line(), f.where.begin.line, rule::hardcoded, f.jsx_comment, snippet_of(f.text));
                    break;
                case FindingKind::unresolved_key:
                    if(f.path == file.path)
                        add(f.directive_line(), f.where.begin.line, rule::unresolved_key, f.jsx_comment, f.text);
                    break;
                case FindingKind::untranslated:
                    for(const auto &u : f.usages)
                        if(u.path == file.path && !u.untranslated_suppressed)
                            add(u.directive_line(), u.where.begin.line, rule::untranslated, u.jsx_comment, {});
                    break;
                default:
                    break;
            }
        }
        if(targets.empty()){
            out.push_back(EditOutcome{ file.path, file.text, false, {} });
            continue;
        }
        out.push_back(with_lock(file.path, file.text, [&]{
            verify_lines(file.path, file.text, checks);
            auto directives = reparse(file.path, file.text);
            std::vector<insertion> ins;
            static const rule order[] = { rule::hardcoded, rule::untranslated, rule::unresolved_key };
            for(const auto &kv : targets){
                std::string names;
                for(auto r : order)
                    if((kv.second.rules & bit(r)) && !directives.is_suppressed(kv.first, r)){ names += ' '; names += rule_name(r); }
                if(!names.empty()) ins.push_back(insertion{ kv.first, "glot-disable-next-line" + names, kv.second.jsx });
            }
            if(debug_enabled()) std::fprintf(stderr, "[glot:edit] %s: %zu suppression comment(s)\n", file.path.c_str(), ins.size());
            return insert_above(file.text, std::move(ins));
        }));
    }
    return out;
}

std::vector<EditOutcome> EditSession::apply_annotations(const std::vector<AnnotationRequest>& requests,
                                                        const std::vector<SourceFile>& files){
    std::vector<EditOutcome> out;
    for(const auto &file : files){
        std::vector<const AnnotationRequest*> mine;
        for(const auto &r : requests)
            if(r.finding.kind == FindingKind::unresolved_key && r.finding.path == file.path) mine.push_back(&r);
        if(mine.empty()){
            out.push_back(EditOutcome{ file.path, file.text, false, {} });
            continue;
        }
        out.push_back(with_lock(file.path, file.text, [&]{
            std::vector<line_check> checks;
            for(const auto *r : mine) checks.push_back(line_check{ r->finding.where.begin.line, r->finding.text });
            verify_lines(file.path, file.text, checks);
            const auto directives = reparse(file.path, file.text);
            std::map<int, insertion> ins;
            for(const auto *r : mine){
                int line = r->finding.directive_line();
                if(ins.count(line) || directives.annotation_for(line)) continue;
                std::vector<std::string> keys = r->keys;
                if(keys.empty() && !r->finding.pattern.empty()) keys.push_back(r->finding.pattern);
                std::string body = "glot-message-keys";
                for(const auto &k : keys) body += " \"" + k + "\"";
                ins.emplace(line, insertion{ line, std::move(body), r->finding.jsx_comment });
            }
            std::vector<insertion> list;
            for(auto &kv : ins) list.push_back(std::move(kv.second));
            return insert_above(file.text, std::move(list));
        }));
    }
    return out;
}

std::vector<EditOutcome> EditSession::apply_key_deletions(const std::vector<Finding>& findings,
                                                          const std::vector<LocaleFile>& tables){
    std::vector<EditOutcome> out;
    for(const auto &table : tables){
        std::set<std::string> own, shared;
        for(const auto &f : findings){
            if(f.kind == FindingKind::unused_key){
                if(f.path == table.path) own.insert(f.key);
                else shared.insert(f.key);
            } else if(f.kind == FindingKind::orphan_key && f.path == table.path){
                own.insert(f.key);
            }
        }
        if(own.empty() && shared.empty()){
            out.push_back(EditOutcome{ table.path, table.text, false, {} });
            continue;
        }
        out.push_back(with_lock(table.path, table.text, [&]{
            auto doc = json_document::parse(table.text, table.path);
            std::set<std::string> keys;
            for(const auto &k : own){
                if(!doc.value_at(k)) throw edit_conflict(table.path + ": key '" + k + "' is not a member of the table", table.path, 0);
                keys.insert(k);
            }
            for(const auto &k : shared) if(doc.value_at(k)) keys.insert(k);
            std::vector<std::string> removed;
            auto text = delete_json_keys(doc, keys, &removed);
            if(debug_enabled()) std::fprintf(stderr, "[glot:edit] %s: %zu key(s) deleted\n", table.path.c_str(), removed.size());
            return text;
        }));
    }
    return out;
}

InsertOutcome EditSession::insert_keys(const LocaleFile& table, const std::vector<KeyValue>& values){
    InsertOutcome r;
    r.outcome = with_lock(table.path, table.text, [&]{
        std::string text = table.text;
        for(const auto &kv : values){
            auto doc = json_document::parse(text, table.path);
            auto res = insert_json_key(doc, kv.key, kv.value);
            text = std::move(res.first);
            r.keys.emplace_back(kv.key, res.second);
        }
        return text;
    });
    if(!r.outcome.error.empty()) r.keys.clear();
    return r;
}

} // namespace glot
