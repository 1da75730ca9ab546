#include "glot/directives.hpp"
#include "glot/config.hpp"
#include "glot/text.hpp"
#include <cctype>
#include <climits>
#include <cstdio>

namespace glot {

const char* rule_name(rule r){
    switch(r){
        case rule::hardcoded: return "hardcoded";
        case rule::untranslated: return "untranslated";
        case rule::unresolved_key: return "unresolved-key";
    }
    return "unknown";
}

std::optional<rule> rule_from_name(std::string_view name){
    std::string n;
    for(char c : name) n += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if(n == "hardcoded") return rule::hardcoded;
    if(n == "untranslated") return rule::untranslated;
    if(n == "unresolved-key" || n == "unresolved") return rule::unresolved_key;
    return std::nullopt;
}

bool valid_key_pattern(std::string_view pattern){
    std::string_view p = pattern;
    if(!p.empty() && p.front() == '.') p.remove_prefix(1);   // relative to the namespace
    if(p.empty() || p.front() == '*') return false;
    for(const auto &seg : split(p, '.')) if(seg.empty()) return false;
    return true;
}

static std::string_view strip_decoration(std::string_view s){
    s = trim(s);
    while(!s.empty() && s.front() == '*'){ s.remove_prefix(1); s = trim(s); }
    while(!s.empty() && s.back() == '*'){ s.remove_suffix(1); s = trim(s); }
    return s;
}

static bool take_prefix(std::string_view& s, std::string_view word){
    if(!starts_with(s, word)) return false;
    if(s.size() > word.size() && !std::isspace(static_cast<unsigned char>(s[word.size()]))) return false;
    s.remove_prefix(word.size());
    return true;
}

static rule_set parse_rules(std::string_view rest){
    rule_set set = 0;
    std::string token;
    auto flush = [&]{
        if(token.empty()) return;
        if(auto r = rule_from_name(token)) set |= bit(*r);
        token.clear();
    };
    for(char c : rest){
        if(std::isspace(static_cast<unsigned char>(c)) || c == ','){ flush(); continue; }
        token += c;
    }
    flush();
    // An empty or entirely unknown list falls back to every rule.
    return set ? set : all_rules;
}

std::optional<directive> parse_directive(std::string_view comment_text){
    std::string_view s = strip_decoration(comment_text);
    directive d;
    if(take_prefix(s, "glot-disable-next-line")){ d.type = directive::kind::disable_next_line; d.rules = parse_rules(s); return d; }
    if(take_prefix(s, "glot-disable")){ d.type = directive::kind::disable; d.rules = parse_rules(s); return d; }
    if(take_prefix(s, "glot-enable")){ d.type = directive::kind::enable; return d; }
    if(take_prefix(s, "glot-message-keys")){
        d.type = directive::kind::message_keys;
        std::size_t i = 0;
        while((i = s.find('"', i)) != std::string_view::npos){
            std::size_t close = s.find('"', i + 1);
            if(close == std::string_view::npos) break;
            std::string key(s.substr(i + 1, close - i - 1));
            if(valid_key_pattern(key)) d.keys.push_back(std::move(key));
            else d.rejected.push_back(std::move(key));
            i = close + 1;
        }
        return d;
    }
    return std::nullopt;
}

std::vector<bool> comment_only_lines(const std::string& text, const line_index& lines,
                                     const std::vector<comment_token>& comments){
    std::vector<bool> covered(text.size(), false);
    std::vector<bool> has_comment(static_cast<std::size_t>(lines.line_count()), false);
    for(const auto &c : comments){
        for(std::size_t i = c.where.begin.offset; i < c.where.end.offset && i < text.size(); ++i) covered[i] = true;
        for(int l = c.where.begin.line; l <= c.where.end.line && l <= lines.line_count(); ++l)
            has_comment[static_cast<std::size_t>(l-1)] = true;
    }
    std::vector<bool> out(static_cast<std::size_t>(lines.line_count()), false);
    for(int l = 1; l <= lines.line_count(); ++l){
        if(!has_comment[static_cast<std::size_t>(l-1)]) continue;
        bool only = true;
        for(std::size_t i = lines.line_start(l); i < lines.line_end(l); ++i){
            if(covered[i]) continue;
            char c = text[i];
            if(c==' ' || c=='\t' || c=='\r' || c=='{' || c=='}') continue;
            only = false; break;
        }
        out[static_cast<std::size_t>(l-1)] = only;
    }
    return out;
}

DirectiveState::DirectiveState(const source_unit& unit){
    line_index lines(unit.text);
    comment_only_ = comment_only_lines(unit.text, lines, unit.comments);
    std::vector<block_range> open;
    for(const auto &c : unit.comments){
        auto d = parse_directive(c.text);
        if(!d) continue;
        switch(d->type){
            case directive::kind::disable_next_line: {
                int target = c.where.end.line + 1;
                for(int hops = 0; hops < max_comment_chain_lines && is_comment_only(target); ++hops) ++target;
                next_line_[target] |= d->rules;
                break;
            }
            case directive::kind::disable:
                open.push_back(block_range{ c.where.begin.line, INT_MAX, d->rules });
                break;
            case directive::kind::enable:
                if(!open.empty()){
                    auto b = open.back(); open.pop_back();
                    b.last = c.where.begin.line - 1;
                    blocks_.push_back(b);
                }
                break;
            case directive::kind::message_keys: {
                AnnotationBlock a;
                a.line = c.where.begin.line;
                a.end_line = c.where.end.line;
                a.where = c.where;
                a.keys = d->keys;
                if(debug_enabled() && !d->rejected.empty())
                    std::fprintf(stderr, "[glot:directives] %s:%d: %zu invalid key pattern(s) ignored\n",
                                 unit.path.c_str(), a.line, d->rejected.size());
                annotations_.push_back(std::move(a));
                break;
            }
        }
    }
    blocks_.insert(blocks_.end(), open.begin(), open.end());
}

bool DirectiveState::is_suppressed(int line, rule r) const {
    auto it = next_line_.find(line);
    if(it != next_line_.end() && (it->second & bit(r))) return true;
    for(const auto &b : blocks_)
        if(line >= b.first && line <= b.last && (b.rules & bit(r))) return true;
    return false;
}

bool DirectiveState::comment_chain_reaches(int from_line, int line) const {
    if(from_line == line) return true;
    if(from_line > line || line - from_line - 1 > max_comment_chain_lines) return false;
    for(int l = from_line + 1; l < line; ++l) if(!is_comment_only(l)) return false;
    return true;
}

const AnnotationBlock* DirectiveState::annotation_for(int line) const {
    for(auto it = annotations_.rbegin(); it != annotations_.rend(); ++it){
        if(it->consumed || it->line > line) continue;
        if(comment_chain_reaches(it->end_line, line)) return &*it;
    }
    return nullptr;
}

AnnotationBlock* DirectiveState::annotation_for(int line){
    return const_cast<AnnotationBlock*>(static_cast<const DirectiveState&>(*this).annotation_for(line));
}

} // namespace glot
