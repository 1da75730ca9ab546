#include "glot/key_resolver.hpp"
#include "glot/text.hpp"
#include <algorithm>
#include <cstdio>
#include <initializer_list>
#include <iterator>
#include <string_view>

namespace glot {

std::string qualify_key(const NamespaceRef& ns, const std::string& key){
    if(ns.st != NamespaceRef::state::known || ns.name.empty()) return key;
    return ns.name + "." + key;
}

std::string infer_key_pattern(const template_key& key, const NamespaceRef& ns){
    if(ns.st == NamespaceRef::state::unknown || key.quasis.size() < 2) return {};
    std::string pattern;
    for(std::size_t i = 0; i < key.quasis.size(); ++i){
        if(i) pattern += '*';
        pattern += key.quasis[i];
    }
    auto segs = split(pattern, '.');
    if(segs.empty() || segs.front() == "*") return {};
    std::size_t stars = static_cast<std::size_t>(std::count(pattern.begin(), pattern.end(), '*'));
    if(stars > 2) return {};
    bool all_wild = true;
    for(const auto &s : segs){
        if(s.empty()) return {};
        if(s != "*") all_wild = false;
    }
    if(all_wild) return {};
    return qualify_key(ns, pattern);
}

namespace {

bool is_comment(const syntax_ptr& n){ return node_as<comment>(n) != nullptr; }

std::vector<syntax_ptr> without_comments(const std::vector<syntax_ptr>& items){
    std::vector<syntax_ptr> out;
    for(const auto &n : items) if(n && !is_comment(n)) out.push_back(n);
    return out;
}

// Items of the first argument in a call's parenthesis group.
std::vector<syntax_ptr> first_argument(const group& g){
    std::vector<syntax_ptr> out;
    for(const auto &n : g.items){
        if(is_punct(n, ",")) break;
        if(n && !is_comment(n)) out.push_back(n);
    }
    return out;
}

// Literal string of a single node: a string, or a template without substitutions.
const std::string* literal_text(const syntax_ptr& n){
    if(auto s = node_as<string_lit>(n)) return &s->value;
    if(auto t = node_as<template_lit>(n)) if(t->exprs.empty() && t->quasis.size() == 1) return &t->quasis.front();
    return nullptr;
}

// Index of the `:` closing the conditional whose `?` sits at q, or npos.
std::size_t matching_colon(const std::vector<syntax_ptr>& v, std::size_t q){
    int depth = 0;
    for(std::size_t i = q + 1; i < v.size(); ++i){
        if(is_punct(v[i], "?")) ++depth;
        else if(is_punct(v[i], ":")){
            if(depth == 0) return i;
            --depth;
        }
    }
    return std::string::npos;
}

bool is_control_keyword(const syntax_ptr& n){
    static const char* const kws[] = {"if","for","while","switch","with","catch","return"};
    auto w = node_as<word>(n);
    if(!w) return false;
    for(const char* k : kws) if(w->text == k) return true;
    return false;
}

std::vector<std::vector<syntax_ptr>> split_top(const std::vector<syntax_ptr>& v,
                                               std::initializer_list<std::string_view> seps){
    std::vector<std::vector<syntax_ptr>> out(1);
    for(const auto &n : v){
        bool sep = false;
        for(auto s : seps) if(is_punct(n, s)) sep = true;
        if(sep) out.emplace_back();
        else out.back().push_back(n);
    }
    return out;
}

std::vector<syntax_ptr> strip_type_suffix(std::vector<syntax_ptr> v){
    for(std::size_t i = 1; i < v.size(); ++i)
        if(is_word(v[i], "as") || is_word(v[i], "satisfies")){ v.resize(i); break; }
    while(!v.empty() && is_punct(v.back(), "!")) v.pop_back();
    return v;
}

void add_unique(std::vector<std::string>& into, const std::vector<std::string>& from){
    for(const auto &s : from)
        if(std::find(into.begin(), into.end(), s) == into.end()) into.push_back(s);
}

bool all_digits(const std::string& s){
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c){ return c >= '0' && c <= '9'; });
}

bool is_member_access(const syntax_ptr& n){ return is_punct(n, ".") || is_punct(n, "?."); }

// Index of the `=` of a declaration starting at i, or npos.
std::size_t assignment_of(const std::vector<syntax_ptr>& items, std::size_t i){
    for(std::size_t j = i + 2; j < items.size() && j < i + 18; ++j){
        if(is_punct(items[j], "=")) return j;
        if(is_punct(items[j], ";") || is_punct(items[j], ",") || is_word(items[j], "const")
           || is_word(items[j], "let") || is_word(items[j], "var")) break;
    }
    return std::string::npos;
}

// One past the last token of the initializer starting at `from`. A line break ends it unless an
// operator on either side carries the expression over.
std::size_t expression_end(const std::vector<syntax_ptr>& items, std::size_t from){
    static const char* const carry[] = {"?", ":", "||", "&&", "??", ".", "?.", "+", "-", "=>", "="};
    auto carries = [](const syntax_ptr& n){
        auto p = node_as<punct>(n);
        if(!p) return is_word(n, "as") || is_word(n, "satisfies");
        for(const char* c : carry) if(p->text == c) return true;
        return false;
    };
    const syntax_ptr* prev = nullptr;
    std::size_t j = from;
    for(; j < items.size(); ++j){
        const auto &n = items[j];
        if(!n || is_comment(n)) continue;
        if(is_punct(n, ";") || is_punct(n, ",")) break;
        if(prev && n->where.begin.line > (*prev)->where.end.line && !carries(*prev) && !carries(n)) break;
        prev = &n;
    }
    return j;
}

// A parameter: `local` is the bound name, `prop` the destructured property it reads.
struct param { std::string local; std::string prop; std::size_t index = 0; };

std::vector<param> parameter_list(const group& g){
    std::vector<param> out;
    auto parts = split_top(without_comments(g.items), {","});
    for(std::size_t n = 0; n < parts.size(); ++n){
        const auto &p = parts[n];
        std::size_t k = !p.empty() && is_punct(p[0], "...") ? 1 : 0;
        if(k >= p.size()) continue;
        if(auto w = node_as<word>(p[k])){
            out.push_back(param{ w->text, {}, n });
            continue;
        }
        auto obj = node_as<group>(p[k]);
        if(!obj || obj->open != '{') continue;
        // `{ a, b: c, d = x, ...rest }`
        for(const auto &m : split_top(without_comments(obj->items), {","})){
            if(m.empty()) continue;
            if(is_punct(m[0], "...")){
                if(m.size() > 1) if(auto w = node_as<word>(m[1])) out.push_back(param{ w->text, "...", n });
                continue;
            }
            auto key = node_as<word>(m[0]);
            if(!key) continue;
            if(m.size() >= 3 && is_punct(m[1], ":")){
                if(auto local = node_as<word>(m[2])) out.push_back(param{ local->text, key->text, n });
                continue;
            }
            out.push_back(param{ key->text, key->text, n });
        }
    }
    return out;
}

} // namespace

const KeyResolver::Binding* KeyResolver::lookup(const std::string& name) const {
    for(auto s = scopes_.rbegin(); s != scopes_.rend(); ++s)
        for(auto b = s->rbegin(); b != s->rend(); ++b)
            if(b->name == name) return &*b;
    return nullptr;
}

bool KeyResolver::is_checked_attribute(const std::string& name) const {
    return std::find(cfg_.checked_attributes.begin(), cfg_.checked_attributes.end(), name) != cfg_.checked_attributes.end();
}

bool KeyResolver::is_ignored_text(const std::string& text) const {
    return std::find(cfg_.ignore_texts.begin(), cfg_.ignore_texts.end(), text) != cfg_.ignore_texts.end();
}

bool KeyResolver::starts_line(const position& p) const {
    for(std::size_t i = lines_.line_start(p.line); i < p.offset && i < unit_.text.size(); ++i){
        char c = unit_.text[i];
        if(c != ' ' && c != '\t') return false;
    }
    return true;
}

// Only the first token that starts a line decides which comment syntax that line takes.
void KeyResolver::record_line(const syntax_node& node, bool jsx_children){
    if(starts_line(node.where.begin)) line_jsx_.emplace(node.where.begin.line, jsx_children);
}

void KeyResolver::record_text_lines(const syntax_node& node, const std::string& raw){
    bool pending = true;
    for(std::size_t i = 0; i < raw.size(); ++i){
        char c = raw[i];
        if(c == '\n'){ pending = true; continue; }
        if(!pending || c == ' ' || c == '\t' || c == '\r') continue;
        pending = false;
        auto p = lines_.at(node.where.begin.offset + i);
        if(starts_line(p)) line_jsx_.emplace(p.line, true);
    }
}

bool KeyResolver::line_uses_jsx_comment(int line) const {
    auto it = line_jsx_.find(line);
    return it != line_jsx_.end() && it->second;
}

int KeyResolver::directive_line_for(int line) const {
    bool moved = true;
    while(moved && line > 1){
        moved = false;
        std::size_t start = lines_.line_start(line);
        for(const auto &r : template_text_){
            if(start > r.first && start <= r.second){
                line = lines_.at(r.first).line;
                moved = true;
                break;
            }
        }
    }
    return line;
}

void KeyResolver::report_text(const std::string& raw, std::size_t offset){
    std::string_view t = trim(raw);
    if(t.empty() || !has_alphabetic(t)) return;
    std::string text(t);
    if(is_ignored_text(text)) return;
    std::size_t begin = offset + static_cast<std::size_t>(t.data() - raw.data());
    auto f = make_finding(FindingKind::hardcoded, unit_.path, lines_.range(begin, begin + t.size()), text);
    f.text = text;
    f.hint = "move the text into the locale files and render it with a translation call";
    out_.findings.push_back(std::move(f));
}

void KeyResolver::check_expr(const std::vector<syntax_ptr>& items){
    auto v = without_comments(items);
    if(v.empty()) return;
    if(v.size() == 1){
        const auto &n = v.front();
        if(auto s = node_as<string_lit>(n)){
            report_text(s->value, n->where.begin.offset + 1);
        } else if(auto t = node_as<template_lit>(n)){
            for(std::size_t i = 0; i < t->quasis.size(); ++i)
                report_text(t->quasis[i], t->quasi_spans[i].begin.offset);
        } else if(auto g = node_as<group>(n)){
            if(g->open == '(') check_expr(g->items);
        }
        return;
    }
    for(std::size_t i = 0; i < v.size(); ++i){
        if(!is_punct(v[i], "?")) continue;
        std::size_t c = matching_colon(v, i);
        if(c == std::string::npos) break;
        check_expr(std::vector<syntax_ptr>(v.begin() + static_cast<long>(i) + 1, v.begin() + static_cast<long>(c)));
        check_expr(std::vector<syntax_ptr>(v.begin() + static_cast<long>(c) + 1, v.end()));
        return;
    }
    // Any operand of `a || "x" || b` or `a ?? "x"` may render.
    auto alternatives = split_top(v, {"||", "??"});
    if(alternatives.size() > 1){
        for(const auto &a : alternatives) check_expr(a);
        return;
    }
    // `cond && "x"` renders its right side.
    std::size_t split_at = std::string::npos;
    for(std::size_t i = 0; i < v.size(); ++i)
        if(is_punct(v[i], "&&")) split_at = i;
    if(split_at != std::string::npos)
        check_expr(std::vector<syntax_ptr>(v.begin() + static_cast<long>(split_at) + 1, v.end()));
}

NamespaceRef KeyResolver::namespace_from_args(const group& args) const {
    NamespaceRef ns;
    auto arg = first_argument(args);
    if(arg.empty()) return ns;
    if(arg.size() == 1){
        if(auto s = literal_text(arg.front())){
            ns.st = s->empty() ? NamespaceRef::state::none : NamespaceRef::state::known;
            ns.name = *s;
            return ns;
        }
        if(auto obj = node_as<group>(arg.front()); obj && obj->open == '{'){
            // `{ locale, namespace: "x" }`
            const auto &it = obj->items;
            for(std::size_t i = 0; i + 2 < it.size(); ++i){
                if(!is_word(it[i], "namespace") || !is_punct(it[i+1], ":")) continue;
                if(auto s = literal_text(it[i+2])){
                    bool last = i + 3 >= it.size() || is_punct(it[i+3], ",");
                    if(last){
                        ns.st = s->empty() ? NamespaceRef::state::none : NamespaceRef::state::known;
                        ns.name = *s;
                        return ns;
                    }
                }
                ns.st = NamespaceRef::state::unknown;
                return ns;
            }
            return ns;
        }
    }
    ns.st = NamespaceRef::state::unknown;
    return ns;
}

// Every string an expression can evaluate to, when that set is finite and known from this file.
KeyResolver::Values KeyResolver::values_of(std::vector<syntax_ptr> items, int depth) const {
    if(depth > 8) return std::nullopt;
    auto v = strip_type_suffix(without_comments(items));
    if(v.empty()) return std::nullopt;

    for(std::size_t i = 0; i < v.size(); ++i){
        if(!is_punct(v[i], "?")) continue;
        std::size_t c = matching_colon(v, i);
        if(c == std::string::npos) return std::nullopt;
        auto a = values_of(std::vector<syntax_ptr>(v.begin() + static_cast<long>(i) + 1, v.begin() + static_cast<long>(c)), depth + 1);
        auto b = values_of(std::vector<syntax_ptr>(v.begin() + static_cast<long>(c) + 1, v.end()), depth + 1);
        if(!a || !b) return std::nullopt;
        add_unique(*a, *b);
        return a;
    }
    auto alternatives = split_top(v, {"||", "??"});
    if(alternatives.size() > 1){
        std::vector<std::string> all;
        for(const auto &alt : alternatives){
            auto r = values_of(alt, depth + 1);
            if(!r) return std::nullopt;
            add_unique(all, *r);
        }
        return all;
    }

    if(v.size() == 1){
        const auto &n = v.front();
        if(auto s = node_as<string_lit>(n)) return std::vector<std::string>{ s->value };
        if(auto t = node_as<template_lit>(n)){
            std::vector<std::string> acc{ t->quasis.front() };
            for(std::size_t k = 0; k < t->exprs.size(); ++k){
                auto ev = values_of(t->exprs[k], depth + 1);
                if(!ev) return std::nullopt;
                std::vector<std::string> next;
                for(const auto &a : acc)
                    for(const auto &e : *ev) add_unique(next, { a + e + t->quasis[k+1] });
                if(next.size() > 64) return std::nullopt;
                acc = std::move(next);
            }
            return acc;
        }
        if(auto w = node_as<word>(n)){
            if(all_digits(w->text)) return std::vector<std::string>{ w->text };
            auto b = lookup(w->text);
            if(b && b->k == Binding::kind::value) return b->values;
            return std::nullopt;
        }
        if(auto g = node_as<group>(n); g && g->open == '(') return values_of(g->items, depth + 1);
        return std::nullopt;
    }
    // `labels.title`, `item.titleKey`
    if(v.size() == 3 && is_member_access(v[1])){
        auto obj = node_as<word>(v[0]);
        auto prop = node_as<word>(v[2]);
        if(!obj || !prop) return std::nullopt;
        auto b = lookup(obj->text);
        if(!b || (b->k != Binding::kind::object && b->k != Binding::kind::record)) return std::nullopt;
        auto it = b->props.find(prop->text);
        if(it == b->props.end()) return std::nullopt;
        return it->second;
    }
    // `labels[status]`, `KEYS[i]`
    if(v.size() == 2 && is_group(v[1], '[')){
        auto obj = node_as<word>(v[0]);
        auto b = obj ? lookup(obj->text) : nullptr;
        if(!b) return std::nullopt;
        if(b->k == Binding::kind::list) return b->values;
        if(b->k != Binding::kind::object || b->partial || b->props.empty()) return std::nullopt;
        std::vector<std::string> all;
        for(const auto &kv : b->props) add_unique(all, kv.second);
        return all;
    }
    return std::nullopt;
}

std::map<std::string, KeyResolver::Values> KeyResolver::members_of(const group& g, int depth) const {
    std::map<std::string, Values> out;
    for(const auto &m : split_top(without_comments(g.items), {","})){
        if(m.empty()) continue;
        std::string key;
        if(auto w = node_as<word>(m[0])) key = w->text;
        else if(auto s = node_as<string_lit>(m[0])) key = s->value;
        else { out["..."] = std::nullopt; continue; }      // spread or computed name
        if(m.size() == 1) out[key] = values_of(m, depth + 1);
        else if(m.size() >= 3 && is_punct(m[1], ":"))
            out[key] = values_of(std::vector<syntax_ptr>(m.begin() + 2, m.end()), depth + 1);
        else out[key] = std::nullopt;
    }
    return out;
}

KeyExpression KeyResolver::classify(const std::vector<syntax_ptr>& arg) const {
    if(arg.size() == 1){
        if(auto s = node_as<string_lit>(arg.front())) return static_key{ s->value };
        if(auto t = node_as<template_lit>(arg.front()); t && t->exprs.empty()) return static_key{ t->quasis.front() };
    }
    if(auto v = values_of(arg); v && !v->empty()){
        if(v->size() == 1) return static_key{ v->front() };
        return choice_key{ std::move(*v) };
    }
    if(arg.size() == 1){
        if(auto t = node_as<template_lit>(arg.front())) return template_key{ t->quasis };
        if(auto g = node_as<group>(arg.front()); g && g->open == '(') return classify(without_comments(g->items));
    }
    return opaque_key{};
}

std::optional<KeyResolver::Binding> KeyResolver::bind_constant(const std::string& name, std::vector<syntax_ptr> init) const {
    init = strip_type_suffix(without_comments(init));
    Binding b;
    b.name = name;
    if(init.size() == 1){
        if(auto g = node_as<group>(init.front()); g && g->open == '['){
            auto elems = split_top(without_comments(g->items), {","});
            if(!elems.empty() && elems.back().empty()) elems.pop_back();
            if(elems.empty()) return std::nullopt;
            bool records = std::all_of(elems.begin(), elems.end(), [](const std::vector<syntax_ptr>& e){
                return e.size() == 1 && is_group(e.front(), '{');
            });
            if(records){
                // Only props every record carries as a literal can be read through an element.
                b.k = Binding::kind::records;
                std::map<std::string, std::vector<std::string>> merged;
                std::map<std::string, std::size_t> seen;
                for(const auto &e : elems){
                    for(auto &kv : members_of(*node_as<group>(e.front()), 0)){
                        if(!kv.second) continue;
                        add_unique(merged[kv.first], *kv.second);
                        ++seen[kv.first];
                    }
                }
                for(auto &kv : merged)
                    if(seen[kv.first] == elems.size()) b.props.emplace(kv.first, std::move(kv.second));
                return b;
            }
            b.k = Binding::kind::list;
            for(const auto &e : elems){
                auto v = values_of(e);
                if(!v) return std::nullopt;
                add_unique(b.values, *v);
            }
            return b;
        }
        if(auto g = node_as<group>(init.front()); g && g->open == '{'){
            b.k = Binding::kind::object;
            for(auto &kv : members_of(*g, 0)){
                if(kv.second) b.props.emplace(kv.first, std::move(*kv.second));
                else b.partial = true;
            }
            return b;
        }
    }
    if(auto v = values_of(init)){
        b.k = Binding::kind::value;
        b.values = std::move(*v);
        return b;
    }
    return std::nullopt;
}

std::optional<KeyResolver::Binding> KeyResolver::constant_at(const std::vector<syntax_ptr>& items, std::size_t i) const {
    if(i + 1 >= items.size() || !is_word(items[i], "const")) return std::nullopt;
    auto name = node_as<word>(items[i+1]);
    std::size_t eq = assignment_of(items, i);
    if(!name || eq == std::string::npos) return std::nullopt;
    std::size_t end = expression_end(items, eq + 1);
    auto b = bind_constant(name->text, std::vector<syntax_ptr>(items.begin() + static_cast<long>(eq) + 1,
                                                               items.begin() + static_cast<long>(end)));
    if(b) b->site = items[i+1]->where;
    return b;
}

void KeyResolver::declaration_at(const std::vector<syntax_ptr>& items, std::size_t i){
    if(i + 1 >= items.size()) return;
    if(i > 0 && is_word(items[i-1], "as")) return;      // `as const`
    auto name = node_as<word>(items[i+1]);
    if(!name) return;
    std::size_t eq = assignment_of(items, i);
    if(eq != std::string::npos){
        std::size_t k = eq + 1;
        if(k < items.size() && is_word(items[k], "await")) ++k;
        if(k + 1 < items.size()){
            auto hook = node_as<word>(items[k]);
            auto args = node_as<group>(items[k+1]);
            bool is_hook = hook && std::find(cfg_.translation_hooks.begin(), cfg_.translation_hooks.end(), hook->text)
                                   != cfg_.translation_hooks.end();
            if(is_hook && args && args->open == '('){
                Binding b;
                b.name = name->text;
                b.site = items[i+1]->where;
                b.k = Binding::kind::translator;
                b.namespaces.push_back(namespace_from_args(*args));
                if(debug_enabled() && !collecting_ && b.namespaces.front().st == NamespaceRef::state::unknown)
                    std::fprintf(stderr, "[glot:keys] %s:%d: namespace of '%s' is not a literal\n",
                                 unit_.path.c_str(), b.site.begin.line, b.name.c_str());
                bind(std::move(b));
                return;
            }
        }
        if(auto c = constant_at(items, i)){
            bind(std::move(*c));
            return;
        }
    }
    // Anything else only matters when it hides an outer binding.
    if(lookup(name->text)){
        Binding b;
        b.name = name->text;
        b.site = items[i+1]->where;
        bind(std::move(b));
    }
}

void KeyResolver::bind_module_constants(){
    const auto &root = unit_.root;
    for(std::size_t i = 0; i < root.size(); ++i){
        if(!is_word(root[i], "const") || (i > 0 && is_word(root[i-1], "as"))) continue;
        if(auto b = constant_at(root, i)) bind(std::move(*b));
    }
}

void KeyResolver::forward(const std::string& site, const syntax_ptr& arg_word){
    auto w = node_as<word>(arg_word);
    auto b = w ? lookup(w->text) : nullptr;
    if(!b || b->k != Binding::kind::translator) return;
    auto &into = forwarded_[site];
    for(const auto &ns : b->namespaces)
        if(std::find(into.begin(), into.end(), ns) == into.end()) into.push_back(ns);
}

void KeyResolver::call_at(const std::vector<syntax_ptr>& items, std::size_t i){
    auto name = node_as<word>(items[i]);
    if(i > 0 && (is_member_access(items[i-1]) || is_word(items[i-1], "function"))) return;
    if(i + 1 >= items.size()) return;
    auto b = lookup(name->text);
    if(!b || b->k != Binding::kind::translator){
        // `labels(t)` hands the translator to a function of this file
        if(collecting_ && is_group(items[i+1], '(') && !is_control_keyword(items[i])){
            auto args = split_top(without_comments(node_as<group>(items[i+1])->items), {","});
            for(std::size_t n = 0; n < args.size(); ++n)
                if(args[n].size() == 1) forward(name->text + "#" + std::to_string(n), args[n].front());
        }
        return;
    }

    std::string method;
    const syntax_ptr* args_node = nullptr;
    if(is_group(items[i+1], '(')){
        args_node = &items[i+1];
    } else if(i + 3 < items.size() && is_punct(items[i+1], ".") && is_group(items[i+3], '(')){
        auto m = node_as<word>(items[i+2]);
        if(!m || (m->text != "raw" && m->text != "rich" && m->text != "markup")) return;
        method = m->text;
        args_node = &items[i+3];
    }
    if(!args_node) return;

    const auto &args = *node_as<group>(*args_node);
    auto arg = first_argument(args);
    if(arg.empty()) return;

    TranslationCall call;
    call.where = span{ items[i]->where.begin, (*args_node)->where.end };
    call.callee = method.empty() ? name->text : name->text + "." + method;
    call.method = method;
    call.namespaces = b->namespaces;
    call.key = classify(arg);
    std::size_t ab = arg.front()->where.begin.offset, ae = arg.back()->where.end.offset;
    call.argument = unit_.text.substr(ab, ae - ab);
    out_.calls.push_back(std::move(call));
}

void KeyResolver::walk_block(const std::vector<syntax_ptr>& items, std::size_t i){
    const auto &g = *node_as<group>(items[i]);
    std::vector<param> params;
    std::string fn;
    if(i >= 2 && is_punct(items[i-1], "=>")){
        if(auto p = node_as<group>(items[i-2]); p && p->open == '(') params = parameter_list(*p);
        else if(auto w = node_as<word>(items[i-2])) params.push_back(param{ w->text, {}, 0 });
        // `const F = [async] (...) =>`
        std::size_t k = i - 2;
        if(k >= 1 && is_word(items[k-1], "async")) --k;
        if(k >= 2 && is_punct(items[k-1], "="))
            if(auto w = node_as<word>(items[k-2])) fn = w->text;
    } else if(g.open == '{' && i >= 2 && is_group(items[i-1], '(') && node_as<word>(items[i-2]) && !is_control_keyword(items[i-2])){
        params = parameter_list(*node_as<group>(items[i-1]));
        if(i >= 3 && is_word(items[i-3], "function")) fn = node_as<word>(items[i-2])->text;
    }

    const Scope &enclosing = scopes_.back();
    Scope scope;
    for(const auto &p : params){
        bool iterated = std::any_of(enclosing.begin(), enclosing.end(),
                                    [&](const Binding& b){ return b.param && b.name == p.local; });
        if(iterated) continue;
        Binding b;
        b.name = p.local;
        b.site = items[i]->where;
        if(!fn.empty()){
            auto f = forwarded_.find(p.prop.empty() ? fn + "#" + std::to_string(p.index) : fn + "." + p.prop);
            if(f != forwarded_.end()){
                b.k = Binding::kind::translator;
                b.namespaces = f->second;
                scope.push_back(std::move(b));
                continue;
            }
        }
        if(lookup(p.local)) scope.push_back(std::move(b));
    }
    scopes_.push_back(std::move(scope));
    walk_items(g.items);
    scopes_.pop_back();
}

// `KEYS.map(k => ...)` over a constant array binds the callback's element to the array's values.
bool KeyResolver::walk_iteration(const std::vector<syntax_ptr>& items, std::size_t i){
    static const char* const methods[] = {"map","forEach","flatMap","filter","find","some","every"};
    if(i + 3 >= items.size() || (i > 0 && is_member_access(items[i-1]))) return false;
    auto w = node_as<word>(items[i]);
    auto m = node_as<word>(items[i+2]);
    auto args = node_as<group>(items[i+3]);
    if(!w || !m || !args || args->open != '(' || !is_member_access(items[i+1])) return false;
    if(std::none_of(std::begin(methods), std::end(methods), [&](const char* x){ return m->text == x; })) return false;
    auto found = lookup(w->text);
    if(!found || (found->k != Binding::kind::list && found->k != Binding::kind::records)) return false;
    Binding source = *found;

    auto cb = without_comments(args->items);
    std::vector<param> params;
    std::size_t k = !cb.empty() && is_word(cb.front(), "async") ? 1 : 0;
    if(k + 1 < cb.size() && is_punct(cb[k+1], "=>")){
        if(auto pw = node_as<word>(cb[k])) params.push_back(param{ pw->text, {}, 0 });
        else if(auto pg = node_as<group>(cb[k]); pg && pg->open == '(') params = parameter_list(*pg);
    } else if(k + 1 < cb.size() && is_word(cb[k], "function")){
        std::size_t at = is_group(cb[k+1], '(') ? k + 1 : k + 2;
        if(at < cb.size() && is_group(cb[at], '(')) params = parameter_list(*node_as<group>(cb[at]));
    }

    scopes_.emplace_back();
    for(const auto &p : params){
        Binding e;
        e.name = p.local;
        e.site = items[i]->where;
        e.param = true;
        if(p.index != 0){
            if(lookup(p.local)) bind(std::move(e));
            continue;
        }
        if(source.k == Binding::kind::list){
            if(p.prop.empty()){
                e.k = Binding::kind::value;
                e.values = source.values;
            }
        } else if(p.prop.empty()){
            e.k = Binding::kind::record;
            e.props = source.props;
        } else if(auto it = source.props.find(p.prop); it != source.props.end()){
            e.k = Binding::kind::value;
            e.values = it->second;
        }
        bind(std::move(e));
    }
    walk_items(args->items);
    scopes_.pop_back();
    for(std::size_t j = i + 1; j <= i + 3; ++j) record_line(*items[j], false);
    return true;
}

void KeyResolver::walk_items(const std::vector<syntax_ptr>& items){
    for(std::size_t i = 0; i < items.size(); ++i){
        const auto &n = items[i];
        if(!n) continue;
        record_line(*n, false);
        if(auto w = node_as<word>(n)){
            if(w->text == "const" || w->text == "let" || w->text == "var") declaration_at(items, i);
            else if(walk_iteration(items, i)) i += 3;
            else call_at(items, i);
        } else if(auto g = node_as<group>(n)){
            if(g->open == '{' || (i > 0 && is_punct(items[i-1], "=>"))) walk_block(items, i);
            else walk_items(g->items);
        } else if(auto t = node_as<template_lit>(n)){
            for(const auto &q : t->quasi_spans) template_text_.emplace_back(q.begin.offset, q.end.offset);
            for(const auto &e : t->exprs) walk_items(e);
        } else if(auto el = node_as<jsx_element>(n)){
            walk_element(*el);
        } else if(auto x = node_as<jsx_expr>(n)){
            walk_items(x->items);
        }
    }
}

void KeyResolver::walk_element(const jsx_element& el){
    bool raw_content = el.name == "style" || el.name == "script";
    for(const auto &a : el.attrs){
        if(!a) continue;
        record_line(*a, false);
        if(auto attr = node_as<jsx_attr>(a)){
            if(!attr->value) continue;
            bool checked = is_checked_attribute(attr->name);
            if(auto s = node_as<string_lit>(attr->value)){
                if(checked) report_text(s->value, attr->value->where.begin.offset + 1);
            } else if(auto x = node_as<jsx_expr>(attr->value)){
                if(checked) check_expr(x->items);
                if(collecting_){
                    auto v = without_comments(x->items);
                    if(v.size() == 1) forward(el.name + "." + attr->name, v.front());
                }
                walk_items(x->items);
            } else if(auto inner = node_as<jsx_element>(attr->value)){
                walk_element(*inner);
            }
        } else if(auto x = node_as<jsx_expr>(a)){
            walk_items(x->items);
        }
    }
    for(const auto &c : el.children){
        if(!c) continue;
        if(auto t = node_as<jsx_text>(c)){
            record_text_lines(*c, t->raw);
            if(!raw_content) report_text(t->raw, c->where.begin.offset);
        } else if(auto x = node_as<jsx_expr>(c)){
            record_line(*c, true);
            if(!raw_content) check_expr(x->items);
            walk_items(x->items);
        } else if(auto inner = node_as<jsx_element>(c)){
            record_line(*c, true);
            walk_element(*inner);
        }
    }
}

void KeyResolver::use_key(std::string key, const TranslationCall& call, bool glob){
    ResolvedKey r;
    r.key = std::move(key);
    r.usage.path = unit_.path;
    r.usage.where = call.where;
    r.usage.anchor_line = call.anchor_line;
    r.usage.jsx_comment = call.jsx_comment;
    r.glob = glob;
    r.raw = call.method == "raw";
    out_.used.push_back(std::move(r));
}

void KeyResolver::resolve_calls(){
    using ns_state = NamespaceRef::state;
    for(auto &call : out_.calls){
        int line = call.anchor_line ? call.anchor_line : call.where.begin.line;
        call.jsx_comment = line_uses_jsx_comment(line);
        bool dynamic = !std::holds_alternative<static_key>(call.key) && !std::holds_alternative<choice_key>(call.key);
        bool unknown_ns = std::any_of(call.namespaces.begin(), call.namespaces.end(),
                                      [](const NamespaceRef& ns){ return ns.st == ns_state::unknown; });

        if(!dynamic && !unknown_ns){
            for(const auto &ns : call.namespaces){
                if(auto s = std::get_if<static_key>(&call.key)) use_key(qualify_key(ns, s->key), call, false);
                else for(const auto &k : std::get<choice_key>(call.key).keys) use_key(qualify_key(ns, k), call, false);
            }
            continue;
        }

        auto a = directives_.annotation_for(line);
        if(a) a->consumed = true;
        if(a && !a->keys.empty()){
            call.annotated = a->keys;
            for(const auto &k : a->keys){
                if(k.empty() || k.front() != '.'){
                    use_key(k, call, k.find('*') != std::string::npos);
                    continue;
                }
                if(unknown_ns) continue;   // relative to a namespace nobody can name
                for(const auto &ns : call.namespaces){
                    std::string key = ns.name.empty() ? k.substr(1) : ns.name + k;
                    bool glob = key.find('*') != std::string::npos;
                    use_key(std::move(key), call, glob);
                }
            }
            continue;
        }

        std::string reason = unknown_ns ? "unknown namespace"
                           : std::holds_alternative<template_key>(call.key) ? "template with expression"
                           : "variable key";
        auto f = make_finding(FindingKind::unresolved_key, unit_.path, call.where,
                              "cannot resolve translation key: " + reason);
        f.text = call.callee;
        f.anchor_line = call.anchor_line;
        f.jsx_comment = call.jsx_comment;
        f.notes.push_back(FindingNote{ "key argument: " + call.argument, unit_.path, call.where.begin.line, call.where.begin.col });
        if(auto t = std::get_if<template_key>(&call.key); t && call.namespaces.size() == 1)
            f.pattern = infer_key_pattern(*t, call.namespaces.front());
        if(a)
            f.hint = "list the keys this call can produce in the glot-message-keys annotation above it";
        else if(!f.pattern.empty())
            f.hint = "add {/* glot-message-keys \"" + f.pattern + "\" */} or // glot-message-keys \"" + f.pattern + "\" above the call";
        else
            f.hint = "add a glot-message-keys annotation listing the keys this call can produce";
        out_.findings.push_back(std::move(f));
    }
}

void KeyResolver::walk_file(){
    out_ = FileKeys{};
    line_jsx_.clear();
    template_text_.clear();
    scopes_.assign(1, Scope{});
    bind_module_constants();
    walk_items(unit_.root);
    scopes_.clear();
}

FileKeys KeyResolver::run(){
    // Translators handed to components and functions of this file are found by walking again
    // until no new hand-off appears.
    forwarded_.clear();
    collecting_ = true;
    for(int pass = 0; pass < 4; ++pass){
        auto before = forwarded_;
        walk_file();
        if(forwarded_ == before) break;
    }
    collecting_ = false;
    walk_file();
    if(debug_enabled() && !forwarded_.empty())
        std::fprintf(stderr, "[glot:keys] %s: %zu forwarded translator site(s)\n", unit_.path.c_str(), forwarded_.size());

    for(auto &call : out_.calls){
        int d = directive_line_for(call.where.begin.line);
        if(d != call.where.begin.line) call.anchor_line = d;
    }
    resolve_calls();
    for(auto &f : out_.findings){
        if(f.kind != FindingKind::hardcoded) continue;
        int d = directive_line_for(f.where.begin.line);
        if(d != f.where.begin.line) f.anchor_line = d;
        f.jsx_comment = line_uses_jsx_comment(f.directive_line());
    }
    return std::move(out_);
}

} // namespace glot
