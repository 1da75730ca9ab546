// Translation-call classification and hardcoded-text detection over a source unit
#pragma once
#include "glot/config.hpp"
#include "glot/directives.hpp"
#include "glot/finding.hpp"
#include "glot/source.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace glot {

struct static_key { std::string key; };
struct template_key { std::vector<std::string> quasis; };  // one placeholder between each pair
struct opaque_key {};
struct choice_key { std::vector<std::string> keys; };      // every key the argument can evaluate to

using KeyExpression = std::variant<static_key, template_key, opaque_key, choice_key>;

struct NamespaceRef {
    enum class state { none, known, unknown };
    state st = state::none;
    std::string name;

    bool operator==(const NamespaceRef& o) const { return st == o.st && name == o.name; }
};

// Effective key path under a namespace.
std::string qualify_key(const NamespaceRef& ns, const std::string& key);

// Glob for a template key: placeholders become `*` and the namespace is prefixed.
// Empty when the result would match too broadly to be useful.
std::string infer_key_pattern(const template_key& key, const NamespaceRef& ns);

struct TranslationCall {
    span where;                    // callee through closing parenthesis
    int anchor_line = 0;           // the template line a directive must sit above, when `where` is inside one
    std::string callee;            // `t`, `t.rich`, ...
    std::string method;            // raw / rich / markup, or empty
    std::vector<NamespaceRef> namespaces;   // several when a forwarded translator arrives from more than one site
    KeyExpression key;
    std::string argument;          // source text of the key argument
    bool jsx_comment = false;
    std::optional<std::vector<std::string>> annotated;
};

struct ResolvedKey {
    std::string key;
    KeyUsage usage;
    bool glob = false;             // annotation pattern, expanded against the primary table later
    bool raw = false;              // `t.raw(...)`: may name an object or array subtree
};

struct FileKeys {
    std::vector<TranslationCall> calls;
    std::vector<Finding> findings;   // hardcoded and unresolved-key; suppression not yet applied
    std::vector<ResolvedKey> used;
};

class KeyResolver {
public:
    KeyResolver(const Config& cfg, const source_unit& unit, DirectiveState& directives)
        : cfg_(cfg), unit_(unit), directives_(directives), lines_(unit.text) {}

    // Walks the tree until forwarded translators are stable, then pairs annotations with dynamic calls.
    FileKeys run();

private:
    struct Binding {
        // shadow: hides an outer binding. value: constant strings. list: array of strings.
        // object: `{ name: "x" }`. records: array of objects. record: one element of records.
        enum class kind { translator, shadow, value, list, object, records, record };
        std::string name;
        span site;
        kind k = kind::shadow;
        bool param = false;                    // bound by an array callback
        bool partial = false;                  // object with members that are not literals
        std::vector<NamespaceRef> namespaces;  // translator
        std::vector<std::string> values;       // value, list
        std::map<std::string, std::vector<std::string>> props;
    };
    using Scope = std::vector<Binding>;
    using Values = std::optional<std::vector<std::string>>;

    const Config& cfg_;
    const source_unit& unit_;
    DirectiveState& directives_;
    line_index lines_;
    std::vector<Scope> scopes_;
    std::map<int, bool> line_jsx_;
    std::vector<std::pair<std::size_t, std::size_t>> template_text_;
    // "Comp.prop" and "fn#index" to the namespaces of the translators passed there
    std::map<std::string, std::vector<NamespaceRef>> forwarded_;
    bool collecting_ = false;
    FileKeys out_;

    const Binding* lookup(const std::string& name) const;
    void bind(Binding b){ scopes_.back().push_back(std::move(b)); }

    void walk_file();
    void bind_module_constants();
    void walk_items(const std::vector<syntax_ptr>& items);
    void walk_block(const std::vector<syntax_ptr>& items, std::size_t i);
    bool walk_iteration(const std::vector<syntax_ptr>& items, std::size_t i);
    void walk_element(const jsx_element& el);
    void declaration_at(const std::vector<syntax_ptr>& items, std::size_t i);
    std::optional<Binding> constant_at(const std::vector<syntax_ptr>& items, std::size_t i) const;
    std::optional<Binding> bind_constant(const std::string& name, std::vector<syntax_ptr> init) const;
    void call_at(const std::vector<syntax_ptr>& items, std::size_t i);
    void forward(const std::string& site, const syntax_ptr& arg_word);
    NamespaceRef namespace_from_args(const group& args) const;
    KeyExpression classify(const std::vector<syntax_ptr>& arg) const;
    Values values_of(std::vector<syntax_ptr> items, int depth = 0) const;
    std::map<std::string, Values> members_of(const group& g, int depth) const;

    void check_expr(const std::vector<syntax_ptr>& items);
    void report_text(const std::string& raw, std::size_t offset);
    bool is_ignored_text(const std::string& text) const;
    bool is_checked_attribute(const std::string& name) const;

    bool starts_line(const position& p) const;
    void record_line(const syntax_node& node, bool jsx_children);
    void record_text_lines(const syntax_node& node, const std::string& raw);
    bool line_uses_jsx_comment(int line) const;
    int directive_line_for(int line) const;

    void resolve_calls();
    void use_key(std::string key, const TranslationCall& call, bool glob);
};

} // namespace glot
