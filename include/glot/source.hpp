// Token-tree syntax model for JS/TS/JSX component sources
#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace glot {

// 1-based line and column (columns count code points), plus the byte offset.
struct position { int line=1; int col=1; std::size_t offset=0; };
struct span { position begin; position end; };

// Maps byte offsets to positions. The text must outlive the index.
class line_index {
public:
    explicit line_index(std::string_view text);
    position at(std::size_t offset) const;
    std::size_t line_start(int line) const;
    std::size_t line_end(int line) const; // offset of the line terminator (or end of text)
    std::string_view line_text(int line) const;
    int line_count() const { return static_cast<int>(starts_.size()); }
    span range(std::size_t begin, std::size_t end) const { return span{at(begin), at(end)}; }
private:
    std::string_view text_;
    std::vector<std::size_t> starts_;
};

struct syntax_node;
using syntax_ptr = std::shared_ptr<syntax_node>;

struct word { std::string text; };
struct punct { std::string text; };
struct string_lit { std::string value; char quote='"'; };
// quasis.size() == exprs.size() + 1
struct template_lit {
    std::vector<std::string> quasis;
    std::vector<span> quasi_spans;
    std::vector<std::vector<syntax_ptr>> exprs;
};
struct group { char open='('; std::vector<syntax_ptr> items; };
struct comment { std::string text; bool block=false; };
struct regex_lit { std::string text; };
struct jsx_attr { std::string name; span name_span; syntax_ptr value; }; // value: string_lit, jsx_expr, jsx_element or null
// A fragment has an empty name. attrs holds jsx_attr, spread jsx_expr and comment nodes.
struct jsx_element {
    std::string name;
    std::vector<syntax_ptr> attrs;
    std::vector<syntax_ptr> children;
    bool self_closing=false;
};
struct jsx_text { std::string raw; };
struct jsx_expr { std::vector<syntax_ptr> items; };

using syntax_data = std::variant<word, punct, string_lit, template_lit, group, comment, regex_lit,
                                 jsx_element, jsx_attr, jsx_text, jsx_expr>;

struct syntax_node {
    syntax_data data;
    span where;
};

template<typename T>
inline const T* node_as(const syntax_ptr& n){ return n ? std::get_if<T>(&n->data) : nullptr; }

inline bool is_word(const syntax_ptr& n, std::string_view w){ auto p = node_as<word>(n); return p && p->text == w; }
inline bool is_punct(const syntax_ptr& n, std::string_view t){ auto p = node_as<punct>(n); return p && p->text == t; }
inline bool is_group(const syntax_ptr& n, char open){ auto g = node_as<group>(n); return g && g->open == open; }

// Comment tokens in source order, kept beside the tree for directive tracking.
struct comment_token { std::string text; bool block=false; span where; };

struct parse_failure { span where; std::string message; };

struct source_unit {
    std::string path;
    std::string text;
    std::vector<syntax_ptr> root;
    std::vector<comment_token> comments;
    std::optional<parse_failure> failure;
    bool ok() const { return !failure.has_value(); }
};

// JSX is recognised unless the path ends in ".ts" / ".mts" / ".cts".
bool jsx_enabled_for(std::string_view path);

// Parse file text into a token tree. Never throws for malformed input; the failure is recorded.
source_unit parse_source(std::string path, std::string text);

} // namespace glot
