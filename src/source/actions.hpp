#pragma once
#include "prelude.hpp"
#include "grammar.hpp"
#include <tao/pegtl.hpp>
#include <cctype>
#include <string>

namespace glot::source_front::actions {
using namespace tao::pegtl;
using glot::source_front::build_state;

template<typename Rule>
struct action : nothing<Rule> {};

template<typename Input>
inline std::size_t begin_of(const Input& in){ return in.position().byte; }
template<typename Input>
inline std::size_t end_of(const Input& in){ return in.position().byte + in.size(); }

template<> struct action< grammar::line_comment > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        std::string s = in.string();
        comment c{ s.substr(2), false };
        auto n = st.make(c, begin_of(in), end_of(in));
        st.comments.push_back(comment_token{ c.text, false, n->where });
        st.add_neutral(std::move(n));
    }
};

template<> struct action< grammar::block_comment > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        std::string s = in.string();
        comment c{ s.substr(2, s.size() - 4), true };
        auto n = st.make(c, begin_of(in), end_of(in));
        st.comments.push_back(comment_token{ c.text, true, n->where });
        st.add_neutral(std::move(n));
    }
};

template<> struct action< grammar::word > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        std::string w = in.string();
        bool operand = keyword_expects_operand(w);
        st.add(st.make(word{ std::move(w) }, begin_of(in), end_of(in)), operand);
    }
};

template<> struct action< grammar::punct > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        std::string p = in.string();
        bool operand = punct_expects_operand(p);
        st.add(st.make(punct{ std::move(p) }, begin_of(in), end_of(in)), operand);
    }
};

template<typename Input>
inline void add_string(const Input& in, build_state& st, bool js_escapes){
    std::string s = in.string();
    char q = s.front();
    std::string body = s.substr(1, s.size() - 2);
    string_lit lit{ js_escapes ? unescape_js(body) : body, q };
    st.add(st.make(std::move(lit), begin_of(in), end_of(in)), false);
}

template<> struct action< grammar::sq_string > {
    template<typename Input> static void apply(const Input& in, build_state& st){ add_string(in, st, true); }
};
template<> struct action< grammar::dq_string > {
    template<typename Input> static void apply(const Input& in, build_state& st){ add_string(in, st, true); }
};
template<> struct action< grammar::jsx_dq_string > {
    template<typename Input> static void apply(const Input& in, build_state& st){ add_string(in, st, false); }
};
template<> struct action< grammar::jsx_sq_string > {
    template<typename Input> static void apply(const Input& in, build_state& st){ add_string(in, st, false); }
};

template<> struct action< grammar::regex_lit > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.add(st.make(regex_lit{ in.string() }, begin_of(in), end_of(in)), false);
    }
};

// Template literals: static segments accumulate on the frame, substitutions open a new expression list.
inline void finish_quasi(build_state& st, std::size_t end){
    auto &f = st.frames.back();
    auto &t = std::get<template_lit>(f.node->data);
    t.quasis.push_back(std::move(f.quasi));
    t.quasi_spans.push_back(st.lines.range(f.quasi_begin, end));
    f.quasi.clear();
}

template<> struct action< grammar::template_open > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.push(template_lit{}, begin_of(in));
        st.frames.back().quasi_begin = end_of(in);
    }
};
template<> struct action< grammar::template_chars > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.frames.back().quasi += in.string(); }
};
template<> struct action< grammar::subst_open > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        finish_quasi(st, begin_of(in));
        std::get<template_lit>(st.frames.back().node->data).exprs.emplace_back();
        st.frames.back().expects_operand = true;
    }
};
template<> struct action< grammar::subst_close > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.frames.back().quasi_begin = end_of(in); }
};
template<> struct action< grammar::template_close > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        finish_quasi(st, begin_of(in));
        auto f = st.pop(end_of(in));
        st.add(std::move(f.node), false);
    }
};

template<char O> struct action< grammar::group_open<O> > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.push(group{ O, {} }, begin_of(in)); }
};
template<char C> struct action< grammar::group_close<C> > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        auto f = st.pop(end_of(in));
        st.add(std::move(f.node), C == '}');
    }
};

template<> struct action< grammar::jsx_expr_open > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.push(jsx_expr{}, begin_of(in)); }
};
template<> struct action< grammar::jsx_expr_close > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        auto f = st.pop(end_of(in));
        st.add_neutral(std::move(f.node));
    }
};

// Element frames open at the name (or at the `>` of a fragment); the `<` sits one byte before.
template<> struct action< grammar::jsx_tag_name > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        jsx_element el; el.name = in.string();
        st.push(std::move(el), begin_of(in) - 1);
    }
};
template<> struct action< grammar::jsx_fragment_mark > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.push(jsx_element{}, begin_of(in) - 1);
        st.frames.back().children = true;
    }
};
template<> struct action< grammar::jsx_open_end > {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.frames.back().children = true; }
};
template<> struct action< grammar::jsx_self_close > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        auto f = st.pop(end_of(in));
        std::get<jsx_element>(f.node->data).self_closing = true;
        st.add(std::move(f.node), false);
    }
};
template<> struct action< grammar::jsx_closing > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        std::string s = in.string();
        std::string name;
        for(char c : s){ if(c=='<' || c=='/' || c=='>' || std::isspace(static_cast<unsigned char>(c))) continue; name += c; }
        const auto &open = std::get<jsx_element>(st.frames.back().node->data);
        if(name != open.name){
            std::string expected = open.name.empty() ? std::string("</>") : "</" + open.name + ">";
            throw tao::pegtl::parse_error("mismatched closing tag, expected " + expected, in);
        }
        auto f = st.pop(end_of(in));
        st.add(std::move(f.node), false);
    }
};

template<> struct action< grammar::jsx_attr_name > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        jsx_attr a; a.name = in.string(); a.name_span = st.lines.range(begin_of(in), end_of(in));
        st.push(std::move(a), begin_of(in));
    }
};
template<> struct action< grammar::jsx_attr > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        auto f = st.pop(end_of(in));
        auto &a = std::get<jsx_attr>(f.node->data);
        if(!f.scratch.empty()) a.value = f.scratch.front();
        st.add_neutral(std::move(f.node));
    }
};

template<> struct action< grammar::jsx_text > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.add_neutral(st.make(jsx_text{ in.string() }, begin_of(in), end_of(in)));
    }
};

} // namespace glot::source_front::actions
