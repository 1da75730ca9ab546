#pragma once
#include "glot/source.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace glot::source_front {

// Tree-building state shared by the grammar's custom rules and the actions.
struct build_state {
    struct frame {
        syntax_ptr node;
        std::vector<syntax_ptr> scratch; // attribute value under construction
        bool expects_operand{true};
        bool children{false};            // jsx_element: attrs done, collecting children
        std::string quasi;               // template_lit: current static segment
        std::size_t quasi_begin{0};
    };

    build_state(std::string_view text, bool jsx): lines(text), jsx(jsx) {}

    line_index lines;
    bool jsx{true};
    std::vector<syntax_ptr> root;
    bool root_expects_operand{true};
    std::vector<frame> frames;
    std::vector<comment_token> comments;

    syntax_ptr make(syntax_data d, std::size_t b, std::size_t e) const {
        return std::make_shared<syntax_node>(syntax_node{std::move(d), lines.range(b, e)});
    }

    std::vector<syntax_ptr>& sink(){
        if(frames.empty()) return root;
        auto &f = frames.back();
        auto &d = f.node->data;
        if(auto g = std::get_if<group>(&d)) return g->items;
        if(auto x = std::get_if<jsx_expr>(&d)) return x->items;
        if(auto el = std::get_if<jsx_element>(&d)) return f.children ? el->children : el->attrs;
        if(auto t = std::get_if<template_lit>(&d)) return t->exprs.back();
        return f.scratch;
    }

    bool& operand_flag(){ return frames.empty() ? root_expects_operand : frames.back().expects_operand; }
    bool expects_operand(){ return operand_flag(); }

    void add(syntax_ptr n, bool operand_next){
        sink().push_back(std::move(n));
        operand_flag() = operand_next;
    }
    void add_neutral(syntax_ptr n){ sink().push_back(std::move(n)); }

    void push(syntax_data d, std::size_t begin){
        frame f; f.node = make(std::move(d), begin, begin);
        frames.push_back(std::move(f));
    }
    frame pop(std::size_t end){
        frame f = std::move(frames.back());
        frames.pop_back();
        f.node->where.end = lines.at(end);
        return f;
    }
};

inline bool keyword_expects_operand(std::string_view w){
    static const char* const kws[] = {"return","typeof","case","default","yield","await","else","do",
                                      "in","of","new","void","delete","throw","instanceof","extends"};
    for(const char* k : kws) if(w == k) return true;
    return false;
}

inline bool punct_expects_operand(std::string_view p){
    return !(p == "++" || p == "--");
}

std::string unescape_js(std::string_view body);

} // namespace glot::source_front
