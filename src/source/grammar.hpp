#pragma once
#include "prelude.hpp"
#include <tao/pegtl.hpp>
#include <string>

namespace glot::source_front::grammar {
using namespace tao::pegtl;

// Succeeds without consuming when the previous significant token leaves an operand expected.
struct at_operand {
    using rule_t = at_operand;
    using subs_t = empty_list;
    template<apply_mode, rewind_mode, template<typename...> class Action, template<typename...> class Control,
             typename ParseInput, typename... States>
    static bool match(ParseInput&, build_state& st, States&...){ return st.expects_operand(); }
};

struct jsx_allowed {
    using rule_t = jsx_allowed;
    using subs_t = empty_list;
    template<apply_mode, rewind_mode, template<typename...> class Action, template<typename...> class Control,
             typename ParseInput, typename... States>
    static bool match(ParseInput&, build_state& st, States&...){ return st.jsx; }
};

struct blank : plus< space > {};

// Comments
struct line_comment : seq< two<'/'>, until< at< eolf > > > {};
struct block_comment_body : until< string<'*','/'> > {};
struct block_comment : if_must< string<'/','*'>, block_comment_body > {};
struct comment : sor< line_comment, block_comment > {};

// Identifiers, numbers and keywords are all words
struct ident_first : sor< ranges<'a','z','A','Z','_','_','$','$'>, utf8::range<0x80, 0x10FFFF> > {};
struct ident_rest : sor< ranges<'a','z','A','Z','0','9','_','_','$','$'>, utf8::range<0x80, 0x10FFFF> > {};
struct word : plus< ident_rest > {};

// String literals
struct escape_seq : seq< one<'\\'>, any > {};
template<char Q> struct string_body : until< one<Q>, sor< escape_seq, not_one<'\r','\n'> > > {};
struct sq_string : if_must< one<'\''>, string_body<'\''> > {};
struct dq_string : if_must< one<'"'>, string_body<'"'> > {};
struct string_lit : sor< sq_string, dq_string > {};

struct item;

// Template literals
struct template_open : one<'`'> {};
struct template_close : one<'`'> {};
struct template_chars : plus< sor< escape_seq, seq< one<'$'>, not_at< one<'{'> > >, not_one<'`','\\','$'> > > {};
struct subst_open : string<'$','{'> {};
struct subst_close : one<'}'> {};
struct subst_body : until< subst_close, sor< blank, item > > {};
struct substitution : if_must< subst_open, subst_body > {};
struct template_body : until< template_close, sor< substitution, template_chars > > {};
struct template_lit : if_must< template_open, template_body > {};

// Regular expression literals, only where an operand is expected
struct regex_class_body : until< one<']'>, sor< escape_seq, not_one<'\r','\n'> > > {};
struct regex_class : if_must< one<'['>, regex_class_body > {};
struct regex_start : seq< at_operand, one<'/'>, not_at< one<'/','*'> > > {};
struct regex_body : until< one<'/'>, sor< escape_seq, regex_class, not_one<'\r','\n'> > > {};
struct regex_lit : if_must< regex_start, regex_body, star< ident_rest > > {};

// Balanced groups
template<char O> struct group_open : one<O> {};
template<char C> struct group_close : one<C> {};
template<char C> struct group_body : until< group_close<C>, sor< blank, item > > {};
struct paren_group : if_must< group_open<'('>, group_body<')'> > {};
struct bracket_group : if_must< group_open<'['>, group_body<']'> > {};
struct brace_group : if_must< group_open<'{'>, group_body<'}'> > {};

struct punct : sor<
    string<'.','.','.'>, string<'=','=','='>, string<'!','=','='>, string<'*','*','='>,
    string<'?','?','='>, string<'&','&','='>, string<'|','|','='>, string<'>','>','>'>,
    string<'=','>'>, string<'=','='>, string<'!','='>, string<'<','='>, string<'>','='>,
    string<'&','&'>, string<'|','|'>, string<'?','?'>, string<'?','.'>, string<'+','+'>,
    string<'-','-'>, string<'+','='>, string<'-','='>, string<'*','='>, string<'/','='>,
    string<'*','*'>,
    not_one<'(',')','[',']','{','}','"','\'','`'> > {};

// JSX
struct jsx_name : seq< ident_first, star< sor< ident_rest, one<'-','.',':'> > > > {};
// `<T,>` and `<T extends U>` open generic arrow functions, not elements
struct jsx_generic_guard : seq< jsx_name, star< blank >, sor< one<','>, seq< string<'e','x','t','e','n','d','s'>, blank > > > {};
struct jsx_start : seq< jsx_allowed, at_operand, one<'<'>, not_at< jsx_generic_guard >, at< sor< one<'>'>, ident_first > > > {};
struct jsx_child_start : seq< one<'<'>, at< sor< one<'>'>, ident_first > > > {};

struct jsx_tag_name : jsx_name {};
struct jsx_fragment_mark : one<'>'> {};
struct jsx_attr_name : jsx_name {};

struct jsx_string_dq_body : until< one<'"'> > {};
struct jsx_string_sq_body : until< one<'\''> > {};
struct jsx_dq_string : if_must< one<'"'>, jsx_string_dq_body > {};
struct jsx_sq_string : if_must< one<'\''>, jsx_string_sq_body > {};

struct jsx_expr_open : one<'{'> {};
struct jsx_expr_close : one<'}'> {};
struct jsx_expr_body : until< jsx_expr_close, sor< blank, item > > {};
struct jsx_expr : if_must< jsx_expr_open, jsx_expr_body > {};

struct jsx_child_element;
struct jsx_attr_value : sor< jsx_dq_string, jsx_sq_string, jsx_expr, jsx_child_element > {};
struct jsx_attr : seq< jsx_attr_name, opt< star< blank >, one<'='>, star< blank >, must< jsx_attr_value > > > {};
struct jsx_attrs : star< sor< blank, comment, jsx_attr, jsx_expr > > {};

struct jsx_self_close : string<'/','>'> {};
struct jsx_open_end : one<'>'> {};
struct jsx_closing : seq< one<'<'>, star< blank >, one<'/'>, star< blank >, opt< jsx_name >, star< blank >, one<'>'> > {};
struct jsx_text : plus< not_one<'<','{'> > {};
struct jsx_children : until< jsx_closing, sor< jsx_expr, jsx_child_element, jsx_text > > {};
struct jsx_element_tail : sor< jsx_self_close, seq< jsx_open_end, jsx_children > > {};
struct jsx_after_lt : sor< seq< jsx_fragment_mark, jsx_children >,
                           seq< jsx_tag_name, jsx_attrs, must< jsx_element_tail > > > {};
struct jsx_child_element : if_must< jsx_child_start, jsx_after_lt > {};
struct jsx_element : if_must< jsx_start, jsx_after_lt > {};

struct item : sor< comment, string_lit, template_lit, jsx_element, regex_lit,
                   paren_group, bracket_group, brace_group, word, punct > {};

struct shebang : seq< string<'#','!'>, until< at< eolf > > > {};
struct unit_body : until< eof, sor< blank, item > > {};
struct unit : seq< opt< utf8::bom >, opt< shebang >, must< unit_body > > {};

// Messages reported when a committed rule fails.
template<typename Rule> inline constexpr const char* error_message = "unexpected input";
template<> inline constexpr const char* error_message<block_comment_body> = "unterminated block comment";
template<> inline constexpr const char* error_message<string_body<'\''>> = "unterminated string literal";
template<> inline constexpr const char* error_message<string_body<'"'>> = "unterminated string literal";
template<> inline constexpr const char* error_message<template_body> = "unterminated template literal";
template<> inline constexpr const char* error_message<subst_body> = "unterminated template substitution";
template<> inline constexpr const char* error_message<regex_body> = "unterminated regular expression";
template<> inline constexpr const char* error_message<regex_class_body> = "unterminated regular expression class";
template<> inline constexpr const char* error_message<group_body<')'>> = "expected ')'";
template<> inline constexpr const char* error_message<group_body<']'>> = "expected ']'";
template<> inline constexpr const char* error_message<group_body<'}'>> = "expected '}'";
template<> inline constexpr const char* error_message<jsx_expr_body> = "expected '}' to close JSX expression";
template<> inline constexpr const char* error_message<jsx_string_dq_body> = "unterminated JSX attribute string";
template<> inline constexpr const char* error_message<jsx_string_sq_body> = "unterminated JSX attribute string";
template<> inline constexpr const char* error_message<jsx_attr_value> = "expected JSX attribute value";
template<> inline constexpr const char* error_message<jsx_element_tail> = "expected '>' or '/>' to end JSX tag";
template<> inline constexpr const char* error_message<jsx_after_lt> = "malformed JSX element";
template<> inline constexpr const char* error_message<jsx_children> = "unterminated JSX element";
template<> inline constexpr const char* error_message<unit_body> = "unexpected closing bracket";

template<typename Rule>
struct control : normal<Rule> {
    template<typename ParseInput, typename... States>
    [[noreturn]] static void raise(const ParseInput& in, States&&...){
        throw tao::pegtl::parse_error(std::string(error_message<Rule>), in);
    }
};

} // namespace glot::source_front::grammar
