#pragma once
#include "glot/json_doc.hpp"
#include "grammar.hpp"
#include <tao/pegtl.hpp>
#include <optional>
#include <string>
#include <vector>

namespace glot::json_front {

struct build_state {
    std::vector<json_value> stack;     // open objects and arrays
    std::vector<json_member> pending;  // members whose value is being parsed
    std::optional<json_value> root;

    void emit(json_value v){
        if(stack.empty()){ root = std::move(v); return; }
        auto &top = stack.back();
        if(top.type == json_value::kind::object){
            json_member m = std::move(pending.back());
            pending.pop_back();
            m.value = std::move(v);
            top.members.push_back(std::move(m));
        } else {
            top.elements.push_back(std::move(v));
        }
    }
};

std::string decode_string(const std::string& quoted);

namespace actions {
using namespace tao::pegtl;

template<typename Rule>
struct action : nothing<Rule> {};

template<typename Input>
inline json_value scalar(const Input& in, json_value::kind k, std::string text){
    json_value v; v.type = k; v.begin = in.position().byte; v.end = v.begin + in.size(); v.text = std::move(text);
    return v;
}

template<> struct action< grammar::json::string > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.emit(scalar(in, json_value::kind::string, decode_string(in.string())));
    }
};
template<> struct action< grammar::json::number > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.emit(scalar(in, json_value::kind::number, in.string())); }
};
template<> struct action< grammar::json::true_ > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.emit(scalar(in, json_value::kind::boolean, in.string())); }
};
template<> struct action< grammar::json::false_ > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.emit(scalar(in, json_value::kind::boolean, in.string())); }
};
template<> struct action< grammar::json::null > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.emit(scalar(in, json_value::kind::null, in.string())); }
};

template<> struct action< grammar::json::key > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        json_member m;
        m.key = decode_string(in.string());
        m.begin = in.position().byte;
        m.key_end = m.begin + in.size();
        st.pending.push_back(std::move(m));
    }
};

template<> struct action< grammar::json::begin_object > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        // `in` also spans the whitespace after the brace
        json_value v; v.type = json_value::kind::object; v.begin = in.position().byte;
        st.stack.push_back(std::move(v));
    }
};
template<> struct action< grammar::json::begin_array > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        json_value v; v.type = json_value::kind::array; v.begin = in.position().byte;
        st.stack.push_back(std::move(v));
    }
};

template<typename Input>
inline void close_container(const Input& in, build_state& st){
    json_value v = std::move(st.stack.back());
    st.stack.pop_back();
    v.end = in.position().byte + in.size();
    st.emit(std::move(v));
}

template<> struct action< grammar::json::end_object > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ close_container(in, st); }
};
template<> struct action< grammar::json::end_array > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ close_container(in, st); }
};

} // namespace actions
} // namespace glot::json_front
