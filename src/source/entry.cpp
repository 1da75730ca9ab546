#include "glot/source.hpp"
#include "glot/config.hpp"
#include "prelude.hpp"
#include "grammar.hpp"
#include "actions.hpp"
#include <tao/pegtl.hpp>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace glot {

line_index::line_index(std::string_view text): text_(text) {
    starts_.push_back(0);
    for(std::size_t i=0;i<text.size();++i) if(text[i]=='\n') starts_.push_back(i+1);
}

position line_index::at(std::size_t offset) const {
    if(offset > text_.size()) offset = text_.size();
    auto it = std::upper_bound(starts_.begin(), starts_.end(), offset);
    std::size_t line = static_cast<std::size_t>(it - starts_.begin()); // 1-based
    std::size_t start = starts_[line-1];
    int col = 1;
    for(std::size_t i=start;i<offset;++i){
        if((static_cast<unsigned char>(text_[i]) & 0xC0) != 0x80) ++col;
    }
    return position{ static_cast<int>(line), col, offset };
}

std::size_t line_index::line_start(int line) const {
    if(line < 1) return 0;
    if(line > line_count()) return text_.size();
    return starts_[static_cast<std::size_t>(line-1)];
}

std::size_t line_index::line_end(int line) const {
    if(line < 1) return 0;
    if(line >= line_count()) return text_.size();
    std::size_t e = starts_[static_cast<std::size_t>(line)] - 1;
    if(e > 0 && text_[e-1]=='\r') --e;
    return e;
}

std::string_view line_index::line_text(int line) const {
    std::size_t b = line_start(line), e = line_end(line);
    return text_.substr(b, e > b ? e - b : 0);
}

bool jsx_enabled_for(std::string_view path){
    auto ends_with = [&](std::string_view suf){ return path.size()>=suf.size() && path.substr(path.size()-suf.size())==suf; };
    return !(ends_with(".ts") || ends_with(".mts") || ends_with(".cts"));
}

namespace source_front {

static void append_utf8(std::string& out, unsigned long cp){
    if(cp < 0x80) out += static_cast<char>(cp);
    else if(cp < 0x800){ out += static_cast<char>(0xC0 | (cp>>6)); out += static_cast<char>(0x80 | (cp & 0x3F)); }
    else if(cp < 0x10000){ out += static_cast<char>(0xE0 | (cp>>12)); out += static_cast<char>(0x80 | ((cp>>6) & 0x3F)); out += static_cast<char>(0x80 | (cp & 0x3F)); }
    else { out += static_cast<char>(0xF0 | (cp>>18)); out += static_cast<char>(0x80 | ((cp>>12) & 0x3F)); out += static_cast<char>(0x80 | ((cp>>6) & 0x3F)); out += static_cast<char>(0x80 | (cp & 0x3F)); }
}

std::string unescape_js(std::string_view body){
    std::string out; out.reserve(body.size());
    for(std::size_t i=0;i<body.size();++i){
        char c = body[i];
        if(c != '\\' || i+1 >= body.size()){ out += c; continue; }
        char n = body[++i];
        switch(n){
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case 'r': out += '\r'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'v': out += '\v'; break;
            case '0': out += '\0'; break;
            case '\n': break; // line continuation
            case 'u': {
                std::string hex;
                if(i+1 < body.size() && body[i+1]=='{'){
                    std::size_t close = body.find('}', i+2);
                    if(close == std::string_view::npos){ out += "\\u"; break; }
                    hex = std::string(body.substr(i+2, close-(i+2))); i = close;
                } else if(i+4 < body.size()){
                    hex = std::string(body.substr(i+1, 4)); i += 4;
                } else { out += "\\u"; break; }
                append_utf8(out, std::strtoul(hex.c_str(), nullptr, 16));
                break;
            }
            default: out += n; break;
        }
    }
    return out;
}

} // namespace source_front

source_unit parse_source(std::string path, std::string text){
    source_unit u;
    u.path = std::move(path);
    u.text = std::move(text);
    source_front::build_state st(u.text, jsx_enabled_for(u.path));
    tao::pegtl::memory_input in(u.text, u.path);
    try {
        tao::pegtl::parse< source_front::grammar::unit, source_front::actions::action, source_front::grammar::control >(in, st);
        u.root = std::move(st.root);
        u.comments = std::move(st.comments);
    } catch (const tao::pegtl::parse_error& e) {
        auto p = e.positions().front();
        std::string msg = e.what();
        std::string prefix = tao::pegtl::to_string(p) + ": ";
        if(msg.compare(0, prefix.size(), prefix) == 0) msg = msg.substr(prefix.size());
        auto at = st.lines.at(p.byte);
        u.failure = parse_failure{ span{at, at}, msg };
        if(debug_enabled()) std::fprintf(stderr, "[glot:parse] %s:%d:%d %s\n", u.path.c_str(), at.line, at.col, msg.c_str());
    }
    return u;
}

} // namespace glot
