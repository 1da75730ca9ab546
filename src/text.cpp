#include "glot/text.hpp"
#include <unicode/uchar.h>
#include <unicode/utf8.h>
#include <cstdint>

namespace glot {

bool has_alphabetic(std::string_view utf8){
    const char* s = utf8.data();
    const int32_t len = static_cast<int32_t>(utf8.size());
    int32_t i = 0;
    while(i < len){
        UChar32 c;
        U8_NEXT(s, i, len, c);
        if(c >= 0 && u_isUAlphabetic(c)) return true;
    }
    return false;
}

std::string_view trim(std::string_view s){
    auto ws = [](char c){ return c==' ' || c=='\t' || c=='\n' || c=='\r' || c=='\f' || c=='\v'; };
    std::size_t b = 0, e = s.size();
    while(b < e && ws(s[b])) ++b;
    while(e > b && ws(s[e-1])) --e;
    return s.substr(b, e-b);
}

std::vector<std::string> split(std::string_view s, char sep){
    std::vector<std::string> out;
    std::size_t start = 0;
    for(std::size_t i=0;i<=s.size();++i){
        if(i == s.size() || s[i] == sep){ out.emplace_back(s.substr(start, i-start)); start = i+1; }
    }
    return out;
}

bool starts_with(std::string_view s, std::string_view prefix){
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

std::string_view indentation_of(std::string_view line){
    std::size_t n = 0;
    while(n < line.size() && (line[n]==' ' || line[n]=='\t')) ++n;
    return line.substr(0, n);
}

// `*` and `?` within one segment, iterative with single backtrack point.
static bool segment_match(std::string_view pat, std::string_view s){
    std::size_t p = 0, i = 0, star = std::string_view::npos, mark = 0;
    while(i < s.size()){
        if(p < pat.size() && (pat[p] == '?' || pat[p] == s[i])){ ++p; ++i; }
        else if(p < pat.size() && pat[p] == '*'){ star = p++; mark = i; }
        else if(star != std::string_view::npos){ p = star + 1; i = ++mark; }
        else return false;
    }
    while(p < pat.size() && pat[p] == '*') ++p;
    return p == pat.size();
}

static bool segments_match(const std::vector<std::string>& pat, std::size_t pi,
                           const std::vector<std::string>& path, std::size_t si){
    if(pi == pat.size()) return si == path.size();
    if(pat[pi] == "**"){
        for(std::size_t k = si; k <= path.size(); ++k)
            if(segments_match(pat, pi+1, path, k)) return true;
        return false;
    }
    if(si == path.size()) return false;
    return segment_match(pat[pi], path[si]) && segments_match(pat, pi+1, path, si+1);
}

static std::string normalize_path(std::string_view p){
    std::string s(p);
    for(char& c : s) if(c == '\\') c = '/';
    while(starts_with(s, "./")) s.erase(0, 2);
    return s;
}

bool path_glob_match(std::string_view pattern, std::string_view path){
    std::string pat = normalize_path(pattern);
    std::string p = normalize_path(path);
    if(pat.find('/') == std::string::npos){
        auto slash = p.rfind('/');
        std::string base = slash == std::string::npos ? p : p.substr(slash+1);
        return segment_match(pat, base);
    }
    return segments_match(split(pat, '/'), 0, split(p, '/'), 0);
}

bool key_glob_match(std::string_view pattern, std::string_view key){
    auto ps = split(pattern, '.');
    auto ks = split(key, '.');
    if(ps.size() != ks.size()) return false;
    for(std::size_t i=0;i<ps.size();++i){
        if(ps[i].find('*') == std::string::npos){ if(ps[i] != ks[i]) return false; }
        else if(!segment_match(ps[i], ks[i])) return false;
    }
    return true;
}

} // namespace glot
