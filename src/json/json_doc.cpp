#include "glot/json_doc.hpp"
#include "glot/text.hpp"
#include "grammar.hpp"
#include "actions.hpp"
#include <tao/pegtl.hpp>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace glot {

namespace json_front {

static void append_utf8(std::string& out, unsigned long cp){
    if(cp < 0x80) out += static_cast<char>(cp);
    else if(cp < 0x800){ out += static_cast<char>(0xC0 | (cp>>6)); out += static_cast<char>(0x80 | (cp & 0x3F)); }
    else if(cp < 0x10000){ out += static_cast<char>(0xE0 | (cp>>12)); out += static_cast<char>(0x80 | ((cp>>6) & 0x3F)); out += static_cast<char>(0x80 | (cp & 0x3F)); }
    else { out += static_cast<char>(0xF0 | (cp>>18)); out += static_cast<char>(0x80 | ((cp>>12) & 0x3F)); out += static_cast<char>(0x80 | ((cp>>6) & 0x3F)); out += static_cast<char>(0x80 | (cp & 0x3F)); }
}

std::string decode_string(const std::string& quoted){
    std::string out;
    std::size_t n = quoted.size() >= 2 ? quoted.size() - 1 : quoted.size();
    for(std::size_t i=1;i<n;++i){
        char c = quoted[i];
        if(c != '\\'){ out += c; continue; }
        char e = quoted[++i];
        switch(e){
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'u': {
                unsigned long cp = std::strtoul(quoted.substr(i+1, 4).c_str(), nullptr, 16);
                i += 4;
                // surrogate pair
                if(cp >= 0xD800 && cp <= 0xDBFF && i+6 < n && quoted[i+1]=='\\' && quoted[i+2]=='u'){
                    unsigned long lo = std::strtoul(quoted.substr(i+3, 4).c_str(), nullptr, 16);
                    if(lo >= 0xDC00 && lo <= 0xDFFF){ cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00); i += 6; }
                }
                // an unpaired surrogate has no UTF-8 encoding
                if(cp >= 0xD800 && cp <= 0xDFFF) cp = 0xFFFD;
                append_utf8(out, cp);
                break;
            }
            default: out += e; break;
        }
    }
    return out;
}

} // namespace json_front

json_document::json_document(std::string text, json_value root)
    : text_(std::move(text)), root_(std::move(root)), lines_(text_) {}

json_document::json_document(const json_document& o)
    : text_(o.text_), root_(o.root_), lines_(text_) {}

json_document::json_document(json_document&& o)
    : text_(std::move(o.text_)), root_(std::move(o.root_)), lines_(text_) {}

json_document json_document::parse(std::string text, std::string source){
    json_front::build_state st;
    {
        tao::pegtl::memory_input in(text, source);
        try {
            tao::pegtl::parse< json_front::grammar::document, json_front::actions::action, json_front::grammar::control >(in, st);
        } catch (const tao::pegtl::parse_error& e) {
            auto p = e.positions().front();
            std::string msg = e.what();
            std::string prefix = tao::pegtl::to_string(p) + ": ";
            if(msg.compare(0, prefix.size(), prefix) == 0) msg = msg.substr(prefix.size());
            line_index lines(text);
            auto at = lines.at(p.byte);
            throw json_error(msg, span{at, at});
        }
    }
    json_value root = st.root ? std::move(*st.root) : json_value{};
    return json_document(std::move(text), std::move(root));
}

// Index segment of a flattened array path, or npos.
static std::size_t element_index(const std::string& seg){
    if(seg.empty() || seg.size() > 9) return std::string::npos;
    for(char c : seg) if(c < '0' || c > '9') return std::string::npos;
    if(seg.size() > 1 && seg[0] == '0') return std::string::npos;
    return static_cast<std::size_t>(std::stoul(seg));
}

const json_value* json_document::value_at(std::string_view dotted) const {
    const json_value* cur = &root_;
    for(const auto& seg : split(dotted, '.')){
        const json_value* next = nullptr;
        if(cur->type == json_value::kind::object){
            for(const auto& m : cur->members) if(m.key == seg){ next = &m.value; break; }
        } else if(cur->type == json_value::kind::array){
            std::size_t i = element_index(seg);
            if(i < cur->elements.size()) next = &cur->elements[i];
        }
        if(!next) return nullptr;
        cur = next;
    }
    return cur;
}

const json_member* json_document::find(std::string_view dotted) const {
    const json_value* cur = &root_;
    const json_member* found = nullptr;
    for(const auto& seg : split(dotted, '.')){
        if(cur->type != json_value::kind::object) return nullptr;
        found = nullptr;
        for(const auto& m : cur->members) if(m.key == seg){ found = &m; break; }
        if(!found) return nullptr;
        cur = &found->value;
    }
    return found;
}

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

namespace {

struct removal { std::size_t begin, end; };

std::string join_path(const std::string& prefix, const std::string& key){
    return prefix.empty() ? key : prefix + "." + key;
}

// One member of an object or one element of an array, with the path segment naming it.
struct child { std::string seg; std::size_t begin, end; const json_value* value; };

std::vector<child> children_of(const json_value& v){
    std::vector<child> out;
    if(v.type == json_value::kind::object)
        for(const auto &m : v.members) out.push_back(child{ m.key, m.begin, m.end(), &m.value });
    else if(v.type == json_value::kind::array)
        for(std::size_t i = 0; i < v.elements.size(); ++i)
            out.push_back(child{ std::to_string(i), v.elements[i].begin, v.elements[i].end, &v.elements[i] });
    return out;
}

// Plans removals inside one object or array. Returns true when every child goes, leaving the
// caller to drop the container itself (or, for the root, to empty it).
bool plan_container(const json_value& v, const std::string& prefix, const std::set<std::string>& keys,
                    std::vector<removal>& out, std::vector<std::string>& removed){
    const auto kids = children_of(v);
    const std::size_t n = kids.size();
    if(n == 0) return false;
    std::vector<bool> del(n, false);
    std::vector<std::vector<removal>> child_ranges(n);
    std::vector<std::vector<std::string>> child_removed(n);
    for(std::size_t i=0;i<n;++i){
        std::string path = join_path(prefix, kids[i].seg);
        if(keys.count(path)){
            del[i] = true;
            child_removed[i].push_back(path);
        } else {
            del[i] = plan_container(*kids[i].value, path, keys, child_ranges[i], child_removed[i]);
        }
    }
    bool all = std::all_of(del.begin(), del.end(), [](bool b){ return b; });
    for(std::size_t i=0;i<n;++i){
        removed.insert(removed.end(), child_removed[i].begin(), child_removed[i].end());
        if(!del[i]) out.insert(out.end(), child_ranges[i].begin(), child_ranges[i].end());
    }
    if(all) return true;
    for(std::size_t i=0;i<n;){
        if(!del[i]){ ++i; continue; }
        std::size_t j = i;
        while(j+1 < n && del[j+1]) ++j;
        if(j+1 < n) out.push_back(removal{ kids[i].begin, kids[j+1].begin });
        else out.push_back(removal{ kids[i-1].end, kids[j].end });
        i = j+1;
    }
    return false;
}

} // namespace

std::string delete_json_keys(const json_document& doc, const std::set<std::string>& keys,
                             std::vector<std::string>* removed){
    std::vector<removal> ranges;
    std::vector<std::string> gone;
    const auto &root = doc.root();
    if(root.type == json_value::kind::object){
        if(plan_container(root, "", keys, ranges, gone)){
            ranges.clear();
            ranges.push_back(removal{ root.begin + 1, root.end - 1 });
        }
    }
    std::sort(ranges.begin(), ranges.end(), [](const removal& a, const removal& b){ return a.begin > b.begin; });
    std::string out = doc.text();
    for(const auto &r : ranges) out.erase(r.begin, r.end - r.begin);
    if(removed) *removed = std::move(gone);
    return out;
}

namespace {

struct layout {
    bool multiline = true;
    std::string unit{"  "};
    std::string sep{": "};
    std::string eol{"\n"};
};

std::string line_indent(const json_document& doc, std::size_t offset){
    auto line = doc.lines().at(offset).line;
    return std::string(indentation_of(doc.lines().line_text(line)));
}

// Indentation unit and key separator, learned from the first object laid out over several lines.
layout detect_layout(const json_document& doc){
    layout l;
    if(doc.text().find("\r\n") != std::string::npos) l.eol = "\r\n";
    const auto &root = doc.root();
    if(root.type == json_value::kind::object && !root.members.empty()){
        const auto &first = root.members.front();
        l.multiline = doc.lines().at(first.begin).line != doc.lines().at(root.begin).line;
        std::string between = doc.text().substr(first.key_end, first.value.begin - first.key_end);
        l.sep = std::string(trim(between)) == ":" ? between : std::string(": ");
        if(l.sep.find('\n') != std::string::npos) l.sep = ": ";
        if(l.multiline){
            std::string outer = line_indent(doc, root.begin);
            std::string inner = line_indent(doc, first.begin);
            if(inner.size() > outer.size()) l.unit = inner.substr(outer.size());
        }
    }
    return l;
}

// `"a": { "b": "value" }` for segments [i, end), laid out at indentation `ind`.
std::string build_member(const std::vector<std::string>& segs, std::size_t i, const std::string& value,
                         const std::string& ind, const layout& l){
    std::string head = json_escape(segs[i]) + l.sep;
    if(i + 1 == segs.size()) return head + json_escape(value);
    if(l.multiline){
        std::string inner = ind + l.unit;
        return head + "{" + l.eol + inner + build_member(segs, i+1, value, inner, l) + l.eol + ind + "}";
    }
    return head + "{ " + build_member(segs, i+1, value, ind, l) + " }";
}

std::string build_object(const std::vector<std::string>& segs, std::size_t i, const std::string& value,
                         const std::string& ind, const layout& l){
    if(l.multiline){
        std::string inner = ind + l.unit;
        return "{" + l.eol + inner + build_member(segs, i, value, inner, l) + l.eol + ind + "}";
    }
    return "{ " + build_member(segs, i, value, ind, l) + " }";
}

std::string splice(const std::string& text, std::size_t b, std::size_t e, const std::string& with){
    return text.substr(0, b) + with + text.substr(e);
}

} // namespace

std::pair<std::string, insert_status> insert_json_key(const json_document& doc, const std::string& dotted,
                                                       const std::string& value){
    auto segs = split(dotted, '.');
    for(const auto &s : segs) if(s.empty()) throw json_error("invalid key path '" + dotted + "'", span{});
    const json_value* cur = &doc.root();
    if(cur->type != json_value::kind::object) throw json_error("message table root is not an object", span{});
    layout l = detect_layout(doc);
    const std::string &text = doc.text();

    for(std::size_t i=0;i<segs.size();++i){
        const json_member* hit = nullptr;
        for(const auto &m : cur->members) if(m.key == segs[i]){ hit = &m; break; }
        if(hit && i + 1 == segs.size()){
            return { splice(text, hit->value.begin, hit->value.end, json_escape(value)), insert_status::updated };
        }
        if(hit && hit->value.type == json_value::kind::object){ cur = &hit->value; continue; }
        if(hit){
            std::string ind = line_indent(doc, hit->begin);
            return { splice(text, hit->value.begin, hit->value.end, build_object(segs, i+1, value, ind, l)), insert_status::added };
        }
        // Append a new member to `cur`.
        if(cur->members.empty()){
            std::string ind = line_indent(doc, cur->begin);
            std::string body = l.multiline
                ? l.eol + ind + l.unit + build_member(segs, i, value, ind + l.unit, l) + l.eol + ind
                : " " + build_member(segs, i, value, ind, l) + " ";
            return { splice(text, cur->begin + 1, cur->end - 1, body), insert_status::added };
        }
        const auto &last = cur->members.back();
        bool member_lines = doc.lines().at(cur->members.front().begin).line != doc.lines().at(cur->begin).line;
        if(member_lines){
            std::string ind = line_indent(doc, last.begin);
            return { splice(text, last.end(), last.end(), "," + l.eol + ind + build_member(segs, i, value, ind, l)), insert_status::added };
        }
        layout inline_layout = l; inline_layout.multiline = false;
        return { splice(text, last.end(), last.end(), ", " + build_member(segs, i, value, "", inline_layout)), insert_status::added };
    }
    return { text, insert_status::updated };
}

} // namespace glot
