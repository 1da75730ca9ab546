#include "glot/locale.hpp"
#include "glot/config.hpp"
#include <cstdio>

namespace glot {

const char* value_type_name(value_type t){
    switch(t){
        case value_type::string: return "string";
        case value_type::string_array: return "array";
        case value_type::number: return "number";
        case value_type::boolean: return "boolean";
        case value_type::null: return "null";
    }
    return "unknown";
}

std::string locale_from_path(std::string_view path){
    auto slash = path.find_last_of("/\\");
    std::string_view base = slash == std::string_view::npos ? path : path.substr(slash + 1);
    auto dot = base.rfind('.');
    return std::string(dot == std::string_view::npos || dot == 0 ? base : base.substr(0, dot));
}

static void flatten_value(const json_document& doc, const json_value& v, const std::string& key,
                          position where, std::map<std::string, LocaleEntry>& out){
    using kind = json_value::kind;
    switch(v.type){
        case kind::object:
            for(const auto &m : v.members){
                std::string k = key.empty() ? m.key : key + "." + m.key;
                flatten_value(doc, m.value, k, doc.lines().at(m.begin), out);
            }
            return;
        case kind::array: {
            if(v.elements.empty()) return;
            bool all_strings = true;
            for(const auto &e : v.elements) if(e.type != kind::string){ all_strings = false; break; }
            if(all_strings){
                std::string joined;
                for(std::size_t i=0;i<v.elements.size();++i){ if(i) joined += ", "; joined += v.elements[i].text; }
                out[key] = LocaleEntry{ joined, value_type::string_array, where };
                return;
            }
            for(std::size_t i=0;i<v.elements.size();++i){
                const auto &e = v.elements[i];
                flatten_value(doc, e, key + "." + std::to_string(i), doc.lines().at(e.begin), out);
            }
            return;
        }
        case kind::string: out[key] = LocaleEntry{ v.text, value_type::string, where }; return;
        case kind::number: out[key] = LocaleEntry{ v.text, value_type::number, where }; return;
        case kind::boolean: out[key] = LocaleEntry{ v.text, value_type::boolean, where }; return;
        case kind::null: out[key] = LocaleEntry{ v.text, value_type::null, where }; return;
    }
}

std::map<std::string, LocaleEntry> flatten(const json_document& doc){
    std::map<std::string, LocaleEntry> out;
    if(doc.root().type == json_value::kind::object)
        flatten_value(doc, doc.root(), "", position{}, out);
    return out;
}

LocaleLoad load_locale(const std::string& path, std::string text){
    LocaleLoad r;
    try {
        auto doc = std::make_shared<const json_document>(json_document::parse(std::move(text), path));
        if(doc->root().type != json_value::kind::object){
            auto at = doc->lines().at(doc->root().begin);
            r.failure = parse_failure{ span{at, at}, "message table root must be an object" };
            return r;
        }
        LocaleTable t;
        t.locale = locale_from_path(path);
        t.path = path;
        t.entries = flatten(*doc);
        t.document = std::move(doc);
        if(debug_enabled()) std::fprintf(stderr, "[glot:locale] %s: %zu keys\n", path.c_str(), t.entries.size());
        r.table = std::move(t);
    } catch (const json_error& e) {
        r.failure = parse_failure{ e.where, e.what() };
    }
    return r;
}

} // namespace glot
