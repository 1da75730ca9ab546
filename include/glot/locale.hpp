// Flattened locale message tables
#pragma once
#include "glot/json_doc.hpp"
#include "glot/source.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace glot {

enum class value_type { string, string_array, number, boolean, null };

const char* value_type_name(value_type t);

struct LocaleEntry {
    std::string value;   // string arrays are joined with ", "
    value_type type = value_type::string;
    position where;      // position of the key in the document
};

struct LocaleTable {
    std::string locale;
    std::string path;
    bool primary = false;
    std::map<std::string, LocaleEntry> entries;
    std::shared_ptr<const json_document> document;

    bool contains(const std::string& key) const { return entries.count(key) != 0; }
    const LocaleEntry* find(const std::string& key) const {
        auto it = entries.find(key);
        return it == entries.end() ? nullptr : &it->second;
    }
};

// Locale id from a table path: the file stem (`messages/de.json` -> `de`).
std::string locale_from_path(std::string_view path);

// Flattens a parsed document into key paths. Objects recurse, non-empty all-string arrays are one
// leaf, other arrays expand by index, and empty arrays contribute nothing.
std::map<std::string, LocaleEntry> flatten(const json_document& doc);

struct LocaleLoad {
    std::optional<LocaleTable> table;
    std::optional<parse_failure> failure;
};

LocaleLoad load_locale(const std::string& path, std::string text);

} // namespace glot
