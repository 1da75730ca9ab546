// Format-preserving JSON document tree
#pragma once
#include "glot/source.hpp"
#include <cstddef>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace glot {

struct json_error : std::runtime_error {
    json_error(const std::string& msg, span where): std::runtime_error(msg), where(where) {}
    span where;
};

struct json_member;

// Every value keeps the byte range it occupies in the original text.
struct json_value {
    enum class kind { object, array, string, number, boolean, null };
    kind type = kind::null;
    std::size_t begin = 0, end = 0;
    std::string text;                  // decoded string, or the literal for number/boolean/null
    std::vector<json_member> members;  // object
    std::vector<json_value> elements;  // array
};

struct json_member {
    std::string key;
    std::size_t begin = 0;             // opening quote of the key
    std::size_t key_end = 0;
    json_value value;
    std::size_t end() const { return value.end; }
};

class json_document {
public:
    // Throws json_error with the failing position.
    static json_document parse(std::string text, std::string source = "<json>");

    const std::string& text() const { return text_; }
    const json_value& root() const { return root_; }
    const line_index& lines() const { return lines_; }

    // Member at a dotted path through objects, or null.
    const json_member* find(std::string_view dotted) const;

    // Value at a flattened key path. Numeric segments index into arrays (`faq.0.q`).
    const json_value* value_at(std::string_view dotted) const;

    json_document(const json_document& o);
    json_document& operator=(const json_document&) = delete;
    json_document(json_document&& o);
    json_document& operator=(json_document&&) = delete;

private:
    json_document(std::string text, json_value root);
    std::string text_;
    json_value root_;
    line_index lines_;
};

std::string json_escape(const std::string& s);

// Removes the members and array elements named by `keys` (flattened key paths) and every object or
// array that becomes empty as a result. Other bytes are left untouched. `removed` receives the paths actually deleted.
std::string delete_json_keys(const json_document& doc, const std::set<std::string>& keys,
                             std::vector<std::string>* removed = nullptr);

enum class insert_status { added, updated };

// Writes a string value at a dotted path, creating intermediate objects in the document's
// indentation style. A non-object intermediate is replaced by an object.
std::pair<std::string, insert_status> insert_json_key(const json_document& doc, const std::string& dotted,
                                                       const std::string& value);

} // namespace glot
