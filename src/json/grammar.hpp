#pragma once
#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/json.hpp>
#include <string>

// RFC 8259 rules come from PEGTL's json contrib grammar; only the document wrapper and the
// error messages live here.
namespace glot::json_front::grammar {
using namespace tao::pegtl;
namespace json = tao::pegtl::json;

struct document : seq< opt< utf8::bom >, star< json::ws >, must< json::value >, must< eof > > {};

template<typename Rule> inline constexpr const char* error_message = "invalid JSON";
template<> inline constexpr const char* error_message<json::escaped> = "invalid escape sequence";
template<> inline constexpr const char* error_message<json::xdigit> = "invalid escape sequence";
template<> inline constexpr const char* error_message<json::char_> = "unterminated string or control character in string";
template<> inline constexpr const char* error_message<json::string_content> = "unterminated string";
template<> inline constexpr const char* error_message<json::key_content> = "unterminated string";
template<> inline constexpr const char* error_message<json::digits> = "invalid number";
template<> inline constexpr const char* error_message<json::name_separator> = "expected ':' after object key";
template<> inline constexpr const char* error_message<json::member> = "expected object member after ','";
template<> inline constexpr const char* error_message<json::array_element> = "expected a value after ','";
template<> inline constexpr const char* error_message<json::value> = "expected a value";
template<> inline constexpr const char* error_message<json::end_object> = "expected ',' or '}'";
template<> inline constexpr const char* error_message<json::end_array> = "expected ',' or ']'";
template<> inline constexpr const char* error_message<eof> = "unexpected trailing characters";

template<typename Rule>
struct control : normal<Rule> {
    template<typename ParseInput, typename... States>
    [[noreturn]] static void raise(const ParseInput& in, States&&...){
        throw tao::pegtl::parse_error(std::string(error_message<Rule>), in);
    }
};

} // namespace glot::json_front::grammar
