// Text helpers shared by the walker, the checker and the editor
#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace glot {

// True when the UTF-8 text holds a code point with the Unicode Alphabetic property.
// Digits of any script, punctuation, symbols and emoji never count. Malformed bytes are skipped.
bool has_alphabetic(std::string_view utf8);

std::string_view trim(std::string_view s);
std::vector<std::string> split(std::string_view s, char sep);
bool starts_with(std::string_view s, std::string_view prefix);

// Leading spaces and tabs of a line.
std::string_view indentation_of(std::string_view line);

// Path glob: `**` spans directories, `*` and `?` stay within one segment.
bool path_glob_match(std::string_view pattern, std::string_view path);

// Key glob: `*` matches within a single dot-separated segment.
bool key_glob_match(std::string_view pattern, std::string_view key);

} // namespace glot
