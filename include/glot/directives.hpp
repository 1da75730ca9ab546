// Suppression and key-annotation directives embedded in comments
#pragma once
#include "glot/source.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace glot {

// Finding categories a directive can suppress.
enum class rule : std::uint8_t { hardcoded = 1, untranslated = 2, unresolved_key = 4 };

using rule_set = std::uint8_t;
inline constexpr rule_set all_rules = 7;
inline constexpr rule_set bit(rule r){ return static_cast<rule_set>(r); }

const char* rule_name(rule r);
std::optional<rule> rule_from_name(std::string_view name);   // case-insensitive

// Most consecutive comment lines a next-line directive (or an annotation) may reach across.
inline constexpr int max_comment_chain_lines = 10;

struct directive {
    enum class kind { disable_next_line, disable, enable, message_keys };
    kind type = kind::disable;
    rule_set rules = all_rules;          // suppression directives
    std::vector<std::string> keys;       // message_keys: valid patterns
    std::vector<std::string> rejected;   // message_keys: patterns that were dropped
};

// Recognizes directive text inside one comment body. Leading `*` decoration is ignored.
std::optional<directive> parse_directive(std::string_view comment_text);

// A pattern is rejected when it starts with a wildcard or contains an empty segment.
bool valid_key_pattern(std::string_view pattern);

struct AnnotationBlock {
    int line = 0;        // first line of the comment
    int end_line = 0;    // last line of the comment
    span where;
    std::vector<std::string> keys;
    bool consumed = false;
};

// Lines that hold comments and nothing else (JSX `{` `}` wrappers aside).
std::vector<bool> comment_only_lines(const std::string& text, const line_index& lines,
                                     const std::vector<comment_token>& comments);

// Per-file suppression state, built from the comment tokens of one source unit.
class DirectiveState {
public:
    DirectiveState() = default;
    explicit DirectiveState(const source_unit& unit);

    bool is_suppressed(int line, rule r) const;

    const std::vector<AnnotationBlock>& annotations() const { return annotations_; }
    std::vector<AnnotationBlock>& annotations() { return annotations_; }

    // True when `line` is reachable from `from_line` across comment-only lines.
    bool comment_chain_reaches(int from_line, int line) const;

    // The nearest unconsumed annotation whose comment chain ends at `line` (or sits on it).
    AnnotationBlock* annotation_for(int line);
    const AnnotationBlock* annotation_for(int line) const;

private:
    struct block_range { int first; int last; rule_set rules; };
    std::map<int, rule_set> next_line_;
    std::vector<block_range> blocks_;
    std::vector<AnnotationBlock> annotations_;
    std::vector<bool> comment_only_;   // index: line-1

    bool is_comment_only(int line) const {
        return line >= 1 && static_cast<std::size_t>(line) <= comment_only_.size() && comment_only_[static_cast<std::size_t>(line-1)];
    }
};

} // namespace glot
