#ifndef SCRIBE_DUMP_SCALAR_HPP
#define SCRIBE_DUMP_SCALAR_HPP

#include "common/defs.hpp"
#include "common/format.hpp"
#include "dump/chars.hpp"
#include "schema/schema.hpp"

#include <string>
#include <string_view>

namespace scribe {

/// The presentation styles of a scalar string.
enum class ScalarStyle : u8 {
    Plain,   // text
    Single,  // 'text'
    Literal, // |
    Folded,  // >
    Double,  // "text"
};

std::string_view to_string(ScalarStyle style);

/// Returns true if `text` is one of the yaml 1.1 boolean spellings (`yes`, `No`, `ON`, ...)
/// that are plain strings in yaml 1.2.
bool is_deprecated_boolean(std::string_view text);

/// Returns true if a block scalar with this content needs an explicit indentation indicator,
/// i.e. if its first non-empty line starts with a space.
bool needs_indent_indicator(std::u32string_view text);

/// Determines which scalar styles are possible and returns the preferred style.
/// A `line_width` of -1 means "no limit".
/// `is_ambiguous()` returns true if the plain text would be read back as a different type,
/// it is only called for single line strings.
///
/// Pre-condition: `text` is not empty.
/// Post-conditions:
///  - Plain or Single: there are no line breaks in the text.
///  - Literal: no line is suitable for folding (or line_width is -1).
///  - Folded: a line is longer than line_width and can be folded.
template<typename AmbiguityTest>
ScalarStyle choose_scalar_style(std::u32string_view text, bool single_line_only,
    int indent_per_level, int line_width, AmbiguityTest&& is_ambiguous) {
    const bool track_width = line_width != -1;
    const i64 width = line_width;

    bool has_line_break = false;
    bool has_foldable_line = false;
    i64 previous_line_break = -1;
    bool plain = is_plain_safe_first(text.front()) && !is_white_space(text.back());

    // Foldable lines are too long and not more-indented.
    auto is_foldable = [&](i64 line_end) {
        return line_end - previous_line_break - 1 > width
               && text[static_cast<size_t>(previous_line_break + 1)] != U' ';
    };

    const i64 size = static_cast<i64>(text.size());
    if (single_line_only) {
        // No block styles: only rule out plain and single.
        for (CodePoint c : text) {
            if (!is_printable(c))
                return ScalarStyle::Double;
            plain = plain && is_plain_safe(c);
        }
    } else {
        for (i64 i = 0; i < size; ++i) {
            const CodePoint c = text[static_cast<size_t>(i)];
            if (c == U'\n') {
                has_line_break = true;
                if (track_width) {
                    has_foldable_line = has_foldable_line || is_foldable(i);
                    previous_line_break = i;
                }
            } else if (!is_printable(c)) {
                return ScalarStyle::Double;
            }
            plain = plain && is_plain_safe(c);
        }

        // The last line does not end with a line break.
        has_foldable_line = has_foldable_line || (track_width && previous_line_break + 1 < size
                                                     && is_foldable(size));
    }

    // Prefer block styles for multiline strings and for super long lines.
    if (!has_line_break && !has_foldable_line)
        return plain && !is_ambiguous() ? ScalarStyle::Plain : ScalarStyle::Single;

    // The block indentation indicator can only have one digit.
    if (indent_per_level > 9 && needs_indent_indicator(text))
        return ScalarStyle::Double;

    return has_foldable_line ? ScalarStyle::Folded : ScalarStyle::Literal;
}

/// Escapes the text for a double quoted scalar (without the surrounding quotes).
/// Printable characters are copied, the usual control characters get their short escape
/// sequence (e.g. `\n`, `\e`), everything else is escaped as `\xHH`, `\uHHHH` or `\UHHHHHHHH`.
/// Characters outside the basic multilingual plane are always escaped.
std::string escape_double_quoted(std::u32string_view text);

/// Returns the header of a literal or folded block scalar: the optional indentation indicator,
/// the chomping indicator and a line break.
///
/// Chomping: `+` (keep) if the text ends with two or more line breaks (or is exactly one
/// line break), nothing (clip) if it ends with a single line break, `-` (strip) otherwise.
std::string block_header(std::u32string_view text, int indent_per_level);

/// Indents every line of `text` by `spaces`. Empty lines are not indented.
std::string indent_string(std::string_view text, int spaces);

/// Renders strings as yaml scalars, choosing the most readable style that reads back
/// as the same string.
class ScalarEncoder final {
public:
    /// The schema is used to detect ambiguous strings and must outlive the encoder.
    ScalarEncoder(
        const Schema& schema, int indent, int line_width, int flow_level, bool compat_mode);

    /// Encodes the utf8 string `text` for the given nesting level.
    /// Mapping keys (`is_key == true`) and scalars inside flow collections (`in_flow == true`)
    /// are always rendered on a single line.
    /// Block scalars are returned without their final line break.
    ///
    /// Throws an error with code SCRIBE_ERROR_BAD_UTF8 if `text` is not valid utf8.
    std::string encode(std::string_view text, int level, bool is_key, bool in_flow = false) const;

private:
    const Schema& schema_;
    int indent_;
    int line_width_;
    int flow_level_;
    bool compat_mode_;
};

} // namespace scribe

SCRIBE_ENABLE_FREE_TO_STRING(scribe::ScalarStyle)

#endif // SCRIBE_DUMP_SCALAR_HPP
