#ifndef SCRIBE_DUMP_CHARS_HPP
#define SCRIBE_DUMP_CHARS_HPP

#include "common/defs.hpp"
#include "common/text/unicode.hpp"

namespace scribe {

/// Returns true if the character can be printed without escaping.
/// Derived from yaml's nb-char, minus `\t`, U+0085, U+00A0, U+2028, U+2029 and the byte order mark.
bool is_printable(CodePoint c);

/// Returns true if the character may appear after the first character of a plain scalar.
bool is_plain_safe(CodePoint c);

/// Returns true if the character may start a plain scalar.
bool is_plain_safe_first(CodePoint c);

/// Space or tab.
inline bool is_white_space(CodePoint c) {
    return c == ' ' || c == '\t';
}

} // namespace scribe

#endif // SCRIBE_DUMP_CHARS_HPP
