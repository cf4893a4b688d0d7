#ifndef SCRIBE_DUMP_FOLD_HPP
#define SCRIBE_DUMP_FOLD_HPP

#include "common/defs.hpp"

#include <string>
#include <string_view>

namespace scribe {

/// Greedy line breaking for a single line (without line breaks).
/// Picks the longest line under the limit each time, otherwise settles for the shortest line
/// over the limit. Breaks are only inserted at a space that is followed by a non-space character
/// (the space is replaced by the line break).
///
/// Lines that are empty or start with a space (more-indented lines) are returned unchanged,
/// folding them would change their content.
std::u32string fold_line(std::u32string_view line, size_t width);

/// Folds every line of `text` for the folded block scalar style.
///
/// In folded style, k consecutive line breaks are read as k-1 line breaks unless they
/// are adjacent to a more-indented line or at the very beginning of the text.
/// An additional line break is inserted where necessary so that the text reads back unchanged.
/// A long line without a suitable break point will exceed the width limit.
std::u32string fold_string(std::u32string_view text, size_t width);

} // namespace scribe

#endif // SCRIBE_DUMP_FOLD_HPP
