#include "dump/fold.hpp"

namespace scribe {

std::u32string fold_line(std::u32string_view line, size_t width) {
    if (line.empty() || line[0] == U' ')
        return std::u32string(line);

    std::u32string result;
    bool first = true;
    auto push = [&](std::u32string_view part) {
        if (!first)
            result += U'\n';
        result.append(part);
        first = false;
    };

    // start is inclusive, curr and next are exclusive. Invariant: curr - start <= width
    // or no earlier break position exists.
    size_t start = 0;
    size_t curr = 0;
    for (size_t next = 0; next + 1 < line.size(); ++next) {
        // Possible break: a space followed by a non-space.
        if (line[next] != U' ' || line[next + 1] == U' ')
            continue;

        if (next - start > width) {
            const size_t end = curr > start ? curr : next;
            push(line.substr(start, end - start));
            start = end + 1; // Skip the space that became a line break.
        }
        curr = next;
    }

    // The remainder is either the whole line or starts with a non-space character.
    if (line.size() - start > width && curr > start) {
        push(line.substr(start, curr - start));
        push(line.substr(curr + 1));
    } else {
        push(line.substr(start));
    }
    return result;
}

std::u32string fold_string(std::u32string_view text, size_t width) {
    size_t pos = text.find(U'\n');
    if (pos == std::u32string_view::npos)
        pos = text.size();

    // First line, possibly empty.
    std::u32string result = fold_line(text.substr(0, pos), width);

    // No extra line break before the first content line.
    bool prev_more_indented = !text.empty() && (text[0] == U'\n' || text[0] == U' ');

    // Remaining chunks: a run of line breaks followed by a (possibly empty) content line.
    while (pos < text.size()) {
        size_t line_start = text.find_first_not_of(U'\n', pos);
        if (line_start == std::u32string_view::npos)
            line_start = text.size();

        size_t line_end = text.find(U'\n', line_start);
        if (line_end == std::u32string_view::npos)
            line_end = text.size();

        const auto breaks = text.substr(pos, line_start - pos);
        const auto line = text.substr(line_start, line_end - line_start);
        const bool more_indented = !line.empty() && line[0] == U' ';

        result.append(breaks);
        if (!prev_more_indented && !more_indented && !line.empty())
            result += U'\n';
        result += fold_line(line, width);

        prev_more_indented = more_indented;
        pos = line_end;
    }
    return result;
}

} // namespace scribe
