#include "dump/chars.hpp"

namespace scribe {

static constexpr CodePoint byte_order_mark = 0xFEFF;

static bool is_flow_indicator(CodePoint c) {
    switch (c) {
    case ',':
    case '[':
    case ']':
    case '{':
    case '}':
        return true;
    default:
        return false;
    }
}

bool is_printable(CodePoint c) {
    return (0x00020 <= c && c <= 0x00007E)
           || (0x000A1 <= c && c <= 0x00D7FF && c != 0x2028 && c != 0x2029)
           || (0x0E000 <= c && c <= 0x00FFFD && c != byte_order_mark)
           || (0x10000 <= c && c <= 0x10FFFF);
}

bool is_plain_safe(CodePoint c) {
    // Subset of nb-char - c-flow-indicator - ":" - "#".
    return is_printable(c) && c != byte_order_mark && !is_flow_indicator(c) && c != ':'
           && c != '#';
}

bool is_plain_safe_first(CodePoint c) {
    // Subset of ns-char - c-indicator.
    if (!is_printable(c) || c == byte_order_mark || is_white_space(c) || is_flow_indicator(c))
        return false;

    switch (c) {
    case '-':
    case '?':
    case ':':
    case '#':
    case '&':
    case '*':
    case '!':
    case '|':
    case '>':
    case '\'':
    case '"':
    case '%':
    case '@':
    case '`':
        return false;
    default:
        return true;
    }
}

} // namespace scribe
