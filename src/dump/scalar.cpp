#include "dump/scalar.hpp"

#include "common/error.hpp"
#include "common/text/unicode.hpp"
#include "dump/fold.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <iterator>

namespace scribe {

static constexpr std::array<std::string_view, 16> deprecated_booleans = {
    "y", "Y", "yes", "Yes", "YES", "on", "On", "ON", //
    "n", "N", "no", "No", "NO", "off", "Off", "OFF", //
};

// Returns the short escape sequence for the character, or an empty string.
static std::string_view escape_sequence(CodePoint c) {
    switch (c) {
    case 0x00:
        return "\\0";
    case 0x07:
        return "\\a";
    case 0x08:
        return "\\b";
    case 0x09:
        return "\\t";
    case 0x0A:
        return "\\n";
    case 0x0B:
        return "\\v";
    case 0x0C:
        return "\\f";
    case 0x0D:
        return "\\r";
    case 0x1B:
        return "\\e";
    case 0x22:
        return "\\\"";
    case 0x5C:
        return "\\\\";
    case 0x85:
        return "\\N";
    case 0xA0:
        return "\\_";
    case 0x2028:
        return "\\L";
    case 0x2029:
        return "\\P";
    default:
        return {};
    }
}

static void append_hex_escape(std::string& buffer, CodePoint c) {
    if (c <= 0xFF) {
        fmt::format_to(std::back_inserter(buffer), "\\x{:02X}", c);
    } else if (c <= 0xFFFF) {
        fmt::format_to(std::back_inserter(buffer), "\\u{:04X}", c);
    } else {
        fmt::format_to(std::back_inserter(buffer), "\\U{:08X}", c);
    }
}

static std::string trim_trailing_newline(std::string str) {
    if (!str.empty() && str.back() == '\n')
        str.pop_back();
    return str;
}

std::string_view to_string(ScalarStyle style) {
    switch (style) {
#define SCRIBE_CASE(X)   \
    case ScalarStyle::X: \
        return #X;

        SCRIBE_CASE(Plain)
        SCRIBE_CASE(Single)
        SCRIBE_CASE(Literal)
        SCRIBE_CASE(Folded)
        SCRIBE_CASE(Double)

#undef SCRIBE_CASE
    }
    SCRIBE_UNREACHABLE("Invalid scalar style.");
}

bool is_deprecated_boolean(std::string_view text) {
    return std::find(deprecated_booleans.begin(), deprecated_booleans.end(), text)
           != deprecated_booleans.end();
}

bool needs_indent_indicator(std::u32string_view text) {
    // Matches /^\n* /
    const size_t pos = text.find_first_not_of(U'\n');
    return pos != std::u32string_view::npos && text[pos] == U' ';
}

std::string escape_double_quoted(std::u32string_view text) {
    std::string result;
    result.reserve(text.size());
    for (CodePoint c : text) {
        if (c > 0xFFFF) {
            append_hex_escape(result, c);
            continue;
        }

        if (auto seq = escape_sequence(c); !seq.empty()) {
            result += seq;
        } else if (is_printable(c)) {
            append_utf8(result, c);
        } else {
            append_hex_escape(result, c);
        }
    }
    return result;
}

std::string block_header(std::u32string_view text, int indent_per_level) {
    std::string result;
    if (needs_indent_indicator(text))
        result += fmt::to_string(indent_per_level);

    // The text "\n" counts as a trailing empty line.
    const size_t size = text.size();
    const bool clip = size > 0 && text[size - 1] == U'\n';
    const bool keep = clip && (size == 1 || text[size - 2] == U'\n');
    if (keep) {
        result += '+';
    } else if (!clip) {
        result += '-';
    }

    result += '\n';
    return result;
}

std::string indent_string(std::string_view text, int spaces) {
    const std::string indent(static_cast<size_t>(std::max(spaces, 0)), ' ');

    std::string result;
    result.reserve(text.size());

    size_t pos = 0;
    while (true) {
        const size_t end = text.find('\n', pos);
        const auto line = text.substr(pos, end == std::string_view::npos ? end : end - pos);
        if (!line.empty()) {
            result += indent;
            result += line;
        }
        if (end == std::string_view::npos)
            break;

        result += '\n';
        pos = end + 1;
    }
    return result;
}

ScalarEncoder::ScalarEncoder(
    const Schema& schema, int indent, int line_width, int flow_level, bool compat_mode)
    : schema_(schema)
    , indent_(indent)
    , line_width_(line_width < 0 ? -1 : line_width)
    , flow_level_(flow_level)
    , compat_mode_(compat_mode) {}

std::string
ScalarEncoder::encode(std::string_view text, int level, bool is_key, bool in_flow) const {
    if (text.empty())
        return "''";

    if (compat_mode_ && is_deprecated_boolean(text))
        return fmt::format("'{}'", text);

    const std::u32string chars = decode_utf8(text);

    // No scalars with zero indentation.
    const int indent = indent_ * std::max(1, level);

    // The width decreases with the nesting depth until it reaches min(line_width, 40).
    const int line_width = line_width_ == -1
                               ? -1
                               : std::max(std::min(line_width_, 40), line_width_ - indent);

    // Mapping keys are assumed to be implicit keys. No block styles in flow mode.
    const bool single_line_only = is_key || in_flow || (flow_level_ > -1 && level >= flow_level_);

    const ScalarStyle style = choose_scalar_style(chars, single_line_only, indent_, line_width,
        [&]() { return schema_.resolves_implicitly(text); });

    // Block scalars drop their final line break because the caller adds its own.
    switch (style) {
    case ScalarStyle::Plain:
        return std::string(text);

    case ScalarStyle::Single: {
        std::string result = "'";
        for (char c : text) {
            if (c == '\'')
                result += '\'';
            result += c;
        }
        result += '\'';
        return result;
    }

    case ScalarStyle::Literal:
        return "|" + block_header(chars, indent_)
               + trim_trailing_newline(indent_string(text, indent));

    case ScalarStyle::Folded: {
        const std::string folded = to_string_utf8(
            fold_string(chars, static_cast<size_t>(line_width)));
        return ">" + block_header(chars, indent_)
               + trim_trailing_newline(indent_string(folded, indent));
    }

    case ScalarStyle::Double:
        return "\"" + escape_double_quoted(chars) + "\"";
    }

    SCRIBE_UNREACHABLE("Invalid scalar style.");
}

} // namespace scribe
