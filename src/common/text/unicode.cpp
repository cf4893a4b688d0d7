#include "common/text/unicode.hpp"

#include "common/error.hpp"

#include <utf8.h>

#include <iterator>

namespace scribe {

std::tuple<CodePoint, const char*> decode_utf8(const char* pos, const char* end) {
    if (pos == end) {
        return std::tuple(invalid_code_point, end);
    }

    try {
        auto cp = utf8::next(pos, end);
        return std::tuple(cp, pos);
    } catch (const utf8::exception&) {
        SCRIBE_ERROR_WITH_CODE(SCRIBE_ERROR_BAD_UTF8, "Invalid utf8.");
    }
}

std::u32string decode_utf8(std::string_view str) {
    if (auto validation = validate_utf8(str); !validation.ok) {
        SCRIBE_ERROR_WITH_CODE(SCRIBE_ERROR_BAD_UTF8,
            "Invalid utf8 sequence at byte offset {}.", validation.error_offset);
    }

    std::u32string result;
    result.reserve(str.size());
    utf8::unchecked::utf8to32(str.begin(), str.end(), std::back_inserter(result));
    return result;
}

std::string to_string_utf8(CodePoint cp) {
    std::string result;
    append_utf8(result, cp);
    return result;
}

std::string to_string_utf8(std::u32string_view str) {
    std::string result;
    result.reserve(str.size());
    for (CodePoint cp : str)
        append_utf8(result, cp);
    return result;
}

void append_utf8(std::string& buffer, CodePoint cp) {
    try {
        utf8::append(cp, std::back_inserter(buffer));
    } catch (const utf8::exception&) {
        SCRIBE_ERROR_WITH_CODE(
            SCRIBE_ERROR_BAD_UTF8, "Code point {:#x} cannot be encoded as utf8.", cp);
    }
}

size_t utf8_length(std::string_view str) {
    return static_cast<size_t>(utf8::unchecked::distance(str.begin(), str.end()));
}

Utf8ValidationResult validate_utf8(std::string_view str) {
    Utf8ValidationResult result;

    auto invalid = utf8::find_invalid(str.begin(), str.end());
    if (invalid == str.end()) {
        result.ok = true;
        return result;
    }

    result.ok = false;
    result.error_offset = static_cast<size_t>(invalid - str.begin());
    return result;
}

} // namespace scribe
