#ifndef SCRIBE_COMMON_TEXT_UNICODE_HPP
#define SCRIBE_COMMON_TEXT_UNICODE_HPP

#include "common/defs.hpp"

#include <string>
#include <string_view>
#include <tuple>

namespace scribe {

using CodePoint = u32;

/// Sentinel value for invalid code points.
inline constexpr CodePoint invalid_code_point = CodePoint(-1);

/// Returns the next code point (at "pos") and the position just after that code point
/// to continue with the iteration. Returns an invalid code point together with "end"
/// if `pos == end`. Throws if the input is not valid utf8.
std::tuple<CodePoint, const char*> decode_utf8(const char* pos, const char* end);

/// Decodes the complete utf8 string into a sequence of code points.
/// Throws an error with code SCRIBE_ERROR_BAD_UTF8 if the string is invalid.
std::u32string decode_utf8(std::string_view str);

/// Converts the code point to a utf8 string.
std::string to_string_utf8(CodePoint cp);

/// Converts the code point sequence to a utf8 string.
std::string to_string_utf8(std::u32string_view str);

/// Appends the code point to a utf8 string.
void append_utf8(std::string& buffer, CodePoint cp);

/// Returns the number of code points in the given (valid) utf8 string.
size_t utf8_length(std::string_view str);

struct Utf8ValidationResult {
    bool ok = false;         // True if the string was OK
    size_t error_offset = 0; // Index of the first invalid byte, if ok == false
};

/// Validates the given string as utf8. Returns whether the string is valid, and if it isn't,
/// the position of the first invalid byte.
Utf8ValidationResult validate_utf8(std::string_view str);

} // namespace scribe

#endif // SCRIBE_COMMON_TEXT_UNICODE_HPP
