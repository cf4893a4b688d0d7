#ifndef SCRIBE_COMMON_ERROR_HPP
#define SCRIBE_COMMON_ERROR_HPP

#include "common/debug.hpp"
#include "common/defs.hpp"
#include "scribe/error.h"

#include <fmt/format.h>

#include <exception>
#include <string>

namespace scribe {

namespace detail {

[[noreturn]] SCRIBE_COLD void throw_error_impl(
    const SourceLocation& loc, scribe_errc_t code, const char* format, fmt::format_args args);

} // namespace detail

/// Error class thrown by the library.
///
/// The error code tells callers what went wrong (bad options, a value that
/// cannot be dumped, ...), the message contains the details.
class Error : public virtual std::exception {
public:
    explicit Error(scribe_errc_t code, std::string message);
    virtual ~Error();

    scribe_errc_t code() const noexcept;
    virtual const char* what() const noexcept;

private:
    scribe_errc_t code_;
    std::string message_;
};

/// Throws an internal error. The arguments to the macro are interpreted like in fmt::format().
#define SCRIBE_ERROR(...) \
    (::scribe::throw_error(SCRIBE_SOURCE_LOCATION(), SCRIBE_ERROR_INTERNAL, __VA_ARGS__))

/// Throws an error with the given code. The arguments to the macro are interpreted like in fmt::format().
#define SCRIBE_ERROR_WITH_CODE(code, ...) \
    (::scribe::throw_error(SCRIBE_SOURCE_LOCATION(), (code), __VA_ARGS__))

/// Throws an internal error when code that should never run is executed anyway.
#define SCRIBE_UNREACHABLE(message) SCRIBE_ERROR("Unreachable code executed: {}", (message))

/// Evaluates a condition and, if the condition evaluates to false, throws an internal error.
/// All other arguments are passed to SCRIBE_ERROR().
#define SCRIBE_CHECK(cond, ...)         \
    do {                                \
        if (SCRIBE_UNLIKELY(!(cond))) { \
            SCRIBE_ERROR(__VA_ARGS__);  \
        }                               \
    } while (0)

/// Like SCRIBE_CHECK(), but throws an error with the given code.
#define SCRIBE_CHECK_WITH_CODE(cond, code, ...)        \
    do {                                               \
        if (SCRIBE_UNLIKELY(!(cond))) {                \
            SCRIBE_ERROR_WITH_CODE(code, __VA_ARGS__); \
        }                                              \
    } while (0)

/// Throws an error with the provided source location.
template<typename... Args>
[[noreturn]] inline SCRIBE_COLD void
throw_error(const SourceLocation& loc, scribe_errc_t code, const char* format, const Args&... args) {
    detail::throw_error_impl(loc, code, format, fmt::make_format_args(args...));
}

} // namespace scribe

#endif // SCRIBE_COMMON_ERROR_HPP
