#include "common/error.hpp"

#include <iterator>

namespace scribe {

namespace detail {

void throw_error_impl([[maybe_unused]] const SourceLocation& loc, scribe_errc_t code,
    const char* format, fmt::format_args args) {

    fmt::memory_buffer buf;

#ifdef SCRIBE_DEBUG
    if (loc) {
        fmt::format_to(
            std::back_inserter(buf), "Error in {} ({}:{}): ", loc.function, loc.file, loc.line);
    }
#endif

    fmt::vformat_to(std::back_inserter(buf), format, args);
    throw Error(code, fmt::to_string(buf));
}

} // namespace detail

Error::Error(scribe_errc_t code, std::string message)
    : code_(code)
    , message_(std::move(message)) {}

Error::~Error() {}

scribe_errc_t Error::code() const noexcept {
    return code_;
}

const char* Error::what() const noexcept {
    return message_.c_str();
}

} // namespace scribe

const char* scribe_errc_name(scribe_errc_t e) {
    switch (e) {
#define SCRIBE_ERRC_NAME(X) \
    case SCRIBE_##X:        \
        return #X;

        SCRIBE_ERRC_NAME(OK)
        SCRIBE_ERRC_NAME(ERROR_BAD_CONFIG)
        SCRIBE_ERRC_NAME(ERROR_BAD_VALUE)
        SCRIBE_ERRC_NAME(ERROR_BAD_ARG)
        SCRIBE_ERRC_NAME(ERROR_BAD_UTF8)
        SCRIBE_ERRC_NAME(ERROR_TOO_DEEP)
        SCRIBE_ERRC_NAME(ERROR_INTERNAL)

#undef SCRIBE_ERRC_NAME
    }
    return "unknown error code";
}

const char* scribe_errc_message(scribe_errc_t e) {
    switch (e) {
#define SCRIBE_ERRC_MESSAGE(X, str) \
    case SCRIBE_##X:                \
        return str;

        SCRIBE_ERRC_MESSAGE(OK, "no error")
        SCRIBE_ERRC_MESSAGE(ERROR_BAD_CONFIG, "invalid dump configuration")
        SCRIBE_ERRC_MESSAGE(ERROR_BAD_VALUE, "the value cannot be represented")
        SCRIBE_ERRC_MESSAGE(ERROR_BAD_ARG, "invalid argument")
        SCRIBE_ERRC_MESSAGE(ERROR_BAD_UTF8, "invalid utf8 string")
        SCRIBE_ERRC_MESSAGE(ERROR_TOO_DEEP, "the document is nested too deeply")
        SCRIBE_ERRC_MESSAGE(ERROR_INTERNAL, "internal error")

#undef SCRIBE_ERRC_MESSAGE
    }
    return "unknown error code";
}
