#ifndef SCRIBE_COMMON_DEBUG_HPP
#define SCRIBE_COMMON_DEBUG_HPP

// Debug builds attach the throwing source location to error messages.
#if !defined(SCRIBE_DEBUG) && !defined(NDEBUG)
#    define SCRIBE_DEBUG 1
#endif

namespace scribe {

/// Position in the library's source code. All fields are empty in release builds.
struct SourceLocation {
    const char* file = nullptr;
    int line = 0;
    const char* function = nullptr;

    explicit constexpr operator bool() const { return file != nullptr; }
};

} // namespace scribe

#ifdef SCRIBE_DEBUG
#    define SCRIBE_SOURCE_LOCATION() (::scribe::SourceLocation{__FILE__, __LINE__, __func__})
#else
#    define SCRIBE_SOURCE_LOCATION() (::scribe::SourceLocation{})
#endif

#endif // SCRIBE_COMMON_DEBUG_HPP
