#ifndef SCRIBE_COMMON_DEFS_HPP
#define SCRIBE_COMMON_DEFS_HPP

#include <cstddef>
#include <cstdint>

namespace scribe {

using u8 = std::uint8_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using i64 = std::int64_t;
using f64 = double;

/// Raw octet, used for binary payloads and utf8 code units.
using byte = unsigned char;

using std::size_t;

#if defined(__GNUC__) || defined(__clang__)
#    define SCRIBE_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#    define SCRIBE_COLD __attribute__((cold))
#elif defined(_MSC_VER)
#    define SCRIBE_UNLIKELY(x) (!!(x))
#    define SCRIBE_COLD
#else
#    define SCRIBE_UNLIKELY(x) (x)
#    define SCRIBE_COLD
#endif

} // namespace scribe

#endif // SCRIBE_COMMON_DEFS_HPP
