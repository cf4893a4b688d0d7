#include "common/defs.hpp"

#include <climits>
#include <limits>
#include <type_traits>

namespace scribe {

static_assert(CHAR_BIT == 8, "Only 8 bit bytes are supported.");
static_assert(std::is_same_v<u8, byte>, "u8 and byte must be interchangeable.");
static_assert(std::numeric_limits<f64>::is_iec559, "Floats must be IEEE 754 doubles.");

} // namespace scribe
