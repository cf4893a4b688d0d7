#ifndef SCRIBE_SCHEMA_TYPES_HPP
#define SCRIBE_SCHEMA_TYPES_HPP

#include "schema/type.hpp"

namespace scribe {

// Types of the core schema.

/// `~`, `null`, `Null`, `NULL`. Styles: canonical, lowercase (default), uppercase, camelcase.
Type null_type();

/// `true` and `false` in lower, upper and camel case. Styles: lowercase (default), uppercase, camelcase.
Type bool_type();

/// Decimal, binary (`0b`), octal (leading `0`), hexadecimal (`0x`) and base 60 integers.
/// Styles: binary, octal, decimal (default), hexadecimal.
Type int_type();

/// Floating point numbers, including `.inf` and `.nan`. Styles: lowercase (default), uppercase, camelcase.
Type float_type();

// Additional types of the default schema.

/// ISO 8601 timestamps (`2001-12-14t21:59:43.10-05:00`, `2002-12-14`).
Type timestamp_type();

/// The merge key `<<`. Only used to detect ambiguous strings.
Type merge_type();

/// Binary data, represented as base64.
Type binary_type();

} // namespace scribe

#endif // SCRIBE_SCHEMA_TYPES_HPP
