#ifndef SCRIBE_SCHEMA_SCHEMA_HPP
#define SCRIBE_SCHEMA_SCHEMA_HPP

#include "common/defs.hpp"
#include "schema/type.hpp"

#include <string_view>
#include <vector>

namespace scribe {

/// A schema is an ordered collection of implicit and explicit types.
/// When dumping, implicit types are probed first, then explicit types;
/// the first matching type wins.
///
/// Schemas are immutable once constructed and may be shared between threads.
class Schema final {
public:
    Schema();
    Schema(std::vector<Type> implicit_types, std::vector<Type> explicit_types);
    ~Schema();

    Schema(Schema&&) noexcept;
    Schema& operator=(Schema&&) noexcept;

    Schema(const Schema&);
    Schema& operator=(const Schema&);

    /// Returns a new schema that contains the types of this schema, followed by the given types.
    Schema extend(std::vector<Type> implicit_types, std::vector<Type> explicit_types = {}) const;

    const std::vector<Type>& implicit_types() const { return implicit_; }
    const std::vector<Type>& explicit_types() const { return explicit_; }

    /// Returns true if the plain scalar `str` would be read back as a non-string value
    /// by one of the implicit types of this schema.
    bool resolves_implicitly(std::string_view str) const;

private:
    std::vector<Type> implicit_;
    std::vector<Type> explicit_;
};

/// A schema without any types. Only strings, sequences and mappings can be dumped.
const Schema& failsafe_schema();

/// Implicit null, bool, int and float types.
const Schema& core_schema();

/// The core schema plus the timestamp and merge types (implicit) and the binary type (explicit).
const Schema& default_schema();

} // namespace scribe

#endif // SCRIBE_SCHEMA_SCHEMA_HPP
