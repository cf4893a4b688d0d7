#ifndef SCRIBE_COMMON_ENTITIES_ENTITY_ID_HPP
#define SCRIBE_COMMON_ENTITIES_ENTITY_ID_HPP

#include "common/defs.hpp"
#include "common/format.hpp"

#include <string_view>
#include <type_traits>
#include <utility>

namespace scribe {

struct EntityIdBase {};

/// A type safe index into an `EntityStorage`. Ids of different entity types
/// cannot be mixed up. The default constructed id is invalid.
///
/// Ids are hashable with abseil's hash framework.
template<typename Derived>
class EntityId : public EntityIdBase {
public:
    static constexpr u32 invalid_value = u32(-1);

    constexpr EntityId() = default;

    constexpr explicit EntityId(u32 value)
        : value_(value) {}

    constexpr bool valid() const noexcept { return value_ != invalid_value; }
    constexpr explicit operator bool() const noexcept { return valid(); }

    constexpr u32 value() const noexcept { return value_; }

    friend constexpr bool operator==(const Derived& lhs, const Derived& rhs) {
        return lhs.value() == rhs.value();
    }

    friend constexpr bool operator!=(const Derived& lhs, const Derived& rhs) {
        return lhs.value() != rhs.value();
    }

    friend constexpr bool operator<(const Derived& lhs, const Derived& rhs) {
        return lhs.value() < rhs.value();
    }

    template<typename H>
    friend H AbslHashValue(H state, const Derived& id) {
        return H::combine(std::move(state), id.value());
    }

protected:
    void format_as(std::string_view name, FormatStream& stream) const {
        if (valid()) {
            stream.format("{}({})", name, value_);
        } else {
            stream.format("{}(invalid)", name);
        }
    }

private:
    u32 value_ = invalid_value;
};

/// Defines a new entity id type called `Name`.
#define SCRIBE_DEFINE_ENTITY_ID(Name)                       \
    class Name final : public ::scribe::EntityId<Name> {    \
    public:                                                 \
        using EntityId::EntityId;                           \
                                                            \
        static const Name invalid;                          \
                                                            \
        void format(::scribe::FormatStream& stream) const { \
            format_as(#Name, stream);                       \
        }                                                   \
    };                                                      \
                                                            \
    inline const Name Name::invalid{};

} // namespace scribe

template<typename T>
struct scribe::EnableFormatMode<T, std::enable_if_t<std::is_base_of_v<scribe::EntityIdBase, T>>> {
    static constexpr scribe::FormatMode value = scribe::FormatMode::MemberFormat;
};

#endif // SCRIBE_COMMON_ENTITIES_ENTITY_ID_HPP
