#ifndef SCRIBE_COMMON_ENTITIES_ENTITY_STORAGE_HPP
#define SCRIBE_COMMON_ENTITIES_ENTITY_STORAGE_HPP

#include "common/defs.hpp"
#include "common/entities/entity_id.hpp"
#include "common/error.hpp"

#include <utility>
#include <vector>

namespace scribe {

/// Append-only vector of values addressed by typed ids. The id of a value is its
/// insertion index, ids are never invalidated until `clear()`.
template<typename Value, typename Id>
class EntityStorage final {
public:
    EntityStorage() = default;

    auto begin() const { return values_.begin(); }
    auto end() const { return values_.end(); }

    bool empty() const { return values_.empty(); }
    size_t size() const { return values_.size(); }

    /// Returns true if `id` refers to a value in this storage.
    bool in_bounds(Id id) const { return id && id.value() < values_.size(); }

    /// \pre `in_bounds(id)`.
    Value& operator[](Id id) { return values_[id.value()]; }
    const Value& operator[](Id id) const { return values_[id.value()]; }

    /// Constructs a new value at the end and returns its id.
    template<typename... Args>
    Id emplace_back(Args&&... args) {
        SCRIBE_CHECK(values_.size() < Id::invalid_value, "Too many entities.");
        const Id id(static_cast<u32>(values_.size()));
        values_.emplace_back(std::forward<Args>(args)...);
        return id;
    }

    Id push_back(Value value) { return emplace_back(std::move(value)); }

    void reserve(size_t n) { values_.reserve(n); }
    void clear() { values_.clear(); }

private:
    std::vector<Value> values_;
};

} // namespace scribe

#endif // SCRIBE_COMMON_ENTITIES_ENTITY_STORAGE_HPP
