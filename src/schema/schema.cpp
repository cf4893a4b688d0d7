#include "schema/schema.hpp"

#include "common/error.hpp"
#include "schema/types.hpp"

#include <algorithm>
#include <iterator>

namespace scribe {

static void validate_types(const std::vector<Type>& types) {
    for (const auto& type : types) {
        SCRIBE_CHECK_WITH_CODE(
            !type.tag.empty(), SCRIBE_ERROR_BAD_CONFIG, "Schema types must have a tag.");
    }
}

Schema::Schema() {}

Schema::Schema(std::vector<Type> implicit_types, std::vector<Type> explicit_types)
    : implicit_(std::move(implicit_types))
    , explicit_(std::move(explicit_types)) {
    validate_types(implicit_);
    validate_types(explicit_);
}

Schema::~Schema() {}

Schema::Schema(Schema&&) noexcept = default;
Schema& Schema::operator=(Schema&&) noexcept = default;

Schema::Schema(const Schema&) = default;
Schema& Schema::operator=(const Schema&) = default;

Schema Schema::extend(std::vector<Type> implicit_types, std::vector<Type> explicit_types) const {
    std::vector<Type> new_implicit = implicit_;
    new_implicit.insert(new_implicit.end(), std::make_move_iterator(implicit_types.begin()),
        std::make_move_iterator(implicit_types.end()));

    std::vector<Type> new_explicit = explicit_;
    new_explicit.insert(new_explicit.end(), std::make_move_iterator(explicit_types.begin()),
        std::make_move_iterator(explicit_types.end()));

    return Schema(std::move(new_implicit), std::move(new_explicit));
}

bool Schema::resolves_implicitly(std::string_view str) const {
    return std::any_of(implicit_.begin(), implicit_.end(),
        [&](const Type& type) { return type.resolves(str); });
}

const Schema& failsafe_schema() {
    static const Schema schema;
    return schema;
}

const Schema& core_schema() {
    static const Schema schema = failsafe_schema().extend(
        {null_type(), bool_type(), int_type(), float_type()});
    return schema;
}

const Schema& default_schema() {
    static const Schema schema = core_schema().extend(
        {timestamp_type(), merge_type()}, {binary_type()});
    return schema;
}

} // namespace scribe
