#ifndef SCRIBE_SCHEMA_TYPE_HPP
#define SCRIBE_SCHEMA_TYPE_HPP

#include "common/defs.hpp"
#include "model/node.hpp"

#include <absl/container/flat_hash_map.h>

#include <functional>
#include <string>
#include <string_view>
#include <variant>

namespace scribe {

/// Prefix of the tags defined by the yaml specification. `!!name` is short for
/// `tag:yaml.org,2002:name`.
inline constexpr std::string_view yaml_tag_prefix = "tag:yaml.org,2002:";

/// Expands the `!!` shorthand to a full yaml tag. Other tags are returned unchanged.
std::string expand_tag(std::string_view tag);

/// Returns true if a plain scalar with the given content would be read as this type.
using ResolveFunction = std::function<bool(std::string_view str)>;

/// Returns true if the node belongs to this type.
using PredicateFunction = std::function<bool(const Node& node)>;

/// Converts a node into its textual representation, using the requested style.
using RepresentFunction = std::function<std::string(const Node& node, std::string_view style)>;

/// Maps style names (e.g. "lowercase") to representation functions.
using StyleTable = absl::flat_hash_map<std::string, RepresentFunction>;

/// The representation of a type. Either absent (the node is rendered as is),
/// a single function for all styles or a table keyed by style.
using Represent = std::variant<std::monostate, RepresentFunction, StyleTable>;

/// Describes a semantic type known to a schema.
///
/// Implicit types are recognized without a tag in the output (e.g. integers or booleans),
/// their represented text is emitted verbatim. Explicit types are always written
/// with their tag.
struct Type {
    /// Full tag name, e.g. `tag:yaml.org,2002:int`.
    std::string tag;

    /// Optional, used to detect strings that would be read back as this type.
    ResolveFunction resolve;

    /// Optional, types without a predicate never match a node.
    PredicateFunction predicate;

    Represent represent;

    /// Style used when the options do not override the style for this tag.
    std::string default_style;

    /// Returns true if the plain scalar `str` resolves to this type.
    bool resolves(std::string_view str) const { return resolve && resolve(str); }

    /// Returns true if the node belongs to this type.
    bool matches(const Node& node) const { return predicate && predicate(node); }

    /// Returns the representation function for the given style.
    /// Returns nullptr if this type has no representation.
    /// Throws a configuration error if the style is not supported.
    const RepresentFunction* representer(std::string_view style) const;
};

} // namespace scribe

#endif // SCRIBE_SCHEMA_TYPE_HPP
