#ifndef SCRIBE_DUMP_OPTIONS_HPP
#define SCRIBE_DUMP_OPTIONS_HPP

#include "common/defs.hpp"
#include "common/format.hpp"
#include "schema/schema.hpp"

#include <absl/container/flat_hash_map.h>

#include <functional>
#include <string>
#include <string_view>

namespace scribe {

/// Controls the order of keys in block mappings.
enum class KeyOrder : u8 {
    Insertion,     // Keep the insertion order of the mapping.
    Lexicographic, // Ascending, by byte value.
    Custom,        // Use DumpOptions::key_comparator.
};

std::string_view to_string(KeyOrder order);

/// Compares two keys. Must return a negative value if `a` is less than `b`,
/// zero if they are equal and a positive value otherwise.
using KeyComparator = std::function<int(std::string_view a, std::string_view b)>;

/// Maps tags to style names. The tag may use the `!!` shorthand.
using StyleMap = absl::flat_hash_map<std::string, std::string>;

/// Options for a single stringify call.
struct DumpOptions {
    /// Indentation width in spaces. Values less than 1 are treated as 1.
    int indent = 2;

    /// When true, sequences nested in a mapping are indented by one additional level.
    bool array_indent = true;

    /// When true, values that cannot be represented are skipped (together with their key)
    /// instead of raising an error.
    bool skip_invalid = false;

    /// Nesting level at which collections switch from block to flow style.
    /// -1 means block style everywhere.
    int flow_level = -1;

    /// Style overrides for individual tags (e.g. `"!!int" -> "hexadecimal"`).
    StyleMap styles;

    /// The schema used to represent values. nullptr means default_schema().
    /// The schema must outlive the dump call.
    const Schema* schema = nullptr;

    /// Order of keys in block mappings.
    KeyOrder sort_keys = KeyOrder::Insertion;

    /// Comparator for KeyOrder::Custom.
    KeyComparator key_comparator;

    /// Maximum line width for folded strings. -1 means unlimited.
    int line_width = 80;

    /// When false, duplicate nodes are rendered in full every time they occur.
    bool use_anchors = true;

    /// When true, strings like "yes" or "off" are quoted for yaml 1.1 readers.
    bool compat_mode = true;

    /// When true, flow collections omit the space after `,` and `:`, e.g. `[a,b]`.
    bool condense_flow = false;

    /// Maximum number of nested containers.
    u32 max_depth = 1000;
};

/// Validates the options and throws an error with code SCRIBE_ERROR_BAD_CONFIG
/// if they are invalid.
void validate(const DumpOptions& options);

/// Expands the `!!` tag shorthand in the keys of the style map.
StyleMap compile_style_map(const StyleMap& styles);

} // namespace scribe

SCRIBE_ENABLE_FREE_TO_STRING(scribe::KeyOrder)

#endif // SCRIBE_DUMP_OPTIONS_HPP
