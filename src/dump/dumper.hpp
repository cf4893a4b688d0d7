#ifndef SCRIBE_DUMP_DUMPER_HPP
#define SCRIBE_DUMP_DUMPER_HPP

#include "common/defs.hpp"
#include "dump/diagnostics.hpp"
#include "dump/duplicates.hpp"
#include "dump/options.hpp"
#include "dump/scalar.hpp"
#include "model/document.hpp"
#include "schema/schema.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace scribe {

/// Renders a document (or a part of it) as yaml text.
///
/// A dumper holds the state of a single serialization: the options, the duplicate
/// nodes and the diagnostics. It is not thread safe; use one instance per thread.
class Dumper final {
public:
    /// Throws an error with code SCRIBE_ERROR_BAD_CONFIG if the options are invalid.
    /// The document and the schema referenced by the options must outlive the dumper.
    Dumper(const Document& doc, DumpOptions options);
    ~Dumper();

    Dumper(const Dumper&) = delete;
    Dumper& operator=(const Dumper&) = delete;

    /// Renders the tree below `root`. The result ends with a single line break.
    /// Returns an empty string if the root itself was skipped (see DumpOptions::skip_invalid).
    std::string dump(NodeId root);

    const DumpOptions& options() const { return options_; }
    const Schema& schema() const { return schema_; }

    /// Warnings about skipped values are reported here.
    Diagnostics& diag() { return diag_; }
    const Diagnostics& diag() const { return diag_; }

private:
    // A value after type detection. The tag is empty if no type matched and "?" if an implicit
    // type matched. `text` is set if the type represented the value as a string.
    struct TypedValue {
        std::string tag;
        std::optional<std::string> text;
    };

    using Entry = std::pair<std::string, NodeId>;

    // Index in a sequence or key in a mapping.
    using PathSegment = std::variant<size_t, std::string_view>;

    // Renders the node. Returns an empty optional if the node was skipped.
    std::optional<std::string>
    stringify_node(int level, NodeId id, bool block, bool compact, bool is_key);

    std::string block_sequence(const Node::Sequence& seq, int level, bool compact);
    std::string flow_sequence(const Node::Sequence& seq, int level);
    std::string block_mapping(const Node::Mapping& map, bool explicit_tag, int level, bool compact);
    std::string flow_mapping(const Node::Mapping& map, int level);

    std::optional<TypedValue> detect_type(const Node& node, bool explicit_types) const;
    const std::string& style_for(const Type& type) const;

    // Returns the entries of the mapping in output order.
    std::vector<const Entry*> sorted_entries(const Node::Mapping& map) const;

    std::string next_line(int level) const;
    std::string current_path() const;

private:
    const Document& doc_;
    DumpOptions options_;
    const Schema& schema_;
    StyleMap styles_;
    ScalarEncoder scalar_;
    DuplicateTracker duplicates_;
    Diagnostics diag_;
    std::vector<PathSegment> path_;
    u32 depth_ = 0;
};

/// Renders the tree below `root` as yaml text, see Dumper::dump().
/// Warnings are appended to `diag` if it is not null.
std::string stringify(const Document& doc, NodeId root, const DumpOptions& options = {},
    Diagnostics* diag = nullptr);

} // namespace scribe

#endif // SCRIBE_DUMP_DUMPER_HPP
