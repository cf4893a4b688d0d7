#ifndef SCRIBE_DUMP_DUPLICATES_HPP
#define SCRIBE_DUMP_DUPLICATES_HPP

#include "common/defs.hpp"
#include "model/document.hpp"

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>

#include <optional>

namespace scribe {

/// Finds the containers (sequences and mappings) that are reachable through more than one
/// path from the root. These nodes are rendered once with an anchor (`&ref_N`), all later
/// occurrences are rendered as aliases (`*ref_N`).
///
/// Membership is based on node identity, never on structural equality.
class DuplicateTracker final {
public:
    DuplicateTracker();
    ~DuplicateTracker();

    DuplicateTracker(DuplicateTracker&&) noexcept = default;
    DuplicateTracker& operator=(DuplicateTracker&&) noexcept = default;

    /// Walks the tree below `root` in pre-order and records every container that is seen
    /// more than once. Duplicates are not descended into again, which makes the walk
    /// terminate on cyclic documents. Duplicates are numbered in the order they are found.
    /// Previous results are discarded.
    void scan(const Document& doc, NodeId root);

    /// Returns the anchor number of the node if it is a duplicate.
    std::optional<u32> anchor(NodeId id) const;

    /// Returns true if the node is a duplicate.
    bool is_duplicate(NodeId id) const { return duplicates_.contains(id); }

    /// Number of duplicate nodes.
    size_t duplicate_count() const { return duplicates_.size(); }

    /// Returns true if the node has already been rendered (with its anchor).
    bool is_used(NodeId id) const { return used_.contains(id); }

    /// Marks the node as rendered. Later occurrences become aliases.
    void mark_used(NodeId id);

    /// Forgets which duplicates have been rendered.
    void reset_used();

    /// Removes all duplicates.
    void clear();

private:
    absl::flat_hash_map<NodeId, u32> duplicates_;
    absl::flat_hash_set<NodeId> used_;
};

} // namespace scribe

#endif // SCRIBE_DUMP_DUPLICATES_HPP
