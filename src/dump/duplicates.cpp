#include "dump/duplicates.hpp"

#include "common/error.hpp"

#include <vector>

namespace scribe {

DuplicateTracker::DuplicateTracker() = default;

DuplicateTracker::~DuplicateTracker() = default;

void DuplicateTracker::scan(const Document& doc, NodeId root) {
    clear();

    absl::flat_hash_set<NodeId> visited;
    std::vector<NodeId> stack;
    stack.push_back(root);

    // Children are pushed in reverse order so that they are visited from left to right.
    while (!stack.empty()) {
        const NodeId id = stack.back();
        stack.pop_back();

        const Node& node = doc[id];
        switch (node.kind()) {
        case NodeKind::Sequence: {
            if (!visited.insert(id).second) {
                duplicates_.try_emplace(id, static_cast<u32>(duplicates_.size()));
                break;
            }

            const auto& items = node.as_sequence().items;
            stack.insert(stack.end(), items.rbegin(), items.rend());
            break;
        }
        case NodeKind::Mapping: {
            if (!visited.insert(id).second) {
                duplicates_.try_emplace(id, static_cast<u32>(duplicates_.size()));
                break;
            }

            const auto& entries = node.as_mapping().entries;
            for (auto it = entries.rbegin(); it != entries.rend(); ++it)
                stack.push_back(it->second);
            break;
        }
        case NodeKind::Tagged:
            // Tags are attached to their value, the value is what gets anchored.
            stack.push_back(node.as_tagged().value);
            break;
        default:
            break;
        }
    }

    used_.clear();
}

std::optional<u32> DuplicateTracker::anchor(NodeId id) const {
    if (auto pos = duplicates_.find(id); pos != duplicates_.end())
        return pos->second;
    return {};
}

void DuplicateTracker::mark_used(NodeId id) {
    SCRIBE_CHECK(is_duplicate(id), "Node {} is not a duplicate.", id);
    used_.insert(id);
}

void DuplicateTracker::reset_used() {
    used_.clear();
}

void DuplicateTracker::clear() {
    duplicates_.clear();
    used_.clear();
}

} // namespace scribe
