#ifndef SCRIBE_MODEL_DOCUMENT_HPP
#define SCRIBE_MODEL_DOCUMENT_HPP

#include "common/defs.hpp"
#include "common/entities/entity_storage.hpp"
#include "model/node.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scribe {

/// Owns a graph of nodes. Nodes are created through the `make_*` functions and are
/// never removed; their ids remain valid for the lifetime of the document.
///
/// Containers may reference the same node more than once and may even contain
/// themselves. The dumper detects such nodes and emits anchors and aliases for them.
class Document final {
public:
    Document();
    ~Document();

    Document(Document&&) noexcept = default;
    Document& operator=(Document&&) noexcept = default;

    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    NodeId make_null();
    NodeId make_bool(bool value);
    NodeId make_int(i64 value);
    NodeId make_float(f64 value);
    NodeId make_string(std::string value);
    NodeId make_binary(std::vector<byte> data);
    NodeId make_timestamp(std::chrono::system_clock::time_point value);
    NodeId make_sequence(std::vector<NodeId> items = {});
    NodeId make_mapping();
    NodeId make_tagged(std::string tag, NodeId value);
    NodeId make_undefined();

    /// Appends `item` to the end of the given sequence.
    void append(NodeId sequence, NodeId item);

    /// Associates `key` with `value` in the given mapping. If the key already exists,
    /// its value is replaced and the key keeps its position.
    void set(NodeId mapping, std::string key, NodeId value);

    /// Returns the value associated with `key`, or an empty optional.
    std::optional<NodeId> get(NodeId mapping, std::string_view key) const;

    /// Returns true if `id` refers to a node in this document.
    bool contains(NodeId id) const { return nodes_.in_bounds(id); }

    /// Returns the node with the given id. Throws if the id is invalid.
    const Node& operator[](NodeId id) const;

    /// Number of nodes in this document.
    size_t size() const { return nodes_.size(); }

private:
    NodeId add(Node::Storage storage);
    Node& node(NodeId id);
    void check_child(NodeId child) const;

private:
    EntityStorage<Node, NodeId> nodes_;
};

} // namespace scribe

#endif // SCRIBE_MODEL_DOCUMENT_HPP
