#ifndef SCRIBE_MODEL_NODE_HPP
#define SCRIBE_MODEL_NODE_HPP

#include "common/defs.hpp"
#include "common/entities/entity_id.hpp"
#include "common/format.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace scribe {

/// Identifies a node within its document. Node identity is id identity:
/// two ids refer to the same node if and only if they are equal.
SCRIBE_DEFINE_ENTITY_ID(NodeId)

/// Represents the kind of a node.
enum class NodeKind : u8 {
    Null,
    Boolean,
    Integer,
    Float,
    String,
    Binary,
    Timestamp,
    Sequence,
    Mapping,
    Tagged,
    Undefined,
};

std::string_view to_string(NodeKind kind);

/// Returns true if nodes of the given kind contain other nodes.
bool is_container(NodeKind kind);

/// A single value in a document.
///
/// Containers (sequences, mappings and tagged values) reference their children
/// by id. The children are owned by the document, so a node may be referenced
/// from any number of places.
class Node final {
public:
    struct Null final {};

    struct Boolean final {
        bool value = false;
    };

    struct Integer final {
        i64 value = 0;
    };

    struct Float final {
        f64 value = 0;
    };

    struct String final {
        std::string value;
    };

    struct Binary final {
        std::vector<byte> data;
    };

    struct Timestamp final {
        std::chrono::system_clock::time_point value;
    };

    struct Sequence final {
        std::vector<NodeId> items;
    };

    /// Key value pairs with unique keys, in insertion order.
    struct Mapping final {
        std::vector<std::pair<std::string, NodeId>> entries;

        /// Returns the index of the entry with the given key.
        std::optional<size_t> find(std::string_view key) const;
    };

    /// A value with an explicit tag, e.g. `!<tag:example.com,2024:point>`.
    struct Tagged final {
        std::string tag;
        NodeId value;
    };

    /// A value that has no representation (the built-in schemas cannot dump it).
    struct Undefined final {};

    using Storage = std::variant<Null, Boolean, Integer, Float, String, Binary, Timestamp,
        Sequence, Mapping, Tagged, Undefined>;

public:
    Node(Storage storage);

    NodeKind kind() const noexcept { return static_cast<NodeKind>(storage_.index()); }

    bool is_container() const noexcept { return scribe::is_container(kind()); }

    bool as_bool() const;
    i64 as_int() const;
    f64 as_float() const;
    const std::string& as_string() const;
    const Binary& as_binary() const;
    const Timestamp& as_timestamp() const;
    const Sequence& as_sequence() const;
    const Mapping& as_mapping() const;
    const Tagged& as_tagged() const;

    Sequence& as_sequence();
    Mapping& as_mapping();

    const Storage& storage() const noexcept { return storage_; }

    void format(FormatStream& stream) const;

private:
    template<typename T, typename Self>
    static auto& get(Self& self, NodeKind expected);

private:
    Storage storage_;
};

} // namespace scribe

SCRIBE_ENABLE_FREE_TO_STRING(scribe::NodeKind)
SCRIBE_ENABLE_MEMBER_FORMAT(scribe::Node)

#endif // SCRIBE_MODEL_NODE_HPP
