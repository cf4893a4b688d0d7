#include "model/node.hpp"

#include "common/error.hpp"
#include "common/overloaded.hpp"

namespace scribe {

static_assert(std::variant_size_v<Node::Storage> == static_cast<size_t>(NodeKind::Undefined) + 1,
    "Node kinds and node storage types must be kept in sync.");

std::string_view to_string(NodeKind kind) {
    switch (kind) {
#define SCRIBE_CASE(X) \
    case NodeKind::X:  \
        return #X;

        SCRIBE_CASE(Null)
        SCRIBE_CASE(Boolean)
        SCRIBE_CASE(Integer)
        SCRIBE_CASE(Float)
        SCRIBE_CASE(String)
        SCRIBE_CASE(Binary)
        SCRIBE_CASE(Timestamp)
        SCRIBE_CASE(Sequence)
        SCRIBE_CASE(Mapping)
        SCRIBE_CASE(Tagged)
        SCRIBE_CASE(Undefined)

#undef SCRIBE_CASE
    }
    SCRIBE_UNREACHABLE("Invalid node kind.");
}

bool is_container(NodeKind kind) {
    return kind == NodeKind::Sequence || kind == NodeKind::Mapping || kind == NodeKind::Tagged;
}

std::optional<size_t> Node::Mapping::find(std::string_view key) const {
    for (size_t i = 0, n = entries.size(); i < n; ++i) {
        if (entries[i].first == key)
            return i;
    }
    return {};
}

Node::Node(Storage storage)
    : storage_(std::move(storage)) {}

template<typename T, typename Self>
auto& Node::get(Self& self, NodeKind expected) {
    auto* value = std::get_if<T>(&self.storage_);
    SCRIBE_CHECK_WITH_CODE(value, SCRIBE_ERROR_BAD_ARG, "Expected a node of kind {}, got {}.",
        expected, self.kind());
    return *value;
}

bool Node::as_bool() const {
    return get<Boolean>(*this, NodeKind::Boolean).value;
}

i64 Node::as_int() const {
    return get<Integer>(*this, NodeKind::Integer).value;
}

f64 Node::as_float() const {
    return get<Float>(*this, NodeKind::Float).value;
}

const std::string& Node::as_string() const {
    return get<String>(*this, NodeKind::String).value;
}

const Node::Binary& Node::as_binary() const {
    return get<Binary>(*this, NodeKind::Binary);
}

const Node::Timestamp& Node::as_timestamp() const {
    return get<Timestamp>(*this, NodeKind::Timestamp);
}

const Node::Sequence& Node::as_sequence() const {
    return get<Sequence>(*this, NodeKind::Sequence);
}

const Node::Mapping& Node::as_mapping() const {
    return get<Mapping>(*this, NodeKind::Mapping);
}

const Node::Tagged& Node::as_tagged() const {
    return get<Tagged>(*this, NodeKind::Tagged);
}

Node::Sequence& Node::as_sequence() {
    return get<Sequence>(*this, NodeKind::Sequence);
}

Node::Mapping& Node::as_mapping() {
    return get<Mapping>(*this, NodeKind::Mapping);
}

void Node::format(FormatStream& stream) const {
    std::visit(Overloaded{
                   [&](const Null&) { stream.format("Null"); },
                   [&](const Boolean& b) { stream.format("Boolean({})", b.value); },
                   [&](const Integer& i) { stream.format("Integer({})", i.value); },
                   [&](const Float& f) { stream.format("Float({})", f.value); },
                   [&](const String& s) { stream.format("String(\"{}\")", s.value); },
                   [&](const Binary& b) { stream.format("Binary(size: {})", b.data.size()); },
                   [&](const Timestamp& t) {
                       auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                           t.value.time_since_epoch());
                       stream.format("Timestamp({}ms)", ms.count());
                   },
                   [&](const Sequence& s) { stream.format("Sequence(size: {})", s.items.size()); },
                   [&](const Mapping& m) { stream.format("Mapping(size: {})", m.entries.size()); },
                   [&](const Tagged& t) { stream.format("Tagged({}, {})", t.tag, t.value); },
                   [&](const Undefined&) { stream.format("Undefined"); },
               },
        storage_);
}

} // namespace scribe
