#include "model/document.hpp"

#include "common/error.hpp"

namespace scribe {

Document::Document() {}

Document::~Document() {}

NodeId Document::make_null() {
    return add(Node::Null());
}

NodeId Document::make_bool(bool value) {
    return add(Node::Boolean{value});
}

NodeId Document::make_int(i64 value) {
    return add(Node::Integer{value});
}

NodeId Document::make_float(f64 value) {
    return add(Node::Float{value});
}

NodeId Document::make_string(std::string value) {
    return add(Node::String{std::move(value)});
}

NodeId Document::make_binary(std::vector<byte> data) {
    return add(Node::Binary{std::move(data)});
}

NodeId Document::make_timestamp(std::chrono::system_clock::time_point value) {
    return add(Node::Timestamp{value});
}

NodeId Document::make_sequence(std::vector<NodeId> items) {
    for (const auto& item : items)
        check_child(item);
    return add(Node::Sequence{std::move(items)});
}

NodeId Document::make_mapping() {
    return add(Node::Mapping());
}

NodeId Document::make_tagged(std::string tag, NodeId value) {
    SCRIBE_CHECK_WITH_CODE(!tag.empty(), SCRIBE_ERROR_BAD_ARG, "Tags must not be empty.");
    check_child(value);
    SCRIBE_CHECK_WITH_CODE(nodes_[value].kind() != NodeKind::Tagged, SCRIBE_ERROR_BAD_ARG,
        "Tagged values cannot be tagged again.");
    return add(Node::Tagged{std::move(tag), value});
}

NodeId Document::make_undefined() {
    return add(Node::Undefined());
}

void Document::append(NodeId sequence, NodeId item) {
    check_child(item);
    node(sequence).as_sequence().items.push_back(item);
}

void Document::set(NodeId mapping, std::string key, NodeId value) {
    check_child(value);

    auto& entries = node(mapping).as_mapping();
    if (auto index = entries.find(key)) {
        entries.entries[*index].second = value;
        return;
    }
    entries.entries.emplace_back(std::move(key), value);
}

std::optional<NodeId> Document::get(NodeId mapping, std::string_view key) const {
    const auto& entries = (*this)[mapping].as_mapping();
    if (auto index = entries.find(key))
        return entries.entries[*index].second;
    return {};
}

const Node& Document::operator[](NodeId id) const {
    SCRIBE_CHECK_WITH_CODE(
        nodes_.in_bounds(id), SCRIBE_ERROR_BAD_ARG, "{} does not belong to this document.", id);
    return nodes_[id];
}

NodeId Document::add(Node::Storage storage) {
    return nodes_.emplace_back(std::move(storage));
}

Node& Document::node(NodeId id) {
    SCRIBE_CHECK_WITH_CODE(
        nodes_.in_bounds(id), SCRIBE_ERROR_BAD_ARG, "{} does not belong to this document.", id);
    return nodes_[id];
}

void Document::check_child(NodeId child) const {
    SCRIBE_CHECK_WITH_CODE(nodes_.in_bounds(child), SCRIBE_ERROR_BAD_ARG,
        "Child {} does not belong to this document.", child);
}

} // namespace scribe
