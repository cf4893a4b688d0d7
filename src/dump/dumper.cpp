#include "dump/dumper.hpp"

#include "common/error.hpp"
#include "common/overloaded.hpp"
#include "common/scope_guards.hpp"
#include "common/text/unicode.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace scribe {

// Keys longer than this must use the explicit `? key` notation.
static constexpr size_t max_implicit_key_length = 1024;

static DumpOptions normalize(DumpOptions options) {
    validate(options);
    options.indent = std::max(1, options.indent);
    return options;
}

static bool starts_with_line_break(std::string_view str) {
    return !str.empty() && str.front() == '\n';
}

Dumper::Dumper(const Document& doc, DumpOptions options)
    : doc_(doc)
    , options_(normalize(std::move(options)))
    , schema_(options_.schema ? *options_.schema : default_schema())
    , styles_(compile_style_map(options_.styles))
    , scalar_(schema_, options_.indent, options_.line_width, options_.flow_level,
          options_.compat_mode) {}

Dumper::~Dumper() = default;

std::string Dumper::dump(NodeId root) {
    duplicates_.clear();
    if (options_.use_anchors)
        duplicates_.scan(doc_, root);

    path_.clear();
    depth_ = 0;

    auto result = stringify_node(0, root, true, true, false);
    duplicates_.reset_used();
    if (!result)
        return {};

    result->push_back('\n');
    return std::move(*result);
}

std::optional<std::string>
Dumper::stringify_node(int level, NodeId id, bool block, bool compact, bool is_key) {
    SCRIBE_CHECK_WITH_CODE(depth_ < options_.max_depth, SCRIBE_ERROR_TOO_DEEP,
        "Maximum nesting depth of {} exceeded at {}.", options_.max_depth, current_path());
    ++depth_;
    ScopeExit restore_depth = [&]() noexcept { --depth_; };

    NodeId value_id = id;
    const Node* node = &doc_[id];
    TypedValue typed;

    if (node->kind() == NodeKind::Tagged) {
        // Explicit tags bypass type detection. Scalars below the tag are still represented
        // by their type, but the tag of the node wins.
        const auto& tagged = node->as_tagged();
        value_id = tagged.value;
        node = &doc_[value_id];
        typed.tag = expand_tag(tagged.tag);

        if (!node->is_container() && node->kind() != NodeKind::String) {
            auto inner = detect_type(*node, false);
            if (!inner)
                inner = detect_type(*node, true);
            if (inner)
                typed.text = std::move(inner->text);
        }
    } else {
        auto detected = detect_type(*node, false);
        if (!detected)
            detected = detect_type(*node, true);
        if (detected)
            typed = std::move(*detected);
    }

    const bool implicit_type = typed.tag == "?";
    const bool explicit_tag = !typed.tag.empty() && !implicit_type;

    if (block)
        block = options_.flow_level < 0 || options_.flow_level > level;

    const NodeKind kind = node->kind();
    const bool is_collection = !typed.text
                               && (kind == NodeKind::Sequence || kind == NodeKind::Mapping);
    const auto anchor = is_collection ? duplicates_.anchor(value_id) : std::nullopt;

    if (explicit_tag || anchor || (options_.indent != 2 && level > 0))
        compact = false;

    if (anchor) {
        if (duplicates_.is_used(value_id))
            return fmt::format("*ref_{}", *anchor);
        duplicates_.mark_used(value_id);
    }

    std::string result;
    if (typed.text) {
        result = implicit_type ? std::move(*typed.text)
                               : scalar_.encode(*typed.text, level, is_key, !block);
    } else {
        switch (kind) {
        case NodeKind::Mapping: {
            const auto& map = node->as_mapping();
            if (block && !map.entries.empty()) {
                result = block_mapping(map, explicit_tag, level, compact);
                if (anchor)
                    result = fmt::format("&ref_{}{}", *anchor, result);
            } else {
                result = flow_mapping(map, level);
                if (anchor)
                    result = fmt::format("&ref_{} {}", *anchor, result);
            }
            break;
        }
        case NodeKind::Sequence: {
            const auto& seq = node->as_sequence();
            const int seq_level = !options_.array_indent && level > 0 ? level - 1 : level;
            if (block && !seq.items.empty()) {
                result = block_sequence(seq, seq_level, compact);
                if (anchor)
                    result = fmt::format("&ref_{}{}", *anchor, result);
            } else {
                result = flow_sequence(seq, seq_level);
                if (anchor)
                    result = fmt::format("&ref_{} {}", *anchor, result);
            }
            break;
        }
        case NodeKind::String:
            result = implicit_type ? node->as_string()
                                   : scalar_.encode(node->as_string(), level, is_key, !block);
            break;
        default:
            if (options_.skip_invalid) {
                diag_.reportf(current_path(), "Skipped value of unsupported kind {}.", kind);
                return {};
            }
            SCRIBE_ERROR_WITH_CODE(
                SCRIBE_ERROR_BAD_VALUE, "unacceptable kind of an object to dump {}", kind);
        }
    }

    if (explicit_tag)
        result = fmt::format("!<{}> {}", typed.tag, result);
    return result;
}

std::string Dumper::block_sequence(const Node::Sequence& seq, int level, bool compact) {
    std::string result;
    bool first = true;
    for (size_t i = 0, n = seq.items.size(); i < n; ++i) {
        path_.push_back(i);
        ScopeExit pop_path = [&]() noexcept { path_.pop_back(); };

        auto item = stringify_node(level + 1, seq.items[i], true, true, false);
        if (!item)
            continue;

        if (!compact || !first)
            result += next_line(level);
        result += starts_with_line_break(*item) ? "-" : "- ";
        result += *item;
        first = false;
    }
    return result.empty() ? "[]" : result;
}

std::string Dumper::flow_sequence(const Node::Sequence& seq, int level) {
    std::string result = "[";
    bool first = true;
    for (size_t i = 0, n = seq.items.size(); i < n; ++i) {
        path_.push_back(i);
        ScopeExit pop_path = [&]() noexcept { path_.pop_back(); };

        auto item = stringify_node(level, seq.items[i], false, false, false);
        if (!item)
            continue;

        if (!first)
            result += options_.condense_flow ? "," : ", ";
        result += *item;
        first = false;
    }
    result += "]";
    return result;
}

std::string
Dumper::block_mapping(const Node::Mapping& map, bool explicit_tag, int level, bool compact) {
    std::string result;
    bool first = true;
    for (const Entry* entry : sorted_entries(map)) {
        const auto& [key, value] = *entry;
        path_.push_back(std::string_view(key));
        ScopeExit pop_path = [&]() noexcept { path_.pop_back(); };

        const std::string key_text = scalar_.encode(key, level + 1, true);
        const bool explicit_pair = explicit_tag || utf8_length(key_text) > max_implicit_key_length;

        std::string pair;
        if (!compact || !first)
            pair += next_line(level);

        if (explicit_pair)
            pair += starts_with_line_break(key_text) ? "?" : "? ";
        pair += key_text;
        if (explicit_pair)
            pair += next_line(level);

        // The value is only compact after an explicit `? key` line.
        auto value_text = stringify_node(level + 1, value, true, explicit_pair, false);
        if (!value_text)
            continue;

        pair += starts_with_line_break(*value_text) ? ":" : ": ";
        pair += *value_text;

        result += pair;
        first = false;
    }
    return result.empty() ? "{}" : result;
}

std::string Dumper::flow_mapping(const Node::Mapping& map, int level) {
    const bool condense = options_.condense_flow;

    // Flow mappings keep their insertion order, `sort_keys` only applies to block mappings.
    std::string result = "{";
    bool first = true;
    for (const auto& [key, value] : map.entries) {
        path_.push_back(std::string_view(key));
        ScopeExit pop_path = [&]() noexcept { path_.pop_back(); };

        // Condensed pairs have no space after the `:`, which is only valid after a quoted key.
        const std::string key_text = condense
                                         ? "\"" + escape_double_quoted(decode_utf8(key)) + "\""
                                         : scalar_.encode(key, level, false, true);

        auto value_text = stringify_node(level, value, false, false, false);
        if (!value_text)
            continue;

        if (!first)
            result += condense ? "," : ", ";
        if (utf8_length(key_text) > max_implicit_key_length)
            result += "? ";
        result += key_text;
        result += condense ? ":" : ": ";
        result += *value_text;
        first = false;
    }
    result += "}";
    return result;
}

std::optional<Dumper::TypedValue> Dumper::detect_type(const Node& node, bool explicit_types) const {
    const auto& types = explicit_types ? schema_.explicit_types() : schema_.implicit_types();
    for (const Type& type : types) {
        if (!type.matches(node))
            continue;

        TypedValue result;
        result.tag = explicit_types ? type.tag : "?";

        const std::string& style = style_for(type);
        if (const RepresentFunction* represent = type.representer(style))
            result.text = (*represent)(node, style);
        return result;
    }
    return {};
}

const std::string& Dumper::style_for(const Type& type) const {
    if (auto pos = styles_.find(type.tag); pos != styles_.end())
        return pos->second;
    return type.default_style;
}

std::vector<const Dumper::Entry*> Dumper::sorted_entries(const Node::Mapping& map) const {
    std::vector<const Entry*> entries;
    entries.reserve(map.entries.size());
    for (const auto& entry : map.entries)
        entries.push_back(&entry);

    switch (options_.sort_keys) {
    case KeyOrder::Insertion:
        break;
    case KeyOrder::Lexicographic:
        std::stable_sort(entries.begin(), entries.end(),
            [](const Entry* a, const Entry* b) { return a->first < b->first; });
        break;
    case KeyOrder::Custom:
        std::stable_sort(entries.begin(), entries.end(), [&](const Entry* a, const Entry* b) {
            return options_.key_comparator(a->first, b->first) < 0;
        });
        break;
    }
    return entries;
}

std::string Dumper::next_line(int level) const {
    std::string result = "\n";
    result.append(static_cast<size_t>(options_.indent * level), ' ');
    return result;
}

std::string Dumper::current_path() const {
    std::string result = "$";
    for (const auto& segment : path_) {
        std::visit(Overloaded{
                       [&](size_t index) {
                           fmt::format_to(std::back_inserter(result), "[{}]", index);
                       },
                       [&](std::string_view key) {
                           result += '.';
                           result += key;
                       },
                   },
            segment);
    }
    return result;
}

std::string
stringify(const Document& doc, NodeId root, const DumpOptions& options, Diagnostics* diag) {
    Dumper dumper(doc, options);
    std::string result = dumper.dump(root);
    if (diag)
        diag->merge(dumper.diag());
    return result;
}

} // namespace scribe
