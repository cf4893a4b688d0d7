#include "schema/types.hpp"

#include "common/defs.hpp"

#include <fmt/format.h>

#include <cmath>
#include <regex>

namespace scribe {

static std::string tag_name(std::string_view name) {
    std::string tag(yaml_tag_prefix);
    tag.append(name);
    return tag;
}

static bool is_dec_digit(char c) {
    return c >= '0' && c <= '9';
}

static bool is_oct_digit(char c) {
    return c >= '0' && c <= '7';
}

static bool is_hex_digit(char c) {
    return is_dec_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

// Digits (with optional `_` separators) starting at `index`. Must contain
// at least one digit and must not end with a separator.
template<typename DigitPred>
static bool resolve_digits(std::string_view data, size_t index, DigitPred&& is_digit) {
    bool has_digits = false;
    char ch = 0;
    for (; index < data.size(); ++index) {
        ch = data[index];
        if (ch == '_')
            continue;
        if (!is_digit(ch))
            return false;
        has_digits = true;
    }
    return has_digits && ch != '_';
}

static bool resolve_null(std::string_view data) {
    return data == "~" || data == "null" || data == "Null" || data == "NULL";
}

static bool resolve_bool(std::string_view data) {
    return data == "true" || data == "True" || data == "TRUE" || data == "false"
           || data == "False" || data == "FALSE";
}

static bool resolve_int(std::string_view data) {
    const size_t max = data.size();
    if (max == 0)
        return false;

    size_t index = 0;
    char ch = data[index];
    if (ch == '-' || ch == '+') {
        if (++index == max)
            return false;
        ch = data[index];
    }

    if (ch == '0') {
        if (index + 1 == max)
            return true;

        ch = data[++index];
        if (ch == 'b')
            return resolve_digits(data, index + 1, [](char c) { return c == '0' || c == '1'; });
        if (ch == 'x')
            return resolve_digits(data, index + 1, is_hex_digit);
        return resolve_digits(data, index, is_oct_digit);
    }

    // Decimal or base 60. Must not start with a separator.
    if (ch == '_')
        return false;

    bool has_digits = false;
    for (; index < max; ++index) {
        ch = data[index];
        if (ch == '_')
            continue;
        if (ch == ':')
            break;
        if (!is_dec_digit(ch))
            return false;
        has_digits = true;
    }

    if (!has_digits || ch == '_')
        return false;
    if (ch != ':')
        return true;

    static const std::regex base60_tail(R"((:[0-5]?[0-9])+)");
    return std::regex_match(data.begin() + index, data.end(), base60_tail);
}

static bool resolve_float(std::string_view data) {
    static const std::regex float_pattern(
        // 2.5e4, 2.5 and integers
        R"((?:[-+]?(?:0|[1-9][0-9_]*)(?:\.[0-9_]*)?(?:[eE][-+]?[0-9]+)?)"
        // .2e4, .2
        R"(|\.[0-9_]+(?:[eE][-+]?[0-9]+)?)"
        // 20:59
        R"(|[-+]?[0-9][0-9_]*(?::[0-5]?[0-9])+\.[0-9_]*)"
        // .inf
        R"(|[-+]?\.(?:inf|Inf|INF))"
        // .nan
        R"(|\.(?:nan|NaN|NAN)))");

    if (data.empty() || data.back() == '_')
        return false;
    return std::regex_match(data.begin(), data.end(), float_pattern);
}

// Absolute value of `value` without overflow for the minimum integer.
static u64 magnitude(i64 value) {
    return value < 0 ? u64(0) - static_cast<u64>(value) : static_cast<u64>(value);
}

static std::string_view sign(i64 value) {
    return value < 0 ? "-" : "";
}

static std::string represent_float(const Node& node, std::string_view style) {
    const f64 value = node.as_float();

    if (std::isnan(value)) {
        if (style == "uppercase")
            return ".NAN";
        if (style == "camelcase")
            return ".NaN";
        return ".nan";
    }

    if (std::isinf(value)) {
        std::string result = value < 0 ? "-" : "";
        if (style == "uppercase") {
            result += ".INF";
        } else if (style == "camelcase") {
            result += ".Inf";
        } else {
            result += ".inf";
        }
        return result;
    }

    if (value == 0 && std::signbit(value))
        return "-0.0";

    // Shortest representation that reads back as the same double, e.g. "1.5", "100" or "1e+21".
    std::string result = fmt::format("{}", value);
    if (result.find_first_not_of("-0123456789") == std::string::npos) {
        // Integral values would be read back as integers.
        result += ".0";
    } else if (auto exp = result.find('e');
               exp != std::string::npos && result.find('.') == std::string::npos) {
        // "1e+21" is not a float in yaml 1.1, "1.e+21" is.
        result.insert(exp, ".");
    }
    return result;
}

Type null_type() {
    Type type;
    type.tag = tag_name("null");
    type.resolve = resolve_null;
    type.predicate = [](const Node& node) { return node.kind() == NodeKind::Null; };
    type.represent = StyleTable{
        {"canonical", [](const Node&, std::string_view) { return std::string("~"); }},
        {"lowercase", [](const Node&, std::string_view) { return std::string("null"); }},
        {"uppercase", [](const Node&, std::string_view) { return std::string("NULL"); }},
        {"camelcase", [](const Node&, std::string_view) { return std::string("Null"); }},
    };
    type.default_style = "lowercase";
    return type;
}

Type bool_type() {
    Type type;
    type.tag = tag_name("bool");
    type.resolve = resolve_bool;
    type.predicate = [](const Node& node) { return node.kind() == NodeKind::Boolean; };
    type.represent = StyleTable{
        {"lowercase",
            [](const Node& node, std::string_view) {
                return std::string(node.as_bool() ? "true" : "false");
            }},
        {"uppercase",
            [](const Node& node, std::string_view) {
                return std::string(node.as_bool() ? "TRUE" : "FALSE");
            }},
        {"camelcase",
            [](const Node& node, std::string_view) {
                return std::string(node.as_bool() ? "True" : "False");
            }},
    };
    type.default_style = "lowercase";
    return type;
}

Type int_type() {
    Type type;
    type.tag = tag_name("int");
    type.resolve = resolve_int;
    type.predicate = [](const Node& node) { return node.kind() == NodeKind::Integer; };
    type.represent = StyleTable{
        {"binary",
            [](const Node& node, std::string_view) {
                const i64 value = node.as_int();
                return fmt::format("{}0b{:b}", sign(value), magnitude(value));
            }},
        {"octal",
            [](const Node& node, std::string_view) {
                const i64 value = node.as_int();
                return fmt::format("{}0{:o}", sign(value), magnitude(value));
            }},
        {"decimal",
            [](const Node& node, std::string_view) { return fmt::format("{}", node.as_int()); }},
        {"hexadecimal",
            [](const Node& node, std::string_view) {
                const i64 value = node.as_int();
                return fmt::format("{}0x{:X}", sign(value), magnitude(value));
            }},
    };
    type.default_style = "decimal";
    return type;
}

Type float_type() {
    Type type;
    type.tag = tag_name("float");
    type.resolve = resolve_float;
    type.predicate = [](const Node& node) { return node.kind() == NodeKind::Float; };
    type.represent = RepresentFunction(represent_float);
    type.default_style = "lowercase";
    return type;
}

} // namespace scribe
