#include "schema/types.hpp"

#include "common/defs.hpp"

#include <absl/strings/escaping.h>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <ctime>
#include <regex>

namespace scribe {

static bool resolve_timestamp(std::string_view data) {
    static const std::regex date_pattern(R"([0-9][0-9][0-9][0-9]-[0-9][0-9]-[0-9][0-9])");
    static const std::regex timestamp_pattern(
        R"([0-9][0-9][0-9][0-9]-[0-9][0-9]?-[0-9][0-9]?)" // date
        R"((?:[Tt]|[ \t]+))"                              // separator
        R"([0-9][0-9]?:[0-9][0-9]:[0-9][0-9](?:\.[0-9]*)?)" // time
        R"((?:[ \t]*(?:Z|[-+][0-9][0-9]?(?::[0-9][0-9])?))?)"); // time zone

    return std::regex_match(data.begin(), data.end(), date_pattern)
           || std::regex_match(data.begin(), data.end(), timestamp_pattern);
}

// Formats as `YYYY-MM-DDTHH:MM:SS.mmmZ` (UTC, millisecond precision).
static std::string represent_timestamp(const Node& node, std::string_view) {
    using namespace std::chrono;

    const auto millis = floor<milliseconds>(node.as_timestamp().value).time_since_epoch();
    const auto secs = floor<seconds>(millis);
    const auto rest = (millis - secs).count();

    const std::tm time = fmt::gmtime(static_cast<std::time_t>(secs.count()));
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", time, rest);
}

// Standard base64 with `=` padding and without line breaks.
static std::string represent_binary(const Node& node, std::string_view) {
    const auto& data = node.as_binary().data;
    return absl::Base64Escape(
        absl::string_view(reinterpret_cast<const char*>(data.data()), data.size()));
}

Type timestamp_type() {
    Type type;
    type.tag = std::string(yaml_tag_prefix) + "timestamp";
    type.resolve = resolve_timestamp;
    type.predicate = [](const Node& node) { return node.kind() == NodeKind::Timestamp; };
    type.represent = RepresentFunction(represent_timestamp);
    return type;
}

Type merge_type() {
    Type type;
    type.tag = std::string(yaml_tag_prefix) + "merge";
    type.resolve = [](std::string_view data) { return data == "<<"; };
    return type;
}

Type binary_type() {
    Type type;
    type.tag = std::string(yaml_tag_prefix) + "binary";
    type.predicate = [](const Node& node) { return node.kind() == NodeKind::Binary; };
    type.represent = RepresentFunction(represent_binary);
    return type;
}

} // namespace scribe
