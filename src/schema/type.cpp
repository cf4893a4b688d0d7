#include "schema/type.hpp"

#include "common/error.hpp"
#include "common/overloaded.hpp"

namespace scribe {

std::string expand_tag(std::string_view tag) {
    if (tag.substr(0, 2) == "!!") {
        std::string result(yaml_tag_prefix);
        result.append(tag.substr(2));
        return result;
    }
    return std::string(tag);
}

const RepresentFunction* Type::representer(std::string_view style) const {
    return std::visit(
        Overloaded{
            [](const std::monostate&) -> const RepresentFunction* { return nullptr; },
            [](const RepresentFunction& fn) -> const RepresentFunction* { return &fn; },
            [&](const StyleTable& table) -> const RepresentFunction* {
                if (auto pos = table.find(std::string(style)); pos != table.end())
                    return &pos->second;

                SCRIBE_ERROR_WITH_CODE(SCRIBE_ERROR_BAD_CONFIG,
                    "!<{}> tag resolver accepts not \"{}\" style", tag, style);
            },
        },
        represent);
}

} // namespace scribe
