#include "dump/options.hpp"

#include "common/error.hpp"
#include "schema/type.hpp"

namespace scribe {

std::string_view to_string(KeyOrder order) {
    switch (order) {
    case KeyOrder::Insertion:
        return "Insertion";
    case KeyOrder::Lexicographic:
        return "Lexicographic";
    case KeyOrder::Custom:
        return "Custom";
    }
    return "Invalid";
}

void validate(const DumpOptions& options) {
    switch (options.sort_keys) {
    case KeyOrder::Insertion:
    case KeyOrder::Lexicographic:
        break;
    case KeyOrder::Custom:
        SCRIBE_CHECK_WITH_CODE(options.key_comparator, SCRIBE_ERROR_BAD_CONFIG,
            "sort_keys is Custom but no key comparator was provided.");
        break;
    default:
        SCRIBE_ERROR_WITH_CODE(SCRIBE_ERROR_BAD_CONFIG,
            "sort_keys must be Insertion, Lexicographic or Custom (got {}).",
            static_cast<int>(options.sort_keys));
    }

    for (const auto& [tag, style] : options.styles) {
        SCRIBE_CHECK_WITH_CODE(!tag.empty(), SCRIBE_ERROR_BAD_CONFIG,
            "Style overrides must not use an empty tag.");
    }
}

StyleMap compile_style_map(const StyleMap& styles) {
    StyleMap result;
    result.reserve(styles.size());
    for (const auto& [tag, style] : styles)
        result.insert_or_assign(expand_tag(tag), style);
    return result;
}

} // namespace scribe
