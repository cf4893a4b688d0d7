#ifndef SCRIBE_DUMP_DIAGNOSTICS_HPP
#define SCRIBE_DUMP_DIAGNOSTICS_HPP

#include <fmt/format.h>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace scribe {

/// Gathers the warnings produced while dumping a document, e.g. for values
/// that were skipped because they cannot be represented.
class Diagnostics final {
public:
    struct Message {
        /// Location of the affected value in the document, e.g. `$.servers[2].port`.
        std::string path;
        std::string text;

        Message() = default;

        Message(std::string path_, std::string text_)
            : path(std::move(path_))
            , text(std::move(text_)) {}
    };

public:
    /// True iff no warnings have been reported through this instance.
    bool empty() const { return messages_.empty(); }

    /// Number of warnings.
    size_t warning_count() const { return messages_.size(); }

    /// All warnings (in insertion order).
    const std::vector<Message>& messages() const { return messages_; }

    /// Report a warning for the value at the given path.
    void report(std::string path, std::string text);

    void vreport(std::string path, std::string_view format_string, fmt::format_args format_args);

    /// Report a warning for the value at the given path, with fmt::format syntax.
    template<typename... Args>
    void reportf(std::string path, std::string_view format_string, const Args&... format_args) {
        vreport(std::move(path), format_string, fmt::make_format_args(format_args...));
    }

    /// Appends all warnings of `other` to this instance.
    void merge(const Diagnostics& other);

    /// Removes all warnings.
    void clear();

private:
    std::vector<Message> messages_;
};

} // namespace scribe

#endif // SCRIBE_DUMP_DIAGNOSTICS_HPP
