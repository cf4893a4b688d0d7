#include "dump/diagnostics.hpp"

namespace scribe {

void Diagnostics::report(std::string path, std::string text) {
    messages_.emplace_back(std::move(path), std::move(text));
}

void Diagnostics::vreport(
    std::string path, std::string_view format_string, fmt::format_args format_args) {
    report(std::move(path), fmt::vformat(format_string, format_args));
}

void Diagnostics::merge(const Diagnostics& other) {
    // Copy first, `other` may be this instance.
    const std::vector<Message> messages = other.messages_;
    messages_.insert(messages_.end(), messages.begin(), messages.end());
}

void Diagnostics::clear() {
    messages_.clear();
}

} // namespace scribe
