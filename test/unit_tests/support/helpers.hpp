#ifndef SCRIBE_TEST_SUPPORT_HELPERS_HPP
#define SCRIBE_TEST_SUPPORT_HELPERS_HPP

#include "common/error.hpp"
#include "model/document.hpp"

#include <initializer_list>
#include <string>
#include <utility>

namespace scribe::test {

/// Runs the function and returns the code of the scribe::Error it throws,
/// or SCRIBE_OK if it does not throw.
template<typename Func>
scribe_errc_t error_code_of(Func&& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.code();
    }
    return SCRIBE_OK;
}

/// Creates a mapping with the given entries.
inline NodeId
make_map(Document& doc, std::initializer_list<std::pair<std::string, NodeId>> entries) {
    NodeId map = doc.make_mapping();
    for (const auto& [key, value] : entries)
        doc.set(map, key, value);
    return map;
}

} // namespace scribe::test

#endif // SCRIBE_TEST_SUPPORT_HELPERS_HPP
