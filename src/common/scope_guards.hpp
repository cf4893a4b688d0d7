#ifndef SCRIBE_COMMON_SCOPE_GUARDS_HPP
#define SCRIBE_COMMON_SCOPE_GUARDS_HPP

#include "common/defs.hpp"

#include <type_traits>
#include <utility>

namespace scribe {

/// Scope exit guards run unconditionally whenever they are destroyed.
/// The function must not throw, it may run during stack unwinding.
template<typename Func>
class ScopeExit final {
public:
    static_assert(std::is_nothrow_invocable_v<Func&>, "Scope exit functions must be noexcept.");

    ScopeExit(const Func& fn)
        : fn_(fn) {}

    ScopeExit(Func&& fn)
        : fn_(std::move(fn)) {}

    ~ScopeExit() { fn_(); }

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;

private:
    Func fn_;
};

template<typename Func>
ScopeExit(Func&&) -> ScopeExit<std::remove_cv_t<std::remove_reference_t<Func>>>;

} // namespace scribe

#endif // SCRIBE_COMMON_SCOPE_GUARDS_HPP
