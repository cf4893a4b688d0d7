#ifndef SCRIBE_COMMON_OVERLOADED_HPP
#define SCRIBE_COMMON_OVERLOADED_HPP

namespace scribe {

/// Constructs a class composed of lambda expressions, where each
/// lambda takes place in the overload resolution. Used for ad-hoc
/// std::visit() visitors.
///
///      auto visitor = Overloaded{
///          [](int i) { ... },
///          [](double d) { ... }
///      };
template<class... Functions>
struct Overloaded : Functions... {
    using Functions::operator()...;
};

template<class... Functions>
Overloaded(Functions...) -> Overloaded<Functions...>;

} // namespace scribe

#endif // SCRIBE_COMMON_OVERLOADED_HPP
