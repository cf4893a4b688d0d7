#ifndef SCRIBE_COMMON_FORMAT_HPP
#define SCRIBE_COMMON_FORMAT_HPP

#include <fmt/format.h>

#include <string_view>
#include <type_traits>

/// Makes a type usable in fmt format strings.
///
/// SCRIBE_ENABLE_MEMBER_FORMAT(Type) calls `object.format(FormatStream&)`.
/// SCRIBE_ENABLE_FREE_TO_STRING(Type) calls `to_string(object)`, found via ADL.
///
/// The macros must be used at global scope or in namespace scribe.
#define SCRIBE_ENABLE_MEMBER_FORMAT(Type) \
    SCRIBE_ENABLE_FORMAT_MODE_IMPL(Type, ::scribe::FormatMode::MemberFormat)
#define SCRIBE_ENABLE_FREE_TO_STRING(Type) \
    SCRIBE_ENABLE_FORMAT_MODE_IMPL(Type, ::scribe::FormatMode::FreeToString)

#define SCRIBE_ENABLE_FORMAT_MODE_IMPL(Type, Mode)            \
    template<>                                                \
    struct scribe::EnableFormatMode<Type> {                   \
        static constexpr ::scribe::FormatMode value = (Mode); \
    };

namespace scribe {

enum class FormatMode { None, MemberFormat, FreeToString };

template<typename T, typename Enable = void>
struct EnableFormatMode {
    static constexpr FormatMode value = FormatMode::None;
};

/// Receives the output of `format()` member functions.
class FormatStream {
public:
    virtual ~FormatStream() = default;

    FormatStream(const FormatStream&) = delete;
    FormatStream& operator=(const FormatStream&) = delete;

    template<typename... Args>
    FormatStream& format(std::string_view format_str, const Args&... args) {
        do_vformat(format_str, fmt::make_format_args(args...));
        return *this;
    }

protected:
    FormatStream() = default;

    virtual void do_vformat(std::string_view format_str, fmt::format_args args) = 0;
};

/// Writes formatted output to an fmt output iterator.
template<typename OutputIt>
class IteratorFormatStream final : public FormatStream {
public:
    explicit IteratorFormatStream(OutputIt out)
        : out_(out) {}

    OutputIt out() const { return out_; }

private:
    void do_vformat(std::string_view format_str, fmt::format_args args) override {
        out_ = fmt::vformat_to(out_, format_str, args);
    }

private:
    OutputIt out_;
};

} // namespace scribe

template<typename T, typename Char>
struct fmt::formatter<T, Char,
    std::enable_if_t<scribe::EnableFormatMode<T>::value != scribe::FormatMode::None>> {

    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const T& value, FormatContext& ctx) const {
        if constexpr (scribe::EnableFormatMode<T>::value == scribe::FormatMode::MemberFormat) {
            scribe::IteratorFormatStream stream(ctx.out());
            value.format(stream);
            return stream.out();
        } else {
            return fmt::format_to(ctx.out(), "{}", to_string(value));
        }
    }
};

#endif // SCRIBE_COMMON_FORMAT_HPP
