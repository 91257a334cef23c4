#ifndef TXSYNC_UTIL_ERRORS
#define TXSYNC_UTIL_ERRORS

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace txsync {

    // Overload (I) - takes error msg and appends source location info
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] void throw_error(
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        throw Error{fmt::format(
            "{}\nFile: {}({}:{}): {}", msg,
            loc.file_name(), loc.line(), loc.column(), loc.function_name()
        )};
    }

    // Overload (II) - direct formatting of error msg from args
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] void throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

} // namespace txsync

#endif // TXSYNC_UTIL_ERRORS
