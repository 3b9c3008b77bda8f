#ifndef IMAGINE_UTIL_ERRORS
#define IMAGINE_UTIL_ERRORS

#include <imagine/imagine_export.h>

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace imagine {

    /**
     * Base of all errors raised by the engine itself. Errors raised by a wrapped computation are never
     * converted into this type, they propagate to the caller unchanged.
     */
    struct IMAGINE_EXPORT ImagineError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    /**
     * Raised by exit() when balance checking is enabled and the activation being released is not the most
     * recently entered one for its target. The prior chain has already been restored when this is thrown.
     */
    struct IMAGINE_EXPORT UnbalancedActivationError : ImagineError {
        using ImagineError::ImagineError;
    };

    template<typename Error = std::runtime_error, typename... Ts>
        requires (!std::constructible_from<Error, std::string>)
    [[noreturn]] constexpr auto throw_error(Ts&&... args) {
        throw Error{std::forward<Ts>(args)...};
    }

    // Overload (I) - takes error msg and appends source location info
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] constexpr auto throw_error(
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
    [[noreturn]] constexpr auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

} // namespace imagine

#endif // IMAGINE_UTIL_ERRORS
