#pragma once

/// @file safe_handler.hpp
/// @brief Error-translation boundary for handlers whose failures reach users.
///
/// safeHandle() runs a handler and guarantees that whatever it throws (or
/// returns as a GuardError) comes back as a GuardResult whose message went
/// through ErrorSanitizer. The original text is logged when it differs.

#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "bkg/foundation/guard_result.hpp"

namespace bkg::service {

namespace detail {

template <typename T>
struct SafeResult {
    using type = foundation::GuardResult<T>;
    static constexpr bool passthrough = false;
};

template <typename T>
struct SafeResult<bkg::Result<T, foundation::GuardError>> {
    using type = foundation::GuardResult<T>;
    static constexpr bool passthrough = true;
};

/// Sanitize an in-flight exception, logging the original if it differs.
[[nodiscard]] foundation::GuardError sanitizeCaught(std::string_view channel,
                                                    std::exception_ptr error);

/// Sanitize a returned error, keeping its code and context.
[[nodiscard]] foundation::GuardError sanitizeReturned(std::string_view channel,
                                                      const foundation::GuardError& error);

} // namespace detail

/// Invoke @p handler with @p args behind the sanitizing boundary.
///
/// - A plain return value `T` becomes `GuardResult<T>::ok`.
/// - A returned `GuardResult<T>` is forwarded; its error message is sanitized.
/// - Any exception becomes ErrorCode::OperationFailed with a sanitized message.
///
/// Example:
/// @code
///   auto stats = safeHandle("db:getStats", [&] { return db.stats(); });
///   if (!stats) {
///       reply.error = std::string(stats.error().message());
///   }
/// @endcode
template <typename Fn, typename... Args>
auto safeHandle(std::string_view channel, Fn&& handler, Args&&... args)
    -> typename detail::SafeResult<std::remove_cvref_t<std::invoke_result_t<Fn, Args...>>>::type {
    using R = std::remove_cvref_t<std::invoke_result_t<Fn, Args...>>;
    using Traits = detail::SafeResult<R>;
    using Out = typename Traits::type;

    try {
        if constexpr (Traits::passthrough) {
            auto result = std::invoke(std::forward<Fn>(handler), std::forward<Args>(args)...);
            if (result) {
                return result;
            }
            return Out::err(detail::sanitizeReturned(channel, result.error()));
        } else if constexpr (std::is_void_v<R>) {
            std::invoke(std::forward<Fn>(handler), std::forward<Args>(args)...);
            return Out::ok();
        } else {
            return Out::ok(std::invoke(std::forward<Fn>(handler), std::forward<Args>(args)...));
        }
    } catch (...) {
        return Out::err(detail::sanitizeCaught(channel, std::current_exception()));
    }
}

} // namespace bkg::service
