#pragma once

/// @file rate_limiter_registry.hpp
/// @brief Key -> RateLimiter map with atomic get-or-create.

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "bkg/foundation/guard_result.hpp"
#include "bkg/security/rate_limiter.hpp"

namespace bkg::security {

/// Owns one independently windowed RateLimiter per subject key.
///
/// Lookup and creation happen under a single lock, so concurrent first use
/// of a key can never produce two limiters for it. Limiters are handed out
/// as shared_ptr and stay valid for holders after remove().
///
/// The registry does not evict idle keys; its owner decides when to remove().
class RateLimiterRegistry {
public:
    explicit RateLimiterRegistry(RateLimiterConfig defaultConfig = {});

    /// Limiter for @p key, created with the default config on first use.
    [[nodiscard]] foundation::GuardResult<std::shared_ptr<RateLimiter>>
    getOrCreate(std::string_view key);

    /// Limiter for @p key, created with @p config on first use. An existing
    /// limiter keeps the config it was created with.
    [[nodiscard]] foundation::GuardResult<std::shared_ptr<RateLimiter>>
    getOrCreate(std::string_view key, const RateLimiterConfig& config);

    /// Existing limiter for @p key, or nullptr.
    [[nodiscard]] std::shared_ptr<RateLimiter> find(std::string_view key) const;

    /// Drop the limiter for @p key. Returns false if none was registered.
    bool remove(std::string_view key);

    [[nodiscard]] std::size_t size() const;

    void clear();

    [[nodiscard]] const RateLimiterConfig& defaultConfig() const noexcept {
        return defaultConfig_;
    }

private:
    RateLimiterConfig defaultConfig_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<RateLimiter>> limiters_;
};

} // namespace bkg::security
