#pragma once

/// @file rate_limiter.hpp
/// @brief Sliding-window rate limiter for a single subject.
///
/// Keeps the timestamps of accepted requests that are still inside the
/// window. Expired entries are pruned lazily on every call, so an idle
/// limiter costs nothing and no timer has to be cancelled.

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>

#include "bkg/foundation/guard_result.hpp"

namespace bkg::security {

/// Immutable limits of one RateLimiter.
struct RateLimiterConfig {
    /// Requests admitted per window. Must be positive.
    uint32_t maxRequests = 10;

    /// Length of the sliding window. Must be positive.
    std::chrono::milliseconds window{60000};
};

/// Sliding-window limiter for one subject (a route, user or resource key).
///
/// Every stored timestamp t satisfies `now - t < window`. Thread-safe: each
/// operation prunes and decides under one per-instance lock.
///
/// Example:
/// @code
///   auto created = RateLimiter::create({.maxRequests = 5,
///                                       .window = std::chrono::minutes{1}});
///   auto& limiter = *created.value();
///   if (!limiter.canMakeRequest()) {
///       retryAfter(limiter.getResetTime());
///   }
/// @endcode
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    /// Create a limiter, rejecting a zero request count or non-positive window
    /// with ErrorCode::InvalidArgument.
    [[nodiscard]] static foundation::GuardResult<std::unique_ptr<RateLimiter>>
    create(RateLimiterConfig config);

    /// Check limits without constructing anything.
    [[nodiscard]] static foundation::GuardResult<void>
    validateConfig(const RateLimiterConfig& config);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Record a request if the window has room.
    /// @return true if admitted; false leaves the window unchanged.
    [[nodiscard]] bool canMakeRequest();
    [[nodiscard]] bool canMakeRequest(TimePoint now);

    /// Requests still admissible in the current window. Never negative.
    [[nodiscard]] uint32_t getRemainingRequests();
    [[nodiscard]] uint32_t getRemainingRequests(TimePoint now);

    /// Time until the oldest retained request leaves the window, within
    /// [0, window]. Zero when nothing is retained.
    [[nodiscard]] std::chrono::milliseconds getResetTime();
    [[nodiscard]] std::chrono::milliseconds getResetTime(TimePoint now);

    /// Forget all recorded requests.
    void reset();

    [[nodiscard]] const RateLimiterConfig& config() const noexcept { return config_; }

private:
    explicit RateLimiter(RateLimiterConfig config);

    // Callers hold mutex_.
    bool admit(TimePoint now);
    uint32_t remaining(TimePoint now);
    std::chrono::milliseconds resetTime(TimePoint now);
    void purgeExpired(TimePoint now);

    const RateLimiterConfig config_;
    mutable std::mutex mutex_;
    std::deque<TimePoint> timestamps_;
};

} // namespace bkg::security
