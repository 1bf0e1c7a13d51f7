/// @file rate_limiter.cpp
/// @brief Sliding-window RateLimiter implementation.

#include "bkg/security/rate_limiter.hpp"

#include <algorithm>
#include <string>

namespace bkg::security {

using foundation::ErrorCode;
using foundation::GuardError;
using foundation::GuardResult;

GuardResult<void> RateLimiter::validateConfig(const RateLimiterConfig& config) {
    if (config.maxRequests == 0) {
        return GuardResult<void>::err(
            GuardError(ErrorCode::InvalidArgument, "rate limiter maxRequests must be positive"));
    }
    if (config.window <= std::chrono::milliseconds::zero()) {
        return GuardResult<void>::err(
            GuardError(ErrorCode::InvalidArgument,
                       "rate limiter window must be positive, got " +
                           std::to_string(config.window.count()) + "ms"));
    }
    return GuardResult<void>::ok();
}

GuardResult<std::unique_ptr<RateLimiter>> RateLimiter::create(RateLimiterConfig config) {
    auto valid = validateConfig(config);
    if (!valid) {
        return GuardResult<std::unique_ptr<RateLimiter>>::err(valid.error());
    }
    return GuardResult<std::unique_ptr<RateLimiter>>::ok(
        std::unique_ptr<RateLimiter>(new RateLimiter(config)));
}

RateLimiter::RateLimiter(RateLimiterConfig config) : config_(config) {}

bool RateLimiter::canMakeRequest() {
    std::lock_guard<std::mutex> lock(mutex_);
    return admit(Clock::now());
}

bool RateLimiter::canMakeRequest(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return admit(now);
}

uint32_t RateLimiter::getRemainingRequests() {
    std::lock_guard<std::mutex> lock(mutex_);
    return remaining(Clock::now());
}

uint32_t RateLimiter::getRemainingRequests(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return remaining(now);
}

std::chrono::milliseconds RateLimiter::getResetTime() {
    std::lock_guard<std::mutex> lock(mutex_);
    return resetTime(Clock::now());
}

std::chrono::milliseconds RateLimiter::getResetTime(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return resetTime(now);
}

void RateLimiter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    timestamps_.clear();
}

bool RateLimiter::admit(TimePoint now) {
    purgeExpired(now);

    if (timestamps_.size() >= static_cast<std::size_t>(config_.maxRequests)) {
        return false;
    }

    // Callers may pass an earlier `now` than one already recorded; keep the
    // log oldest-first so front() stays the oldest entry.
    timestamps_.insert(std::upper_bound(timestamps_.begin(), timestamps_.end(), now), now);
    return true;
}

uint32_t RateLimiter::remaining(TimePoint now) {
    purgeExpired(now);

    auto used = static_cast<uint32_t>(timestamps_.size());
    return (used >= config_.maxRequests) ? 0u : (config_.maxRequests - used);
}

std::chrono::milliseconds RateLimiter::resetTime(TimePoint now) {
    purgeExpired(now);

    if (timestamps_.empty()) {
        return std::chrono::milliseconds::zero();
    }

    // Round up so a retained entry never reports a zero wait.
    auto left = std::chrono::ceil<std::chrono::milliseconds>(
        config_.window - (now - timestamps_.front()));
    return std::clamp(left, std::chrono::milliseconds::zero(), config_.window);
}

void RateLimiter::purgeExpired(TimePoint now) {
    while (!timestamps_.empty() && now - timestamps_.front() >= config_.window) {
        timestamps_.pop_front();
    }
}

} // namespace bkg::security
