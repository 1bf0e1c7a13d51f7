/// @file rate_limiter_registry.cpp
/// @brief RateLimiterRegistry implementation.

#include "bkg/security/rate_limiter_registry.hpp"

namespace bkg::security {

using foundation::GuardResult;

RateLimiterRegistry::RateLimiterRegistry(RateLimiterConfig defaultConfig)
    : defaultConfig_(defaultConfig) {}

GuardResult<std::shared_ptr<RateLimiter>> RateLimiterRegistry::getOrCreate(
    std::string_view key) {
    return getOrCreate(key, defaultConfig_);
}

GuardResult<std::shared_ptr<RateLimiter>> RateLimiterRegistry::getOrCreate(
    std::string_view key, const RateLimiterConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = limiters_.find(std::string(key));
    if (it != limiters_.end()) {
        return GuardResult<std::shared_ptr<RateLimiter>>::ok(it->second);
    }

    auto created = RateLimiter::create(config);
    if (!created) {
        return GuardResult<std::shared_ptr<RateLimiter>>::err(created.error());
    }

    std::shared_ptr<RateLimiter> limiter = std::move(created).value();
    limiters_.emplace(std::string(key), limiter);
    return GuardResult<std::shared_ptr<RateLimiter>>::ok(std::move(limiter));
}

std::shared_ptr<RateLimiter> RateLimiterRegistry::find(std::string_view key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = limiters_.find(std::string(key));
    return it != limiters_.end() ? it->second : nullptr;
}

bool RateLimiterRegistry::remove(std::string_view key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return limiters_.erase(std::string(key)) > 0;
}

std::size_t RateLimiterRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return limiters_.size();
}

void RateLimiterRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    limiters_.clear();
}

} // namespace bkg::security
