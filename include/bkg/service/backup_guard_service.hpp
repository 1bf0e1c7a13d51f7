#pragma once

/// @file backup_guard_service.hpp
/// @brief Entry point used by backup handlers and API routes.
///
/// Combines the configured backup directory with PathGuard and a
/// per-(route, subject) RateLimiterRegistry. Failures carry only stable
/// message keys; details go to the log.

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "bkg/foundation/guard_result.hpp"
#include "bkg/security/rate_limiter_registry.hpp"
#include "bkg/service/guard_config.hpp"

namespace bkg::service {

/// Quota hint attached to RateLimited errors and returned by quota().
struct RetryHint {
    uint32_t remaining = 0;
    std::chrono::milliseconds retryAfter{0};
};

class BackupGuardService {
public:
    explicit BackupGuardService(GuardConfig config);

    BackupGuardService(const BackupGuardService&) = delete;
    BackupGuardService& operator=(const BackupGuardService&) = delete;

    /// Authorize a path before any backup write, restore or delete.
    ///
    /// @return The path as given, or InvalidBackupPath with message
    ///         "error.backup.invalidPath". The reason is logged, not returned.
    [[nodiscard]] foundation::GuardResult<std::string>
    authorizeBackupPath(std::string_view candidatePath) const;

    /// Consume one request for @p subject on @p route.
    ///
    /// @return RateLimited with message "error.rateLimit.exceeded" and a
    ///         RetryHint context when the window is full.
    [[nodiscard]] foundation::GuardResult<void>
    acquire(std::string_view route, std::string_view subject);

    /// Current quota for @p subject on @p route without consuming a request.
    [[nodiscard]] RetryHint quota(std::string_view route, std::string_view subject);

    /// Drop the limiter of one (route, subject) pair.
    bool forget(std::string_view route, std::string_view subject);

    [[nodiscard]] const GuardConfig& config() const noexcept { return config_; }

    [[nodiscard]] std::size_t trackedSubjects() const { return limiters_.size(); }

private:
    [[nodiscard]] static std::string limiterKey(std::string_view route, std::string_view subject);

    GuardConfig config_;
    security::RateLimiterRegistry limiters_;
};

} // namespace bkg::service
