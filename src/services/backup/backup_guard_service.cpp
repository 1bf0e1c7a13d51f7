/// @file backup_guard_service.cpp
/// @brief BackupGuardService implementation.

#include "bkg/service/backup_guard_service.hpp"

#include "bkg/foundation/guard_logger.hpp"
#include "bkg/security/message_codes.hpp"
#include "bkg/security/path_guard.hpp"

namespace bkg::service {

using foundation::ErrorCode;
using foundation::GuardError;
using foundation::GuardLogger;
using foundation::GuardResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

BackupGuardService::BackupGuardService(GuardConfig config)
    : config_(std::move(config)), limiters_(config_.defaultRateLimit) {}

GuardResult<std::string> BackupGuardService::authorizeBackupPath(
    std::string_view candidatePath) const {
    if (security::PathGuard::validate(config_.backupDirectory, candidatePath,
                                      config_.backupExtension)) {
        return GuardResult<std::string>::ok(std::string(candidatePath));
    }

    LogContext ctx;
    ctx.extra["base_dir"] = config_.backupDirectory;
    ctx.extra["candidate"] = std::string(candidatePath);
    GuardLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Backup,
                                           "Rejected backup path", ctx);

    return GuardResult<std::string>::err(
        GuardError(ErrorCode::InvalidBackupPath, std::string(security::codes::kInvalidBackupPath)));
}

GuardResult<void> BackupGuardService::acquire(std::string_view route, std::string_view subject) {
    auto limiter = limiters_.getOrCreate(limiterKey(route, subject), config_.limitsFor(route));
    if (!limiter) {
        return GuardResult<void>::err(limiter.error());
    }

    auto& rl = *limiter.value();
    if (rl.canMakeRequest()) {
        return GuardResult<void>::ok();
    }

    RetryHint hint{rl.getRemainingRequests(), rl.getResetTime()};

    LogContext ctx;
    ctx.channel = std::string(route);
    ctx.subject = std::string(subject);
    ctx.extra["retry_after_ms"] = std::to_string(hint.retryAfter.count());
    GuardLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Security,
                                           "Rate limit exceeded", ctx);

    return GuardResult<void>::err(
        GuardError(ErrorCode::RateLimited, std::string(security::codes::kRateLimitExceeded), hint));
}

RetryHint BackupGuardService::quota(std::string_view route, std::string_view subject) {
    auto limiter = limiters_.find(limiterKey(route, subject));
    if (!limiter) {
        return RetryHint{config_.limitsFor(route).maxRequests, std::chrono::milliseconds::zero()};
    }
    return RetryHint{limiter->getRemainingRequests(), limiter->getResetTime()};
}

bool BackupGuardService::forget(std::string_view route, std::string_view subject) {
    return limiters_.remove(limiterKey(route, subject));
}

std::string BackupGuardService::limiterKey(std::string_view route, std::string_view subject) {
    std::string key;
    key.reserve(route.size() + subject.size() + 1);
    key += route;
    key += '\n';
    key += subject;
    return key;
}

} // namespace bkg::service
