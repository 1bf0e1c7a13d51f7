/// @file safe_handler.cpp
/// @brief Non-template parts of the sanitizing boundary.

#include "bkg/service/safe_handler.hpp"

#include "bkg/foundation/guard_logger.hpp"
#include "bkg/security/error_sanitizer.hpp"

namespace bkg::service::detail {

using foundation::ErrorCode;
using foundation::GuardError;
using foundation::LogCategory;
using security::ErrorSanitizer;

namespace {

void logIfChanged(std::string_view channel, std::string_view original,
                  std::string_view sanitized) {
    if (original == sanitized) {
        return;
    }
    std::string line;
    line.reserve(channel.size() + original.size() + 8);
    line += "IPC [";
    line += channel;
    line += "]: ";
    line += original;
    BKG_LOG_ERROR(LogCategory::Boundary, line);
}

} // namespace

GuardError sanitizeCaught(std::string_view channel, std::exception_ptr error) {
    auto inspected = ErrorSanitizer::inspect(std::move(error));
    logIfChanged(channel, inspected.original, inspected.sanitized);
    return GuardError(ErrorCode::OperationFailed, std::move(inspected.sanitized));
}

GuardError sanitizeReturned(std::string_view channel, const GuardError& error) {
    auto sanitized = ErrorSanitizer::sanitize(error);
    logIfChanged(channel, error.message(), sanitized);
    return error.withMessage(std::move(sanitized));
}

} // namespace bkg::service::detail
