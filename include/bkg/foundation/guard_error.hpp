#pragma once

/// @file guard_error.hpp
/// @brief Error type used with Result<T, GuardError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "bkg/foundation/error_code.hpp"

namespace bkg::foundation {

/// Error carrying a categorized code, a message and optional typed context.
///
/// For errors that cross to an end user the message is always a stable
/// translation key (e.g. "error.backup.invalidPath"), never raw detail.
class GuardError {
public:
    GuardError() = default;

    explicit GuardError(ErrorCode code)
        : code_(code) {}

    GuardError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GuardError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (nullptr if the type differs or none is set).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

    /// Copy with the same code and context but a replaced message.
    [[nodiscard]] GuardError withMessage(std::string message) const {
        GuardError copy(*this);
        copy.message_ = std::move(message);
        return copy;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace bkg::foundation
