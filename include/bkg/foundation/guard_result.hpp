#pragma once

/// @file guard_result.hpp
/// @brief GuardResult<T> type alias for guard-layer error handling.

#include "bkg/core/result.hpp"
#include "bkg/foundation/guard_error.hpp"

namespace bkg::foundation {

/// Result type specialized with GuardError.
///
/// Example:
/// @code
///   GuardResult<std::string> authorize(std::string_view path) {
///       if (!PathGuard::validate(dir, path)) {
///           return GuardResult<std::string>::err(
///               GuardError(ErrorCode::InvalidBackupPath, "error.backup.invalidPath"));
///       }
///       return GuardResult<std::string>::ok(std::string(path));
///   }
/// @endcode
template <typename T>
using GuardResult = bkg::Result<T, GuardError>;

}  // namespace bkg::foundation
