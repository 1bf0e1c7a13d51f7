#pragma once

/// @file message_codes.hpp
/// @brief Stable, translatable message keys shown to end users in place of
///        raw error text.

#include <string_view>

namespace bkg::security::codes {

inline constexpr std::string_view kUniqueConstraint     = "error.db.uniqueConstraint";
inline constexpr std::string_view kForeignKeyConstraint = "error.db.foreignKeyConstraint";
inline constexpr std::string_view kNotNullConstraint    = "error.db.notNullConstraint";
inline constexpr std::string_view kCheckConstraint      = "error.db.checkConstraint";
inline constexpr std::string_view kSchemaError          = "error.db.schemaError";
inline constexpr std::string_view kSystemError          = "error.db.systemError";
inline constexpr std::string_view kGenericDbError       = "error.db.genericDbError";
inline constexpr std::string_view kDatabaseLocked       = "error.db.databaseLocked";
inline constexpr std::string_view kDiskIOError          = "error.db.diskIOError";
inline constexpr std::string_view kDatabaseCorrupted    = "error.db.databaseCorrupted";
inline constexpr std::string_view kUnexpected           = "error.unexpected";

inline constexpr std::string_view kInvalidBackupPath    = "error.backup.invalidPath";
inline constexpr std::string_view kRateLimitExceeded    = "error.rateLimit.exceeded";

} // namespace bkg::security::codes
