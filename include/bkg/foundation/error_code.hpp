#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the backup guard layer.

#include <cstdint>
#include <string_view>

namespace bkg::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,

    // Path (0x0100 - 0x01FF)
    InvalidBackupPath = 0x0100,

    // RateLimit (0x0200 - 0x02FF)
    RateLimited = 0x0200,

    // Boundary (0x0300 - 0x03FF)
    OperationFailed = 0x0300,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigInvalidValue = 0x0603,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    switch (value & 0xFF00) {
        case 0x0000: return "General";
        case 0x0100: return "Path";
        case 0x0200: return "RateLimit";
        case 0x0300: return "Boundary";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace bkg::foundation
