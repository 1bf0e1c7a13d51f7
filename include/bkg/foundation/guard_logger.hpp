#pragma once

/// @file guard_logger.hpp
/// @brief GuardLogger wrapping the kcenon logger interfaces for guard-layer logging.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "bkg/foundation/guard_result.hpp"

namespace bkg::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, each with its own minimum level.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Startup and wiring
    Security = 1, ///< Rate limiting decisions
    Backup   = 2, ///< Backup path authorization
    Boundary = 3, ///< Error translation at the caller boundary
    Config   = 4  ///< Configuration loading and binding
};

inline constexpr std::size_t kLogCategoryCount = 5;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Security", "Backup", "Boundary", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context attached to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.channel = "exchange_rate";
///   ctx.subject = "user-7";
///   ctx.extra["retry_after_ms"] = "4200";
///   logger.logWithContext(LogLevel::Warning, LogCategory::Security,
///                         "Rate limit exceeded", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> channel;
    std::optional<std::string> subject;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Guard-layer logger over kcenon's GlobalLoggerRegistry.
///
/// Uses PIMPL to keep kcenon headers out of the public API.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Security | Info          |
/// | Backup   | Info          |
/// | Boundary | Info          |
/// | Config   | Warning       |
class GuardLogger {
public:
    GuardLogger();
    ~GuardLogger();

    GuardLogger(const GuardLogger&) = delete;
    GuardLogger& operator=(const GuardLogger&) = delete;
    GuardLogger(GuardLogger&&) noexcept;
    GuardLogger& operator=(GuardLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with context fields appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    GuardResult<void> flush();

    /// Process-wide instance used by the BKG_LOG macros.
    static GuardLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace bkg::foundation

/// @name BKG_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define BKG_MIN_LOG_LEVEL before including this header to drop calls
/// below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef BKG_MIN_LOG_LEVEL
    #define BKG_MIN_LOG_LEVEL 0
#endif

#define BKG_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= BKG_MIN_LOG_LEVEL &&                      \
            ::bkg::foundation::GuardLogger::instance().isEnabled((level), (cat))) \
        {                                                                        \
            ::bkg::foundation::GuardLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define BKG_LOG_DEBUG(cat, msg) \
    BKG_LOG(::bkg::foundation::LogLevel::Debug, (cat), (msg))

#define BKG_LOG_INFO(cat, msg) \
    BKG_LOG(::bkg::foundation::LogLevel::Info, (cat), (msg))

#define BKG_LOG_WARN(cat, msg) \
    BKG_LOG(::bkg::foundation::LogLevel::Warning, (cat), (msg))

#define BKG_LOG_ERROR(cat, msg) \
    BKG_LOG(::bkg::foundation::LogLevel::Error, (cat), (msg))

/// @}
