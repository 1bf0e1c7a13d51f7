#pragma once

/// @file guard_config.hpp
/// @brief Guard-layer settings and their binding from ConfigManager.
///
/// Recognised keys:
/// @code{.yaml}
///   backup:
///     directory: /var/lib/erp/backups
///     extension: .db
///   rate_limit:
///     default:
///       max_requests: 10
///       window_ms: 60000
///     routes:
///       exchange_rate:
///         max_requests: 5
///         window_ms: 60000
/// @endcode

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "bkg/foundation/config_manager.hpp"
#include "bkg/foundation/guard_result.hpp"
#include "bkg/security/path_guard.hpp"
#include "bkg/security/rate_limiter.hpp"

namespace bkg::service {

struct GuardConfig {
    /// Directory every backup path must resolve inside.
    std::string backupDirectory;

    /// Required backup file extension (case-sensitive).
    std::string backupExtension{security::PathGuard::kBackupExtension};

    /// Limits for routes without an entry in routeLimits.
    security::RateLimiterConfig defaultRateLimit;

    /// Per-route overrides keyed by route name.
    std::map<std::string, security::RateLimiterConfig, std::less<>> routeLimits;

    /// Limits that apply to @p route.
    [[nodiscard]] const security::RateLimiterConfig& limitsFor(std::string_view route) const;
};

/// Build a GuardConfig from loaded configuration.
///
/// Missing keys keep their defaults. Present keys with the wrong type, and
/// rate limits that RateLimiter would reject, fail with
/// ConfigTypeMismatch / ConfigInvalidValue.
[[nodiscard]] foundation::GuardResult<GuardConfig>
bindGuardConfig(const foundation::ConfigManager& config);

/// Load configuration, letting BKG_CONFIG_PATH override @p defaultPath.
[[nodiscard]] foundation::GuardResult<void>
loadConfig(foundation::ConfigManager& config, const std::filesystem::path& defaultPath);

/// Arguments of a bkg_guard invocation.
struct CommandLine {
    /// Value of "--config", or empty when the flag is absent.
    std::filesystem::path configPath;

    /// Arguments other than "--config" and its value, in order.
    std::vector<std::string> positional;
};

/// Split @p argv, skipping the program name, into the config path and the rest.
///
/// @return InvalidArgument when "--config" is the last argument.
[[nodiscard]] foundation::GuardResult<CommandLine> parseCommandLine(int argc, char* argv[]);

} // namespace bkg::service
