/// @file guard_config.cpp
/// @brief GuardConfig binding and config path resolution.

#include "bkg/service/guard_config.hpp"

#include <cstdlib>

#include "bkg/foundation/guard_logger.hpp"

namespace bkg::service {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GuardError;
using foundation::GuardResult;
using foundation::LogCategory;

namespace {

/// Assign @p out from @p key if present. Missing keys are not an error.
template <typename T>
GuardResult<void> readOptional(const ConfigManager& config, const std::string& key, T& out) {
    if (!config.hasKey(key)) {
        return GuardResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (!value) {
        return GuardResult<void>::err(value.error());
    }
    out = std::move(value).value();
    return GuardResult<void>::ok();
}

GuardResult<security::RateLimiterConfig> readLimits(const ConfigManager& config,
                                                     const std::string& prefix,
                                                     security::RateLimiterConfig limits) {
    auto maxRequests = limits.maxRequests;
    auto windowMs = static_cast<long long>(limits.window.count());

    if (auto r = readOptional(config, prefix + ".max_requests", maxRequests); !r) {
        return GuardResult<security::RateLimiterConfig>::err(r.error());
    }
    if (auto r = readOptional(config, prefix + ".window_ms", windowMs); !r) {
        return GuardResult<security::RateLimiterConfig>::err(r.error());
    }

    limits.maxRequests = maxRequests;
    limits.window = std::chrono::milliseconds(windowMs);

    auto valid = security::RateLimiter::validateConfig(limits);
    if (!valid) {
        return GuardResult<security::RateLimiterConfig>::err(
            GuardError(ErrorCode::ConfigInvalidValue,
                       prefix + ": " + std::string(valid.error().message())));
    }
    return GuardResult<security::RateLimiterConfig>::ok(limits);
}

} // namespace

const security::RateLimiterConfig& GuardConfig::limitsFor(std::string_view route) const {
    auto it = routeLimits.find(route);
    return it != routeLimits.end() ? it->second : defaultRateLimit;
}

GuardResult<GuardConfig> bindGuardConfig(const ConfigManager& config) {
    GuardConfig cfg;

    if (auto r = readOptional(config, "backup.directory", cfg.backupDirectory); !r) {
        return GuardResult<GuardConfig>::err(r.error());
    }
    if (auto r = readOptional(config, "backup.extension", cfg.backupExtension); !r) {
        return GuardResult<GuardConfig>::err(r.error());
    }
    if (cfg.backupExtension.empty()) {
        return GuardResult<GuardConfig>::err(
            GuardError(ErrorCode::ConfigInvalidValue, "backup.extension must not be empty"));
    }

    auto defaults = readLimits(config, "rate_limit.default", cfg.defaultRateLimit);
    if (!defaults) {
        return GuardResult<GuardConfig>::err(defaults.error());
    }
    cfg.defaultRateLimit = defaults.value();

    for (const auto& route : config.childNames("rate_limit.routes")) {
        auto limits = readLimits(config, "rate_limit.routes." + route, cfg.defaultRateLimit);
        if (!limits) {
            return GuardResult<GuardConfig>::err(limits.error());
        }
        cfg.routeLimits.emplace(route, limits.value());
    }

    if (cfg.backupDirectory.empty()) {
        BKG_LOG_WARN(LogCategory::Config,
                     "backup.directory is not set; every backup path will be rejected");
    }
    return GuardResult<GuardConfig>::ok(std::move(cfg));
}

GuardResult<void> loadConfig(ConfigManager& config, const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("BKG_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        configPath = envPath;
    }

    return config.load(configPath);
}

GuardResult<CommandLine> parseCommandLine(int argc, char* argv[]) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg != "--config") {
            cmd.positional.emplace_back(arg);
            continue;
        }
        if (i + 1 >= argc) {
            return GuardResult<CommandLine>::err(
                GuardError(ErrorCode::InvalidArgument, "--config requires a path"));
        }
        cmd.configPath = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }
    return GuardResult<CommandLine>::ok(std::move(cmd));
}

} // namespace bkg::service
