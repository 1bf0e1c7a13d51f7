/// @file main.cpp
/// @brief bkg_guard command-line entry point.
///
/// Runs the guard checks against a configuration file, for operators
/// checking a backup location or a captured error message:
///
///   bkg_guard [--config <path>] check-path <candidate>
///   bkg_guard [--config <path>] sanitize <message>

#include "bkg/foundation/config_manager.hpp"
#include "bkg/foundation/guard_logger.hpp"
#include "bkg/security/error_sanitizer.hpp"
#include "bkg/service/backup_guard_service.hpp"
#include "bkg/service/guard_config.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

constexpr const char* kDefaultConfigPath = "/etc/bkg/guard.yaml";

void printUsage() {
    std::cerr << "usage: bkg_guard [--config <path>] check-path <candidate>\n"
              << "       bkg_guard [--config <path>] sanitize <message>\n";
}

} // namespace

int main(int argc, char* argv[]) {
    using bkg::foundation::LogCategory;

    auto cmd = bkg::service::parseCommandLine(argc, argv);
    if (!cmd) {
        std::cerr << cmd.error().message() << "\n";
        printUsage();
        return EXIT_FAILURE;
    }

    const auto& args = cmd.value().positional;
    if (args.size() != 2) {
        printUsage();
        return EXIT_FAILURE;
    }

    if (args[0] == "sanitize") {
        std::cout << bkg::security::ErrorSanitizer::sanitize(
                         std::runtime_error(args[1]))
                  << "\n";
        return EXIT_SUCCESS;
    }

    if (args[0] != "check-path") {
        printUsage();
        return EXIT_FAILURE;
    }

    bkg::foundation::ConfigManager config;
    const auto& configPath = cmd.value().configPath;
    auto loadResult = configPath.empty()
                          ? bkg::service::loadConfig(config, kDefaultConfigPath)
                          : config.load(configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto guardConfig = bkg::service::bindGuardConfig(config);
    if (!guardConfig) {
        std::cerr << "Invalid config: " << guardConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }

    BKG_LOG_INFO(LogCategory::Core, "bkg_guard configured");

    bkg::service::BackupGuardService guard(std::move(guardConfig).value());
    auto authorized = guard.authorizeBackupPath(args[1]);
    if (!authorized) {
        std::cout << authorized.error().message() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << authorized.value() << "\n";
    return EXIT_SUCCESS;
}
