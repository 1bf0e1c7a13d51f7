#pragma once

/// @file capturing_logger.hpp
/// @brief kcenon ILogger that records messages for test assertions.

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

namespace bkg::test {

struct LogRecord {
    kcenon::common::interfaces::log_level level;
    std::string message;
};

class CapturingLogger : public kcenon::common::interfaces::ILogger {
public:
    using log_level = kcenon::common::interfaces::log_level;

    kcenon::common::VoidResult log(log_level level,
                                   const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level level) const override {
        return level >= minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult set_level(log_level level) override {
        minLevel_.store(level, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override {
        return minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult flush() override {
        flushed_.store(true, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    /// Records whose message contains @p needle.
    std::vector<LogRecord> matching(std::string_view needle) const {
        std::lock_guard lock(mutex_);
        std::vector<LogRecord> out;
        for (const auto& r : records_) {
            if (r.message.find(needle) != std::string::npos) {
                out.push_back(r);
            }
        }
        return out;
    }

    bool wasFlushed() const {
        return flushed_.load(std::memory_order_acquire);
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<log_level> minLevel_{log_level::trace};
    std::atomic<bool> flushed_{false};
};

/// Install a fresh CapturingLogger as the registry default.
inline std::shared_ptr<CapturingLogger> installCapturingLogger() {
    auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
    registry.clear();
    auto logger = std::make_shared<CapturingLogger>();
    registry.set_default_logger(logger);
    return logger;
}

inline void uninstallCapturingLogger() {
    kcenon::common::interfaces::GlobalLoggerRegistry::instance().clear();
}

} // namespace bkg::test
