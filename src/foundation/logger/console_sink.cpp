/// @file console_sink.cpp
/// @brief stderr ILogger registered as the process-wide default logger.

#include "sgw/foundation/service_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>

namespace sgw::foundation {

namespace {

namespace kci = kcenon::common::interfaces;

const char* levelTag(kci::log_level level) {
    switch (level) {
        case kci::log_level::trace:    return "TRACE";
        case kci::log_level::debug:    return "DEBUG";
        case kci::log_level::info:     return "INFO";
        case kci::log_level::warning:  return "WARN";
        case kci::log_level::error:    return "ERROR";
        case kci::log_level::critical: return "CRIT";
        default:                       return "-";
    }
}

class ConsoleSink : public kci::ILogger {
public:
    kcenon::common::VoidResult log(kci::log_level level, const std::string& message) override {
        if (!is_enabled(level)) {
            return kcenon::common::VoidResult::ok(std::monostate{});
        }

        auto now = std::chrono::system_clock::now();
        auto secs = std::chrono::system_clock::to_time_t(now);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch()).count() % 1000;
        std::tm tm{};
        ::localtime_r(&secs, &tm);
        char stamp[32];
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);

        std::lock_guard lock(mutex_);
        std::fprintf(stderr, "%s.%03d %-5s %s\n", stamp, static_cast<int>(millis),
                     levelTag(level), message.c_str());
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(kci::log_level level, std::string_view message,
                                   const kci::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(const kci::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(kci::log_level level) const override {
        return level >= minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult set_level(kci::log_level level) override {
        minLevel_.store(level, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kci::log_level get_level() const override {
        return minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult flush() override {
        std::lock_guard lock(mutex_);
        std::fflush(stderr);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

private:
    std::mutex mutex_;
    // Category filtering happens in ServiceLogger; the sink passes everything.
    std::atomic<kci::log_level> minLevel_{kci::log_level::trace};
};

} // namespace

void installConsoleSink() {
    kci::GlobalLoggerRegistry::instance().set_default_logger(std::make_shared<ConsoleSink>());
}

} // namespace sgw::foundation
