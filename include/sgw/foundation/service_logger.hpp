#pragma once

/// @file service_logger.hpp
/// @brief ServiceLogger wrapping kcenon common_system's logger registry.
///
/// Category-based filtering and structured context for the three
/// executables. The actual sink (console, file, async writer) is whatever
/// logger has been registered with kcenon's GlobalLoggerRegistry; this
/// layer only decides what is emitted and how it is formatted.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "sgw/foundation/service_result.hpp"
#include "sgw/foundation/types.hpp"

namespace sgw::foundation {

/// Log severity levels.
///
/// Maps 1:1 onto kcenon::common::interfaces::log_level.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per subsystem of the runtime.
enum class LogCategory : uint8_t {
    Core      = 0, ///< Process startup, configuration, shutdown
    Network   = 1, ///< Listeners, sockets, transport errors
    Protocol  = 2, ///< Control-channel framing and decoding
    Session   = 3, ///< Session registry, routing, queues
    Lifecycle = 4, ///< Engine state machine and launcher commands
    Process   = 5, ///< Spawning, signalling and reaping engine processes
    Engine    = 6, ///< Engine-side dispatch and resync
    Launcher  = 7  ///< Operator CLI
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Network", "Protocol", "Session",
        "Lifecycle", "Process", "Engine", "Launcher"
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

/// Parse a level name as written in configuration ("info", "WARNING", ...).
/// Returns nullopt for unknown names.
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured fields appended to a log line.
struct LogContext {
    std::optional<SessionId> sessionId;
    std::optional<ConnectionId> connectionId;
    std::optional<AccountId> accountId;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-filtered logger on top of kcenon's GlobalLoggerRegistry.
///
/// Default levels: Debug for Lifecycle, Info for everything else.
///
/// @code
///   LogContext ctx;
///   ctx.sessionId = sid;
///   ServiceLogger::instance().logWithContext(
///       LogLevel::Warning, LogCategory::Session, "input queue full", ctx);
/// @endcode
class ServiceLogger {
public:
    ServiceLogger();
    ~ServiceLogger();

    ServiceLogger(const ServiceLogger&) = delete;
    ServiceLogger& operator=(const ServiceLogger&) = delete;
    ServiceLogger(ServiceLogger&&) noexcept;
    ServiceLogger& operator=(ServiceLogger&&) noexcept;

    /// Log a message under the given category.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message followed by " {key=value, ...}".
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Set every category to the same minimum level.
    void setAllLevels(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Tag prepended to every line, e.g. "gateway" or "engine:4211".
    void setProcessTag(std::string tag);

    ServiceResult<void> flush();

    static ServiceLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Register a sink writing timestamped lines to stderr as the default
/// logger of kcenon's GlobalLoggerRegistry. Executables call this once at
/// startup; tests register their own capturing logger instead.
void installConsoleSink();

} // namespace sgw::foundation

#ifndef SGW_MIN_LOG_LEVEL
    #define SGW_MIN_LOG_LEVEL 0
#endif

#define SGW_LOG(level, cat, msg)                                                  \
    do {                                                                          \
        _Pragma("GCC diagnostic push")                                            \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                       \
        if (static_cast<int>(level) >= SGW_MIN_LOG_LEVEL &&                       \
            ::sgw::foundation::ServiceLogger::instance().isEnabled((level), (cat))) \
        {                                                                         \
            ::sgw::foundation::ServiceLogger::instance().log((level), (cat), (msg)); \
        }                                                                         \
        _Pragma("GCC diagnostic pop")                                             \
    } while (0)

#define SGW_LOG_DEBUG(cat, msg) \
    SGW_LOG(::sgw::foundation::LogLevel::Debug, (cat), (msg))

#define SGW_LOG_INFO(cat, msg) \
    SGW_LOG(::sgw::foundation::LogLevel::Info, (cat), (msg))

#define SGW_LOG_WARN(cat, msg) \
    SGW_LOG(::sgw::foundation::LogLevel::Warning, (cat), (msg))

#define SGW_LOG_ERROR(cat, msg) \
    SGW_LOG(::sgw::foundation::LogLevel::Error, (cat), (msg))

#define SGW_LOG_CRITICAL(cat, msg) \
    SGW_LOG(::sgw::foundation::LogLevel::Critical, (cat), (msg))
