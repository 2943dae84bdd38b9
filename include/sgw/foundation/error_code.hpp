#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the gateway, engine and launcher.

#include <cstdint>
#include <string_view>

namespace sgw::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the origin of an
/// error can be read from the code alone, including on the launcher side
/// where only the code travels over the control channel.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,

    // Network (0x0100 - 0x01FF)
    NetworkError = 0x0100,
    ConnectionFailed = 0x0101,
    ConnectionLost = 0x0102,
    Timeout = 0x0103,
    SendFailed = 0x0104,
    ListenFailed = 0x0105,
    ConnectionLimitReached = 0x0106,
    NotConnected = 0x0107,

    // Control protocol (0x0200 - 0x02FF)
    ProtocolError = 0x0200,
    FrameTooShort = 0x0201,
    FrameTooLarge = 0x0202,
    UnknownMessageKind = 0x0203,
    MalformedPayload = 0x0204,
    UnexpectedMessage = 0x0205,
    ProtocolRevisionMismatch = 0x0206,

    // Session (0x0300 - 0x03FF)
    SessionNotFound = 0x0300,
    InputQueueFull = 0x0301,
    InputTooLarge = 0x0302,
    RateLimited = 0x0303,
    OutputBudgetExceeded = 0x0304,
    ResyncFailed = 0x0305,
    SessionLimitReached = 0x0306,

    // Lifecycle (0x0400 - 0x04FF)
    LifecycleError = 0x0400,
    OperationInProgress = 0x0401,
    EngineAlreadyRunning = 0x0402,
    EngineNotRunning = 0x0403,
    EngineAlreadyAttached = 0x0404,
    AttachTimeout = 0x0405,
    StopTimeout = 0x0406,
    EngineExited = 0x0407,
    UnknownCommand = 0x0408,

    // Process (0x0500 - 0x05FF)
    ProcessError = 0x0500,
    SpawnFailed = 0x0501,
    NoLaunchCommand = 0x0502,
    SignalFailed = 0x0503,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigInvalidValue = 0x0603,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,
    JobNotFound = 0x0702,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Network";
        case 0x0200: return "Protocol";
        case 0x0300: return "Session";
        case 0x0400: return "Lifecycle";
        case 0x0500: return "Process";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace sgw::foundation
