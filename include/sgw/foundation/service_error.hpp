#pragma once

/// @file service_error.hpp
/// @brief Error type carried by ServiceResult<T>.

#include <string>
#include <string_view>
#include <utility>

#include "sgw/foundation/error_code.hpp"

namespace sgw::foundation {

/// Categorized error with a human-readable message.
///
/// Lifecycle errors travel to the launcher as (code, message) pairs inside
/// a RESULT frame, so the message is written for an operator to read.
class ServiceError {
public:
    ServiceError() = default;

    explicit ServiceError(ErrorCode code)
        : code_(code) {}

    ServiceError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
};

} // namespace sgw::foundation
