#pragma once

/// @file service_result.hpp
/// @brief ServiceResult<T> alias used by every fallible operation.

#include "sgw/core/result.hpp"
#include "sgw/foundation/service_error.hpp"

namespace sgw::foundation {

/// Result type specialized with ServiceError.
///
/// Example:
/// @code
///   ServiceResult<SessionId> accept(ProtocolKind kind) {
///       if (full()) {
///           return ServiceResult<SessionId>::err(
///               ServiceError(ErrorCode::ConnectionLimitReached, "registry full"));
///       }
///       return ServiceResult<SessionId>::ok(allocate());
///   }
/// @endcode
template <typename T>
using ServiceResult = sgw::Result<T, ServiceError>;

}  // namespace sgw::foundation
