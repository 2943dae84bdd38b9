#pragma once

/// @file gateway_transport.hpp
/// @brief Outbound side of the gateway's sockets.
///
/// The registry and the supervisor push bytes and close connections
/// through this interface; GatewayHost backs it with the NetworkManager,
/// tests with an in-memory recorder.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "sgw/foundation/service_result.hpp"
#include "sgw/foundation/types.hpp"

namespace sgw::service {

class GatewayTransport {
public:
    virtual ~GatewayTransport() = default;

    /// Queue bytes for a connection (client or control peer).
    virtual sgw::foundation::ServiceResult<void> send(sgw::foundation::ConnectionId conn,
                                                      std::vector<uint8_t> bytes) = 0;

    /// Close a connection. The disconnect event still arrives through the
    /// normal path.
    virtual void close(sgw::foundation::ConnectionId conn) = 0;

    /// Bytes queued for @p conn that the peer has not taken yet, or nullopt
    /// when the transport cannot tell.
    [[nodiscard]] virtual std::optional<std::size_t> pendingBytes(
        sgw::foundation::ConnectionId conn) const {
        (void)conn;
        return std::nullopt;
    }
};

} // namespace sgw::service
