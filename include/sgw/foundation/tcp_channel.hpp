#pragma once

/// @file tcp_channel.hpp
/// @brief TcpChannel: outbound TCP connection on kcenon network_system.
///
/// Used by the engine and the launcher to dial the gateway's control port.

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "sgw/foundation/service_result.hpp"
#include "sgw/foundation/signal.hpp"

namespace sgw::foundation {

/// One client-side byte stream.
///
/// onData and onDisconnected fire on kcenon I/O threads. onDisconnected
/// fires at most once per channel.
class TcpChannel {
public:
    explicit TcpChannel(std::string clientId = "sgw-client");
    ~TcpChannel();

    TcpChannel(const TcpChannel&) = delete;
    TcpChannel& operator=(const TcpChannel&) = delete;

    /// Dial @p host:@p port and wait up to @p timeout for the connection.
    [[nodiscard]] ServiceResult<void> connect(const std::string& host, uint16_t port,
                                              std::chrono::milliseconds timeout);

    [[nodiscard]] ServiceResult<void> send(std::vector<uint8_t> bytes);

    /// Close the connection. Safe to call more than once.
    void close();

    [[nodiscard]] bool isConnected() const;

    Signal<const std::vector<uint8_t>&> onData;
    Signal<> onDisconnected;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace sgw::foundation
