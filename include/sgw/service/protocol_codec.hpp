#pragma once

/// @file protocol_codec.hpp
/// @brief Client wire protocols as capability sets registered at startup.
///
/// A codec turns the byte stream of one client connection into discrete
/// inputs and turns engine text back into bytes for that client. Codecs
/// are stateful (partial lines survive between reads), so each session owns
/// its own instance, created by name from the ProtocolRegistry.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "sgw/control/control_message.hpp"
#include "sgw/foundation/service_result.hpp"

namespace sgw::service {

/// Limits handed to a codec when it is created.
struct CodecOptions {
    /// Longest input a codec buffers before giving up on it.
    std::size_t maxInputBytes = 8192;

    /// Ask the client for its window size and terminal type on connect.
    bool negotiate = false;
};

/// Client properties learned from the byte stream. Unset fields are unchanged.
struct CapabilityUpdate {
    std::optional<uint16_t> screenWidth;
    std::optional<uint16_t> screenHeight;
    std::optional<std::string> clientName;
    std::optional<bool> ansi;

    [[nodiscard]] bool empty() const noexcept {
        return !screenWidth && !screenHeight && !clientName && !ansi;
    }

    /// Merge into @p caps; true when anything changed.
    bool applyTo(control::Capabilities& caps) const;
};

/// What one decode() call produced.
struct DecodeResult {
    /// Completed inputs, oldest first.
    std::vector<std::string> inputs;

    /// Negotiation bytes to write back to the client.
    std::vector<uint8_t> reply;

    CapabilityUpdate capabilities;
};

/// Decode/encode capability of one client wire protocol.
class ProtocolCodec {
public:
    virtual ~ProtocolCodec() = default;

    [[nodiscard]] virtual control::ProtocolKind kind() const noexcept = 0;

    /// Consume raw bytes; return every input they complete, oldest first,
    /// along with any negotiation reply and capability change they carried.
    ///
    /// An input longer than CodecOptions::maxInputBytes is returned cut to
    /// maxInputBytes + 1 bytes so the caller can refuse it; the rest of it
    /// is discarded.
    virtual DecodeResult decode(std::span<const uint8_t> bytes) = 0;

    /// Bytes to send when the connection opens. Empty by default.
    [[nodiscard]] virtual std::vector<uint8_t> greeting() const { return {}; }

    /// Frame one piece of output text for the wire.
    [[nodiscard]] virtual std::vector<uint8_t> encode(std::string_view text) const = 0;
};

/// Line-oriented text protocol (telnet-style clients).
///
/// Splits on LF, drops CR and NUL, strips telnet IAC command sequences
/// and unescapes IAC IAC. Output gets CRLF line endings and IAC escaped.
///
/// With CodecOptions::negotiate the greeting asks for NAWS and TTYPE.
/// NAWS reports set the screen size; a TTYPE name sets the client name and
/// turns on ANSI for known colour terminals. Subnegotiation is read either
/// way, so a client that volunteers its size is still heard.
class LineCodec final : public ProtocolCodec {
public:
    explicit LineCodec(CodecOptions options = {});

    [[nodiscard]] control::ProtocolKind kind() const noexcept override {
        return control::ProtocolKind::Line;
    }

    DecodeResult decode(std::span<const uint8_t> bytes) override;

    [[nodiscard]] std::vector<uint8_t> encode(std::string_view text) const override;

    [[nodiscard]] std::vector<uint8_t> greeting() const override;

private:
    enum class TelnetState : uint8_t {
        Data,
        Iac,          ///< saw IAC
        Option,       ///< saw IAC WILL/WONT/DO/DONT, expecting the option byte
        Sub,          ///< inside IAC SB ... IAC SE
        SubIac        ///< saw IAC inside a subnegotiation
    };

    void pushByte(uint8_t byte, std::vector<std::string>& out);
    void onOption(uint8_t verb, uint8_t option, DecodeResult& result);
    void onSubnegotiation(DecodeResult& result);

    CodecOptions options_;
    TelnetState state_ = TelnetState::Data;
    uint8_t verb_ = 0;
    std::vector<uint8_t> sub_;
    std::string line_;
    bool discarding_ = false;
};

/// Message-oriented protocol: every websocket message is one input.
class WebSocketCodec final : public ProtocolCodec {
public:
    explicit WebSocketCodec(CodecOptions options = {});

    [[nodiscard]] control::ProtocolKind kind() const noexcept override {
        return control::ProtocolKind::WebSocket;
    }

    DecodeResult decode(std::span<const uint8_t> bytes) override;

    [[nodiscard]] std::vector<uint8_t> encode(std::string_view text) const override;

private:
    CodecOptions options_;
};

using CodecFactory = std::function<std::unique_ptr<ProtocolCodec>(const CodecOptions&)>;

/// Name -> codec factory table. Filled at startup, before any listener
/// opens, and read-only afterwards.
///
/// @code
///   auto registry = ProtocolRegistry::withBuiltins();
///   auto codec = registry.create("line", CodecOptions{});
/// @endcode
class ProtocolRegistry {
public:
    /// Register a factory. Fails with AlreadyExists on a duplicate name.
    [[nodiscard]] sgw::foundation::ServiceResult<void> registerCodec(std::string name,
                                                                     CodecFactory factory);

    /// Instantiate a codec. Fails with NotFound for an unknown name.
    [[nodiscard]] sgw::foundation::ServiceResult<std::unique_ptr<ProtocolCodec>>
    create(std::string_view name, const CodecOptions& options) const;

    [[nodiscard]] bool contains(std::string_view name) const;

    [[nodiscard]] std::vector<std::string> names() const;

    /// Registry holding "line" and "websocket".
    static ProtocolRegistry withBuiltins();

private:
    std::unordered_map<std::string, CodecFactory> factories_;
};

} // namespace sgw::service
