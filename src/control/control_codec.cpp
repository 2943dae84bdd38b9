/// @file control_codec.cpp
/// @brief Control message encoding, decoding and frame reassembly.

#include "sgw/control/control_codec.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <type_traits>

namespace sgw::control {

using foundation::ErrorCode;

// ---------------------------------------------------------------------------
// Names
// ---------------------------------------------------------------------------

std::string_view messageKindName(MessageKind kind) {
    switch (kind) {
        case MessageKind::Hello:         return "HELLO";
        case MessageKind::Cmd:           return "CMD";
        case MessageKind::Result:        return "RESULT";
        case MessageKind::ResyncSession: return "RESYNC_SESSION";
        case MessageKind::ResyncDone:    return "RESYNC_DONE";
        case MessageKind::ResyncFailed:  return "RESYNC_FAILED";
        case MessageKind::Capabilities:  return "CAPABILITIES";
        case MessageKind::Data:          return "DATA";
        case MessageKind::SessionUpdate: return "SESSION_UPDATE";
        case MessageKind::Disconnect:    return "DISCONNECT";
        case MessageKind::DisconnectAll: return "DISCONNECT_ALL";
        case MessageKind::Announce:      return "ANNOUNCE";
        case MessageKind::Shutdown:      return "SHUTDOWN";
        case MessageKind::Stopping:      return "STOPPING";
    }
    return "UNKNOWN";
}

std::string_view roleName(Role role) {
    switch (role) {
        case Role::Engine:   return "engine";
        case Role::Launcher: return "launcher";
    }
    return "unknown";
}

std::string_view commandName(Command cmd) {
    switch (cmd) {
        case Command::Start:    return "start";
        case Command::Stop:     return "stop";
        case Command::Reload:   return "reload";
        case Command::Status:   return "status";
        case Command::Shutdown: return "shutdown";
    }
    return "unknown";
}

std::optional<Command> parseCommand(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "start") return Command::Start;
    if (lower == "stop") return Command::Stop;
    if (lower == "reload") return Command::Reload;
    if (lower == "status") return Command::Status;
    if (lower == "shutdown") return Command::Shutdown;
    return std::nullopt;
}

std::string_view engineStateName(EngineState state) {
    switch (state) {
        case EngineState::Absent:   return "absent";
        case EngineState::Starting: return "starting";
        case EngineState::Running:  return "running";
        case EngineState::Stopping: return "stopping";
    }
    return "unknown";
}

std::string_view resultCodeName(ResultCode code) {
    switch (code) {
        case ResultCode::Ok:                  return "ok";
        case ResultCode::AlreadyInState:      return "no-op";
        case ResultCode::OperationInProgress: return "operation in progress";
        case ResultCode::Failed:              return "failed";
        case ResultCode::Rejected:            return "rejected";
    }
    return "unknown";
}

std::string_view protocolKindName(ProtocolKind kind) {
    switch (kind) {
        case ProtocolKind::Line:       return "line";
        case ProtocolKind::SecureLine: return "secure-line";
        case ProtocolKind::WebSocket:  return "websocket";
    }
    return "unknown";
}

MessageKind kindOf(const ControlMessage& msg) {
    return std::visit([](const auto& m) -> MessageKind {
        using M = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<M, Hello>)              return MessageKind::Hello;
        else if constexpr (std::is_same_v<M, Cmd>)           return MessageKind::Cmd;
        else if constexpr (std::is_same_v<M, CommandResult>) return MessageKind::Result;
        else if constexpr (std::is_same_v<M, ResyncSession>) return MessageKind::ResyncSession;
        else if constexpr (std::is_same_v<M, ResyncDone>)    return MessageKind::ResyncDone;
        else if constexpr (std::is_same_v<M, ResyncFailed>)  return MessageKind::ResyncFailed;
        else if constexpr (std::is_same_v<M, SessionCapabilities>) return MessageKind::Capabilities;
        else if constexpr (std::is_same_v<M, Data>)          return MessageKind::Data;
        else if constexpr (std::is_same_v<M, SessionUpdate>) return MessageKind::SessionUpdate;
        else if constexpr (std::is_same_v<M, Disconnect>)    return MessageKind::Disconnect;
        else if constexpr (std::is_same_v<M, DisconnectAll>) return MessageKind::DisconnectAll;
        else if constexpr (std::is_same_v<M, Announce>)      return MessageKind::Announce;
        else if constexpr (std::is_same_v<M, Shutdown>)      return MessageKind::Shutdown;
        else                                                 return MessageKind::Stopping;
    }, msg);
}

Data makeData(SessionId sid, std::string_view text) {
    Data data;
    data.sessionId = sid;
    data.payload.assign(text.begin(), text.end());
    return data;
}

std::string payloadText(const Data& data) {
    return std::string(data.payload.begin(), data.payload.end());
}

std::vector<std::string_view> splitText(std::string_view text, std::size_t limit) {
    std::vector<std::string_view> pieces;
    if (limit == 0 || text.size() <= limit) {
        pieces.push_back(text);
        return pieces;
    }
    while (!text.empty()) {
        std::size_t cut = std::min(limit, text.size());
        if (cut < text.size()) {
            auto newline = text.rfind('\n', cut - 1);
            if (newline != std::string_view::npos) {
                cut = newline + 1;
            }
        }
        pieces.push_back(text.substr(0, cut));
        text.remove_prefix(cut);
    }
    return pieces;
}

// ---------------------------------------------------------------------------
// Byte-level helpers
// ---------------------------------------------------------------------------

namespace {

class ByteWriter {
public:
    void u8(uint8_t v) { buf_.push_back(v); }

    void u16(uint16_t v) {
        buf_.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
        buf_.push_back(static_cast<uint8_t>(v & 0xFF));
    }

    void u32(uint32_t v) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            buf_.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
        }
    }

    void u64(uint64_t v) {
        for (int shift = 56; shift >= 0; shift -= 8) {
            buf_.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
        }
    }

    void str(std::string_view s) {
        u32(static_cast<uint32_t>(s.size()));
        buf_.insert(buf_.end(), s.begin(), s.end());
    }

    void bytes(const std::vector<uint8_t>& b) {
        u32(static_cast<uint32_t>(b.size()));
        buf_.insert(buf_.end(), b.begin(), b.end());
    }

    std::vector<uint8_t>& buffer() { return buf_; }

private:
    std::vector<uint8_t> buf_;
};

/// Bounds-checked reader; any overrun flips ok() to false and later reads
/// return zero values.
class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> data) : data_(data) {}

    uint8_t u8() {
        if (!need(1)) return 0;
        return data_[pos_++];
    }

    uint16_t u16() {
        if (!need(2)) return 0;
        auto v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return v;
    }

    uint32_t u32() {
        if (!need(4)) return 0;
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            v = (v << 8) | data_[pos_++];
        }
        return v;
    }

    uint64_t u64() {
        if (!need(8)) return 0;
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) {
            v = (v << 8) | data_[pos_++];
        }
        return v;
    }

    std::string str() {
        auto len = u32();
        if (!need(len)) return {};
        std::string s(reinterpret_cast<const char*>(data_.data() + pos_), len);
        pos_ += len;
        return s;
    }

    std::vector<uint8_t> bytes() {
        auto len = u32();
        if (!need(len)) return {};
        std::vector<uint8_t> b(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                               data_.begin() + static_cast<std::ptrdiff_t>(pos_ + len));
        pos_ += len;
        return b;
    }

    /// Flag a semantic error (bad enum value).
    void invalidate() { ok_ = false; }

    [[nodiscard]] bool ok() const noexcept { return ok_; }
    [[nodiscard]] bool atEnd() const noexcept { return pos_ == data_.size(); }

private:
    bool need(std::size_t n) {
        if (!ok_ || data_.size() - pos_ < n) {
            ok_ = false;
            return false;
        }
        return true;
    }

    std::span<const uint8_t> data_;
    std::size_t pos_ = 0;
    bool ok_ = true;
};

template <typename Enum>
Enum readEnum(ByteReader& r, uint8_t maxValue, uint8_t minValue = 0) {
    auto raw = r.u8();
    if (raw < minValue || raw > maxValue) {
        r.invalidate();
    }
    return static_cast<Enum>(raw);
}

// -- Per-message payloads -----------------------------------------------------

void writeCapabilities(ByteWriter& w, const Capabilities& caps) {
    w.str(caps.encoding);
    w.u8(caps.ansi ? 1 : 0);
    w.u16(caps.screenWidth);
    w.u16(caps.screenHeight);
    w.str(caps.clientName);
}

Capabilities readCapabilities(ByteReader& r) {
    Capabilities caps;
    caps.encoding = r.str();
    caps.ansi = r.u8() != 0;
    caps.screenWidth = r.u16();
    caps.screenHeight = r.u16();
    caps.clientName = r.str();
    return caps;
}

struct PayloadWriter {
    ByteWriter& w;

    void operator()(const Hello& m) {
        w.u8(static_cast<uint8_t>(m.role));
        w.u16(m.revision);
        w.str(m.name);
        w.u32(m.pid);
    }
    void operator()(const Cmd& m) { w.u8(static_cast<uint8_t>(m.command)); }
    void operator()(const CommandResult& m) {
        w.u8(m.ok ? 1 : 0);
        w.u8(static_cast<uint8_t>(m.code));
        w.u8(static_cast<uint8_t>(m.engineState));
        w.u32(m.sessionCount);
        w.str(m.detail);
    }
    void operator()(const ResyncSession& m) {
        w.u64(m.sessionId.value());
        w.u8(static_cast<uint8_t>(m.protocol));
        w.u8(static_cast<uint8_t>(m.auth));
        w.u64(m.account.value());
        w.u64(m.puppet.value());
        writeCapabilities(w, m.capabilities);
    }
    void operator()(const ResyncDone& m) { w.u32(m.sessionCount); }
    void operator()(const ResyncFailed& m) {
        w.u64(m.sessionId.value());
        w.str(m.reason);
    }
    void operator()(const SessionCapabilities& m) {
        w.u64(m.sessionId.value());
        writeCapabilities(w, m.capabilities);
    }
    void operator()(const Data& m) {
        w.u64(m.sessionId.value());
        w.bytes(m.payload);
    }
    void operator()(const SessionUpdate& m) {
        w.u64(m.sessionId.value());
        w.u8(static_cast<uint8_t>(m.auth));
        w.u64(m.account.value());
        w.u64(m.puppet.value());
    }
    void operator()(const Disconnect& m) {
        w.u64(m.sessionId.value());
        w.str(m.reason);
    }
    void operator()(const DisconnectAll& m) { w.str(m.reason); }
    void operator()(const Announce& m) { w.str(m.text); }
    void operator()(const Shutdown& m) {
        w.u8(static_cast<uint8_t>(m.mode));
        w.str(m.reason);
    }
    void operator()(const Stopping& m) { w.u8(m.clean ? 1 : 0); }
};

std::optional<ControlMessage> readPayload(MessageKind kind, ByteReader& r) {
    switch (kind) {
        case MessageKind::Hello: {
            Hello m;
            m.role = readEnum<Role>(r, 2, 1);
            m.revision = r.u16();
            m.name = r.str();
            m.pid = r.u32();
            return m;
        }
        case MessageKind::Cmd: {
            Cmd m;
            m.command = readEnum<Command>(r, 5, 1);
            return m;
        }
        case MessageKind::Result: {
            CommandResult m;
            m.ok = r.u8() != 0;
            m.code = readEnum<ResultCode>(r, 4);
            m.engineState = readEnum<EngineState>(r, 3);
            m.sessionCount = r.u32();
            m.detail = r.str();
            return m;
        }
        case MessageKind::ResyncSession: {
            ResyncSession m;
            m.sessionId = SessionId(r.u64());
            m.protocol = readEnum<ProtocolKind>(r, 2);
            m.auth = readEnum<AuthState>(r, 1);
            m.account = AccountId(r.u64());
            m.puppet = PuppetId(r.u64());
            m.capabilities = readCapabilities(r);
            return m;
        }
        case MessageKind::ResyncDone:
            return ResyncDone{r.u32()};
        case MessageKind::ResyncFailed: {
            ResyncFailed m;
            m.sessionId = SessionId(r.u64());
            m.reason = r.str();
            return m;
        }
        case MessageKind::Capabilities: {
            SessionCapabilities m;
            m.sessionId = SessionId(r.u64());
            m.capabilities = readCapabilities(r);
            return m;
        }
        case MessageKind::Data: {
            Data m;
            m.sessionId = SessionId(r.u64());
            m.payload = r.bytes();
            return m;
        }
        case MessageKind::SessionUpdate: {
            SessionUpdate m;
            m.sessionId = SessionId(r.u64());
            m.auth = readEnum<AuthState>(r, 1);
            m.account = AccountId(r.u64());
            m.puppet = PuppetId(r.u64());
            return m;
        }
        case MessageKind::Disconnect: {
            Disconnect m;
            m.sessionId = SessionId(r.u64());
            m.reason = r.str();
            return m;
        }
        case MessageKind::DisconnectAll:
            return DisconnectAll{r.str()};
        case MessageKind::Announce:
            return Announce{r.str()};
        case MessageKind::Shutdown: {
            Shutdown m;
            m.mode = readEnum<ShutdownMode>(r, 1);
            m.reason = r.str();
            return m;
        }
        case MessageKind::Stopping:
            return Stopping{r.u8() != 0};
    }
    return std::nullopt;
}

bool isKnownKind(uint16_t raw) {
    switch (static_cast<MessageKind>(raw)) {
        case MessageKind::Hello:
        case MessageKind::Cmd:
        case MessageKind::Result:
        case MessageKind::ResyncSession:
        case MessageKind::ResyncDone:
        case MessageKind::ResyncFailed:
        case MessageKind::Capabilities:
        case MessageKind::Data:
        case MessageKind::SessionUpdate:
        case MessageKind::Disconnect:
        case MessageKind::DisconnectAll:
        case MessageKind::Announce:
        case MessageKind::Shutdown:
        case MessageKind::Stopping:
            return true;
    }
    return false;
}

uint32_t readFrameLength(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

} // namespace

// ---------------------------------------------------------------------------
// encode()
// ---------------------------------------------------------------------------

std::vector<uint8_t> encode(const ControlMessage& msg) {
    ByteWriter w;
    // Placeholder length, patched once the payload is written.
    w.u32(0);
    w.u16(static_cast<uint16_t>(kindOf(msg)));
    std::visit(PayloadWriter{w}, msg);

    auto& buf = w.buffer();
    const auto total = static_cast<uint32_t>(buf.size());
    buf[0] = static_cast<uint8_t>((total >> 24) & 0xFF);
    buf[1] = static_cast<uint8_t>((total >> 16) & 0xFF);
    buf[2] = static_cast<uint8_t>((total >> 8) & 0xFF);
    buf[3] = static_cast<uint8_t>(total & 0xFF);
    return std::move(buf);
}

// ---------------------------------------------------------------------------
// decodeFrame()
// ---------------------------------------------------------------------------

ServiceResult<ControlMessage> decodeFrame(std::span<const uint8_t> frame) {
    if (frame.size() < kFrameHeaderSize) {
        return ServiceResult<ControlMessage>::err(
            ServiceError(ErrorCode::FrameTooShort, "frame shorter than header"));
    }

    const uint32_t total = readFrameLength(frame.data());
    if (total < kFrameHeaderSize || total != frame.size()) {
        return ServiceResult<ControlMessage>::err(
            ServiceError(ErrorCode::FrameTooShort,
                         "frame length " + std::to_string(total) + " does not match " +
                             std::to_string(frame.size()) + " bytes"));
    }
    if (total > kMaxFrameSize) {
        return ServiceResult<ControlMessage>::err(
            ServiceError(ErrorCode::FrameTooLarge,
                         "frame of " + std::to_string(total) + " bytes exceeds limit"));
    }

    const auto rawKind = static_cast<uint16_t>((frame[4] << 8) | frame[5]);
    if (!isKnownKind(rawKind)) {
        return ServiceResult<ControlMessage>::err(
            ServiceError(ErrorCode::UnknownMessageKind,
                         "unknown message kind " + std::to_string(rawKind)));
    }
    const auto kind = static_cast<MessageKind>(rawKind);

    ByteReader reader(frame.subspan(kFrameHeaderSize));
    auto msg = readPayload(kind, reader);
    if (!msg || !reader.ok() || !reader.atEnd()) {
        return ServiceResult<ControlMessage>::err(
            ServiceError(ErrorCode::MalformedPayload,
                         "malformed " + std::string(messageKindName(kind)) + " payload"));
    }
    return ServiceResult<ControlMessage>::ok(std::move(*msg));
}

// ---------------------------------------------------------------------------
// FrameDecoder
// ---------------------------------------------------------------------------

FrameDecoder::FrameDecoder(std::size_t maxFrameSize)
    : maxFrameSize_(std::min(maxFrameSize, kMaxFrameSize)) {}

ServiceResult<void> FrameDecoder::feed(std::span<const uint8_t> bytes,
                                       std::vector<ControlMessage>& out) {
    if (failed_) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ProtocolError, "decoder already failed"));
    }

    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());

    std::size_t offset = 0;
    auto fail = [&](ServiceError error) {
        failed_ = true;
        buffer_.clear();
        return ServiceResult<void>::err(std::move(error));
    };

    while (buffer_.size() - offset >= 4) {
        const uint32_t total = readFrameLength(buffer_.data() + offset);
        if (total < kFrameHeaderSize) {
            return fail(ServiceError(ErrorCode::FrameTooShort,
                                     "declared frame length " + std::to_string(total) +
                                         " below header size"));
        }
        // Reject oversized frames as soon as the length is visible instead
        // of buffering them.
        if (total > maxFrameSize_) {
            return fail(ServiceError(ErrorCode::FrameTooLarge,
                                     "declared frame length " + std::to_string(total) +
                                         " exceeds limit"));
        }
        if (buffer_.size() - offset < total) {
            break;
        }

        auto decoded = decodeFrame(std::span<const uint8_t>(buffer_.data() + offset, total));
        if (!decoded) {
            return fail(decoded.error());
        }
        out.push_back(std::move(decoded).value());
        offset += total;
    }

    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
    return ServiceResult<void>::ok();
}

void FrameDecoder::reset() {
    buffer_.clear();
    failed_ = false;
}

} // namespace sgw::control
