#pragma once

/// @file control_codec.hpp
/// @brief Binary encoding of control messages and stream reassembly.
///
/// Frame layout (all integers big-endian):
///   [4 bytes: total frame length, header included]
///   [2 bytes: MessageKind]
///   [N bytes: payload]
///
/// Payload fields are u8/u16/u32/u64; strings and byte blobs are a u32
/// length followed by the bytes.

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "sgw/control/control_message.hpp"
#include "sgw/foundation/service_result.hpp"

namespace sgw::control {

using foundation::ServiceError;
using foundation::ServiceResult;

inline constexpr std::size_t kFrameHeaderSize = 6;
inline constexpr std::size_t kMaxFrameSize = 1024 * 1024;

/// Largest DATA payload that fits one frame (session id u64, length u32).
inline constexpr std::size_t kMaxDataPayload = kMaxFrameSize - kFrameHeaderSize - 8 - 4;

/// Largest string in a message whose payload is one string (ANNOUNCE,
/// DISCONNECT_ALL).
inline constexpr std::size_t kMaxTextField = kMaxFrameSize - kFrameHeaderSize - 4;

/// Cut @p text into pieces of at most @p limit bytes, in order.
///
/// A piece ends after the last newline that fits when there is one, so
/// line-oriented clients never see a line broken in two unless a single
/// line is longer than @p limit.
[[nodiscard]] std::vector<std::string_view> splitText(std::string_view text, std::size_t limit);

/// Serialize a message into one complete frame.
[[nodiscard]] std::vector<uint8_t> encode(const ControlMessage& msg);

/// Parse exactly one complete frame.
///
/// Errors: FrameTooShort, FrameTooLarge, UnknownMessageKind,
/// MalformedPayload (truncated field, bad enum value, trailing bytes).
[[nodiscard]] ServiceResult<ControlMessage> decodeFrame(std::span<const uint8_t> frame);

/// Reassembles frames from a byte stream that may split or coalesce them.
///
/// After the first error the decoder stays failed; the owner is expected
/// to close the connection once it has handled the messages completed
/// before the bad frame.
///
/// @code
///   FrameDecoder decoder;
///   std::vector<ControlMessage> messages;
///   auto fed = decoder.feed(bytes, messages);
///   for (auto& msg : messages) { dispatch(msg); }
///   if (!fed) { close(conn); }
/// @endcode
class FrameDecoder {
public:
    explicit FrameDecoder(std::size_t maxFrameSize = kMaxFrameSize);

    /// Append bytes and add every message they complete to @p out.
    ///
    /// On a framing error the messages decoded ahead of the bad frame are
    /// still appended to @p out.
    [[nodiscard]] ServiceResult<void> feed(std::span<const uint8_t> bytes,
                                           std::vector<ControlMessage>& out);

    /// Bytes held for an incomplete frame.
    [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size(); }

    [[nodiscard]] bool failed() const noexcept { return failed_; }

    void reset();

private:
    std::size_t maxFrameSize_;
    std::vector<uint8_t> buffer_;
    bool failed_ = false;
};

} // namespace sgw::control
