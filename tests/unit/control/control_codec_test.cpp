#include <gtest/gtest.h>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "sgw/control/control_codec.hpp"
#include "sgw/control/control_message.hpp"

using namespace sgw::control;
using sgw::foundation::AccountId;
using sgw::foundation::ErrorCode;
using sgw::foundation::PuppetId;
using sgw::foundation::SessionId;

// =============================================================================
// Frame layout
// =============================================================================

TEST(ControlCodecTest, HelloFrameLayout) {
    Hello hello;
    hello.role = Role::Engine;
    hello.revision = 1;
    hello.name = "e";
    hello.pid = 7;

    auto frame = encode(hello);
    const std::vector<uint8_t> expected = {
        0x00, 0x00, 0x00, 0x12,        // total length 18
        0x00, 0x01,                    // HELLO
        0x01,                          // role engine
        0x00, 0x01,                    // revision
        0x00, 0x00, 0x00, 0x01, 'e',   // name
        0x00, 0x00, 0x00, 0x07         // pid
    };
    EXPECT_EQ(frame, expected);
}

TEST(ControlCodecTest, ResyncSessionKeepsEveryField) {
    ResyncSession resync;
    resync.sessionId = SessionId(42);
    resync.protocol = ProtocolKind::WebSocket;
    resync.auth = AuthState::Authenticated;
    resync.account = AccountId(0x1122334455667788ULL);
    resync.puppet = PuppetId(9);
    resync.capabilities.ansi = true;
    resync.capabilities.screenWidth = 132;
    resync.capabilities.clientName = "mudlet";

    auto decoded = decodeFrame(encode(resync));
    ASSERT_TRUE(decoded.hasValue()) << decoded.error().message();
    ASSERT_EQ(kindOf(decoded.value()), MessageKind::ResyncSession);
    EXPECT_EQ(std::get<ResyncSession>(decoded.value()), resync);
}

TEST(ControlCodecTest, DataCarriesText) {
    auto decoded = decodeFrame(encode(makeData(SessionId(3), "look north")));
    ASSERT_TRUE(decoded.hasValue());
    const auto& data = std::get<Data>(decoded.value());
    EXPECT_EQ(data.sessionId, SessionId(3));
    EXPECT_EQ(payloadText(data), "look north");
}

TEST(ControlCodecTest, ResultCarriesStateAndDetail) {
    CommandResult result;
    result.ok = false;
    result.code = ResultCode::OperationInProgress;
    result.engineState = EngineState::Stopping;
    result.sessionCount = 3;
    result.detail = "operation in progress";

    auto decoded = decodeFrame(encode(result));
    ASSERT_TRUE(decoded.hasValue());
    const auto& back = std::get<CommandResult>(decoded.value());
    EXPECT_FALSE(back.ok);
    EXPECT_EQ(back.code, ResultCode::OperationInProgress);
    EXPECT_EQ(back.engineState, EngineState::Stopping);
    EXPECT_EQ(back.sessionCount, 3u);
    EXPECT_EQ(back.detail, "operation in progress");
}

// =============================================================================
// decodeFrame errors
// =============================================================================

TEST(ControlCodecTest, ShortFrameRejected) {
    const std::vector<uint8_t> frame = {0x00, 0x00, 0x00, 0x06, 0x00};
    auto decoded = decodeFrame(frame);
    ASSERT_TRUE(decoded.hasError());
    EXPECT_EQ(decoded.error().code(), ErrorCode::FrameTooShort);
}

TEST(ControlCodecTest, UnknownKindRejected) {
    const std::vector<uint8_t> frame = {0x00, 0x00, 0x00, 0x06, 0x7F, 0x7F};
    auto decoded = decodeFrame(frame);
    ASSERT_TRUE(decoded.hasError());
    EXPECT_EQ(decoded.error().code(), ErrorCode::UnknownMessageKind);
}

TEST(ControlCodecTest, TrailingBytesRejected) {
    auto frame = encode(Stopping{true});
    frame.push_back(0xFF);
    frame[3] = static_cast<uint8_t>(frame.size());
    auto decoded = decodeFrame(frame);
    ASSERT_TRUE(decoded.hasError());
    EXPECT_EQ(decoded.error().code(), ErrorCode::MalformedPayload);
}

TEST(ControlCodecTest, BadEnumValueRejected) {
    auto frame = encode(Cmd{Command::Reload});
    frame.back() = 0x42;
    auto decoded = decodeFrame(frame);
    ASSERT_TRUE(decoded.hasError());
    EXPECT_EQ(decoded.error().code(), ErrorCode::MalformedPayload);
}

// =============================================================================
// FrameDecoder
// =============================================================================

TEST(FrameDecoderTest, ReassemblesSplitFrame) {
    auto frame = encode(Announce{"server going down"});
    FrameDecoder decoder;
    std::vector<ControlMessage> out;

    ASSERT_TRUE(decoder.feed(std::span<const uint8_t>(frame.data(), 5), out).hasValue());
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(decoder.buffered(), 5u);

    ASSERT_TRUE(
        decoder.feed(std::span<const uint8_t>(frame.data() + 5, frame.size() - 5), out).hasValue());
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(std::get<Announce>(out[0]).text, "server going down");
    EXPECT_EQ(decoder.buffered(), 0u);
}

TEST(FrameDecoderTest, SplitsCoalescedFramesInOrder) {
    std::vector<uint8_t> stream;
    for (const ControlMessage& msg :
         {ControlMessage(makeData(SessionId(1), "a")), ControlMessage(makeData(SessionId(1), "b")),
          ControlMessage(ResyncDone{2})}) {
        auto frame = encode(msg);
        stream.insert(stream.end(), frame.begin(), frame.end());
    }

    FrameDecoder decoder;
    std::vector<ControlMessage> out;
    ASSERT_TRUE(decoder.feed(stream, out).hasValue());
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(payloadText(std::get<Data>(out[0])), "a");
    EXPECT_EQ(payloadText(std::get<Data>(out[1])), "b");
    EXPECT_EQ(std::get<ResyncDone>(out[2]).sessionCount, 2u);
}

TEST(FrameDecoderTest, KeepsFramesDecodedBeforeError) {
    auto stream = encode(makeData(SessionId(4), "last words"));
    const std::vector<uint8_t> oversized = {0x00, 0x20, 0x00, 0x00, 0x00, 0x20};
    stream.insert(stream.end(), oversized.begin(), oversized.end());

    FrameDecoder decoder;
    std::vector<ControlMessage> out;
    auto fed = decoder.feed(stream, out);
    ASSERT_TRUE(fed.hasError());
    EXPECT_EQ(fed.error().code(), ErrorCode::FrameTooLarge);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(payloadText(std::get<Data>(out[0])), "last words");
}

TEST(FrameDecoderTest, OversizedLengthFailsBeforeBuffering) {
    const std::vector<uint8_t> header = {0x00, 0x20, 0x00, 0x00, 0x00, 0x20};
    FrameDecoder decoder;
    std::vector<ControlMessage> out;
    auto fed = decoder.feed(header, out);
    ASSERT_TRUE(fed.hasError());
    EXPECT_EQ(fed.error().code(), ErrorCode::FrameTooLarge);
    EXPECT_TRUE(decoder.failed());
    EXPECT_EQ(decoder.buffered(), 0u);

    // Stays failed.
    EXPECT_TRUE(decoder.feed(encode(Stopping{true}), out).hasError());
    EXPECT_TRUE(out.empty());
}

TEST(FrameDecoderTest, LengthBelowHeaderFails) {
    const std::vector<uint8_t> header = {0x00, 0x00, 0x00, 0x02};
    FrameDecoder decoder;
    std::vector<ControlMessage> out;
    auto fed = decoder.feed(header, out);
    ASSERT_TRUE(fed.hasError());
    EXPECT_EQ(fed.error().code(), ErrorCode::FrameTooShort);
}

TEST(FrameDecoderTest, ResetClearsFailure) {
    FrameDecoder decoder;
    std::vector<ControlMessage> out;
    const std::vector<uint8_t> bad = {0x00, 0x00, 0x00, 0x01};
    ASSERT_TRUE(decoder.feed(bad, out).hasError());
    decoder.reset();
    EXPECT_FALSE(decoder.failed());
    ASSERT_TRUE(decoder.feed(encode(Stopping{false}), out).hasValue());
    ASSERT_EQ(out.size(), 1u);
    EXPECT_FALSE(std::get<Stopping>(out[0]).clean);
}

// =============================================================================
// Large payloads
// =============================================================================

TEST(SplitTextTest, ShortTextIsOnePiece) {
    auto pieces = splitText("hello\nworld\n", 64);
    ASSERT_EQ(pieces.size(), 1u);
    EXPECT_EQ(pieces[0], "hello\nworld\n");
}

TEST(SplitTextTest, CutsAtLastNewlineWithinLimit) {
    auto pieces = splitText("aaaa\nbb\ncccc\ndd", 8);
    ASSERT_EQ(pieces.size(), 3u);
    EXPECT_EQ(pieces[0], "aaaa\nbb\n");
    EXPECT_EQ(pieces[1], "cccc\n");
    EXPECT_EQ(pieces[2], "dd");
}

TEST(SplitTextTest, HardCutsLongLines) {
    const std::string line(20, 'x');
    auto pieces = splitText(line, 8);
    ASSERT_EQ(pieces.size(), 3u);
    EXPECT_EQ(pieces[0].size(), 8u);
    EXPECT_EQ(pieces[1].size(), 8u);
    EXPECT_EQ(pieces[2].size(), 4u);
}

TEST(SplitTextTest, EveryPieceFitsAFrame) {
    std::string text;
    while (text.size() < kMaxDataPayload * 2 + 100) {
        text += "The quick brown fox jumps over the lazy dog.\n";
    }
    auto pieces = splitText(text, kMaxDataPayload);
    ASSERT_GE(pieces.size(), 3u);

    std::string joined;
    for (auto piece : pieces) {
        auto frame = encode(makeData(SessionId(1), piece));
        EXPECT_LE(frame.size(), kMaxFrameSize);
        joined.append(piece);
    }
    EXPECT_EQ(joined, text);
}

TEST(ControlCodecTest, CapabilitiesKeepsSessionAndSet) {
    SessionCapabilities update;
    update.sessionId = SessionId(11);
    update.capabilities.screenWidth = 120;
    update.capabilities.screenHeight = 40;
    update.capabilities.clientName = "MUDLET";
    update.capabilities.ansi = true;

    auto decoded = decodeFrame(encode(update));
    ASSERT_TRUE(decoded.hasValue()) << decoded.error().message();
    ASSERT_EQ(kindOf(decoded.value()), MessageKind::Capabilities);
    const auto& got = std::get<SessionCapabilities>(decoded.value());
    EXPECT_EQ(got.sessionId, SessionId(11));
    EXPECT_EQ(got.capabilities, update.capabilities);
    EXPECT_EQ(messageKindName(MessageKind::Capabilities), "CAPABILITIES");
}

// =============================================================================
// Names
// =============================================================================

TEST(ControlMessageTest, CommandNamesParse) {
    EXPECT_EQ(parseCommand("reload"), Command::Reload);
    EXPECT_EQ(parseCommand("SHUTDOWN"), Command::Shutdown);
    EXPECT_FALSE(parseCommand("restart").has_value());
    EXPECT_EQ(commandName(Command::Status), "status");
}

TEST(ControlMessageTest, KindNames) {
    EXPECT_EQ(messageKindName(MessageKind::ResyncSession), "RESYNC_SESSION");
    EXPECT_EQ(messageKindName(MessageKind::DisconnectAll), "DISCONNECT_ALL");
    EXPECT_EQ(kindOf(Shutdown{}), MessageKind::Shutdown);
    EXPECT_EQ(engineStateName(EngineState::Running), "running");
}
