/// @file protocol_codec.cpp
/// @brief LineCodec, WebSocketCodec and ProtocolRegistry.

#include "sgw/service/protocol_codec.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace sgw::service {

using sgw::foundation::ErrorCode;
using sgw::foundation::ServiceError;
using sgw::foundation::ServiceResult;

namespace {

// Telnet command bytes (RFC 854).
constexpr uint8_t kIac = 255;
constexpr uint8_t kDont = 254;
constexpr uint8_t kDo = 253;
constexpr uint8_t kWill = 251;
constexpr uint8_t kSb = 250;
constexpr uint8_t kSe = 240;

// Options (RFC 1091, RFC 1073).
constexpr uint8_t kTtype = 24;
constexpr uint8_t kNaws = 31;
constexpr uint8_t kTtypeIs = 0;
constexpr uint8_t kTtypeSend = 1;

// Longest subnegotiation kept; the rest is dropped.
constexpr std::size_t kMaxSubnegotiation = 64;

// Terminal and client names that understand ANSI colour.
constexpr std::string_view kAnsiTerminals[] = {"ANSI",     "XTERM",  "VT100", "MUDLET",
                                               "MUSHCLIENT", "TINTIN", "ZMUD",  "CMUD"};

bool knownAnsiTerminal(std::string_view upperName) {
    return std::any_of(std::begin(kAnsiTerminals), std::end(kAnsiTerminals),
                       [upperName](std::string_view term) {
                           return upperName.find(term) != std::string_view::npos;
                       });
}

void stripLineEnding(std::string& text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
}

} // namespace

// ---------------------------------------------------------------------------
// CapabilityUpdate
// ---------------------------------------------------------------------------

bool CapabilityUpdate::applyTo(control::Capabilities& caps) const {
    auto before = caps;
    if (screenWidth) {
        caps.screenWidth = *screenWidth;
    }
    if (screenHeight) {
        caps.screenHeight = *screenHeight;
    }
    if (clientName) {
        caps.clientName = *clientName;
    }
    if (ansi) {
        caps.ansi = *ansi;
    }
    return !(caps == before);
}

// ---------------------------------------------------------------------------
// LineCodec
// ---------------------------------------------------------------------------

LineCodec::LineCodec(CodecOptions options)
    : options_(options) {}

DecodeResult LineCodec::decode(std::span<const uint8_t> bytes) {
    DecodeResult result;
    for (auto byte : bytes) {
        switch (state_) {
            case TelnetState::Data:
                if (byte == kIac) {
                    state_ = TelnetState::Iac;
                } else {
                    pushByte(byte, result.inputs);
                }
                break;

            case TelnetState::Iac:
                if (byte == kIac) {
                    // Escaped 0xFF data byte.
                    pushByte(byte, result.inputs);
                    state_ = TelnetState::Data;
                } else if (byte >= kWill && byte <= kDont) {
                    verb_ = byte;
                    state_ = TelnetState::Option;
                } else if (byte == kSb) {
                    sub_.clear();
                    state_ = TelnetState::Sub;
                } else {
                    // Two-byte command (NOP, GA, AYT, ...).
                    state_ = TelnetState::Data;
                }
                break;

            case TelnetState::Option:
                onOption(verb_, byte, result);
                state_ = TelnetState::Data;
                break;

            case TelnetState::Sub:
                if (byte == kIac) {
                    state_ = TelnetState::SubIac;
                } else if (sub_.size() < kMaxSubnegotiation) {
                    sub_.push_back(byte);
                }
                break;

            case TelnetState::SubIac:
                if (byte == kSe) {
                    onSubnegotiation(result);
                    sub_.clear();
                    state_ = TelnetState::Data;
                } else {
                    // IAC IAC inside a subnegotiation is a 0xFF data byte.
                    if (byte == kIac && sub_.size() < kMaxSubnegotiation) {
                        sub_.push_back(byte);
                    }
                    state_ = TelnetState::Sub;
                }
                break;
        }
    }
    return result;
}

void LineCodec::onOption(uint8_t verb, uint8_t option, DecodeResult& result) {
    // The client agreed to report its terminal type; ask for it.
    if (options_.negotiate && verb == kWill && option == kTtype) {
        result.reply.insert(result.reply.end(), {kIac, kSb, kTtype, kTtypeSend, kIac, kSe});
    }
}

void LineCodec::onSubnegotiation(DecodeResult& result) {
    if (sub_.empty()) {
        return;
    }

    if (sub_[0] == kNaws && sub_.size() >= 5) {
        auto width = static_cast<uint16_t>((sub_[1] << 8) | sub_[2]);
        auto height = static_cast<uint16_t>((sub_[3] << 8) | sub_[4]);
        // Zero means the client does not know.
        if (width != 0) {
            result.capabilities.screenWidth = width;
        }
        if (height != 0) {
            result.capabilities.screenHeight = height;
        }
        return;
    }

    if (sub_[0] == kTtype && sub_.size() >= 3 && sub_[1] == kTtypeIs) {
        std::string name(sub_.begin() + 2, sub_.end());
        std::string upper = name;
        std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
            return static_cast<char>(std::toupper(c));
        });
        result.capabilities.clientName = std::move(name);
        if (knownAnsiTerminal(upper)) {
            result.capabilities.ansi = true;
        }
    }
}

void LineCodec::pushByte(uint8_t byte, std::vector<std::string>& out) {
    if (byte == '\n') {
        if (discarding_) {
            discarding_ = false;
        } else {
            out.push_back(std::move(line_));
        }
        line_.clear();
        return;
    }
    if (byte == '\r' || byte == '\0' || discarding_) {
        return;
    }

    line_.push_back(static_cast<char>(byte));
    if (line_.size() > options_.maxInputBytes) {
        // Hand the oversized line up once and skip the remainder of it.
        out.push_back(std::move(line_));
        line_.clear();
        discarding_ = true;
    }
}

std::vector<uint8_t> LineCodec::encode(std::string_view text) const {
    std::vector<uint8_t> out;
    out.reserve(text.size() + 2);
    for (char c : text) {
        auto byte = static_cast<uint8_t>(c);
        if (byte == '\n') {
            out.push_back('\r');
            out.push_back('\n');
        } else if (byte == kIac) {
            out.push_back(kIac);
            out.push_back(kIac);
        } else if (byte != '\r') {
            out.push_back(byte);
        }
    }
    if (text.empty() || text.back() != '\n') {
        out.push_back('\r');
        out.push_back('\n');
    }
    return out;
}

std::vector<uint8_t> LineCodec::greeting() const {
    if (!options_.negotiate) {
        return {};
    }
    return {kIac, kDo, kNaws, kIac, kDo, kTtype};
}

// ---------------------------------------------------------------------------
// WebSocketCodec
// ---------------------------------------------------------------------------

WebSocketCodec::WebSocketCodec(CodecOptions options)
    : options_(options) {}

DecodeResult WebSocketCodec::decode(std::span<const uint8_t> bytes) {
    std::string text(bytes.begin(), bytes.end());
    stripLineEnding(text);
    if (text.size() > options_.maxInputBytes) {
        text.resize(options_.maxInputBytes + 1);
    }
    DecodeResult result;
    result.inputs.push_back(std::move(text));
    return result;
}

std::vector<uint8_t> WebSocketCodec::encode(std::string_view text) const {
    return std::vector<uint8_t>(text.begin(), text.end());
}

// ---------------------------------------------------------------------------
// ProtocolRegistry
// ---------------------------------------------------------------------------

ServiceResult<void> ProtocolRegistry::registerCodec(std::string name, CodecFactory factory) {
    if (factories_.count(name) > 0) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::AlreadyExists, "codec already registered: " + name));
    }
    factories_.emplace(std::move(name), std::move(factory));
    return ServiceResult<void>::ok();
}

ServiceResult<std::unique_ptr<ProtocolCodec>>
ProtocolRegistry::create(std::string_view name, const CodecOptions& options) const {
    using CreateResult = ServiceResult<std::unique_ptr<ProtocolCodec>>;

    auto it = factories_.find(std::string(name));
    if (it == factories_.end()) {
        return CreateResult::err(
            ServiceError(ErrorCode::NotFound, "unknown codec: " + std::string(name)));
    }

    auto codec = it->second(options);
    if (!codec) {
        return CreateResult::err(
            ServiceError(ErrorCode::Unknown, "codec factory returned nothing: " + std::string(name)));
    }
    return CreateResult::ok(std::move(codec));
}

bool ProtocolRegistry::contains(std::string_view name) const {
    return factories_.count(std::string(name)) > 0;
}

std::vector<std::string> ProtocolRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(factories_.size());
    for (const auto& [name, factory] : factories_) {
        out.push_back(name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

ProtocolRegistry ProtocolRegistry::withBuiltins() {
    ProtocolRegistry registry;
    (void)registry.registerCodec("line", [](const CodecOptions& options) {
        return std::make_unique<LineCodec>(options);
    });
    (void)registry.registerCodec("websocket", [](const CodecOptions& options) {
        return std::make_unique<WebSocketCodec>(options);
    });
    return registry;
}

} // namespace sgw::service
