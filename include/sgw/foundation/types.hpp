#pragma once

/// @file types.hpp
/// @brief Strong ID types shared by the gateway, engine and launcher.

#include <cstdint>
#include <functional>

namespace sgw::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// A session id, a connection id and a puppet id are all 64-bit integers on
/// the wire; the tag keeps them from being mixed up in code.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct SessionIdTag {};
struct ConnectionIdTag {};
struct AccountIdTag {};
struct PuppetIdTag {};

/// Gateway-assigned client session identifier, stable for the socket lifetime.
using SessionId = StrongId<SessionIdTag>;

/// Transport-level connection identifier issued by the network layer.
using ConnectionId = StrongId<ConnectionIdTag>;

/// Authenticated account identifier (opaque to the gateway).
using AccountId = StrongId<AccountIdTag>;

/// In-world entity a session controls (opaque to the gateway).
using PuppetId = StrongId<PuppetIdTag>;

} // namespace sgw::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<sgw::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const sgw::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
