#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define SGW_VERSION_MAJOR 0
#define SGW_VERSION_MINOR 3
#define SGW_VERSION_PATCH 0
#define SGW_VERSION_STRING "0.3.0"

/// Control protocol revision announced in HELLO. Bumped on any wire change.
#define SGW_PROTOCOL_REVISION 2

namespace sgw {

/// Project version information at compile time.
struct Version {
    static constexpr int major = SGW_VERSION_MAJOR;
    static constexpr int minor = SGW_VERSION_MINOR;
    static constexpr int patch = SGW_VERSION_PATCH;
    static constexpr const char* string = SGW_VERSION_STRING;
    static constexpr int protocolRevision = SGW_PROTOCOL_REVISION;
};

} // namespace sgw
