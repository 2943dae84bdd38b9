/// @file gateway_types.cpp
/// @brief Policy name parsing for gateway configuration.

#include "sgw/service/gateway_types.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace sgw::service {

namespace {

std::string lowered(std::string_view name) {
    std::string out(name);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

} // namespace

std::optional<InputQueuePolicy> parseInputQueuePolicy(std::string_view name) {
    auto key = lowered(name);
    if (key == inputQueuePolicyName(InputQueuePolicy::DropOldest)) {
        return InputQueuePolicy::DropOldest;
    }
    if (key == inputQueuePolicyName(InputQueuePolicy::RejectNew)) {
        return InputQueuePolicy::RejectNew;
    }
    return std::nullopt;
}

std::optional<OutputOverflowPolicy> parseOutputOverflowPolicy(std::string_view name) {
    auto key = lowered(name);
    if (key == outputOverflowPolicyName(OutputOverflowPolicy::Drop)) {
        return OutputOverflowPolicy::Drop;
    }
    if (key == outputOverflowPolicyName(OutputOverflowPolicy::Disconnect)) {
        return OutputOverflowPolicy::Disconnect;
    }
    return std::nullopt;
}

} // namespace sgw::service
