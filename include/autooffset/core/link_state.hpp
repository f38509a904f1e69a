/**
 * @file link_state.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <cstdint>

namespace aof {

enum class LinkState : std::uint8_t {
    Disconnected = 0,
    Connecting = 1,
    Connected = 2,
};

inline const char* toString(LinkState state) {
    switch (state) {
    case LinkState::Disconnected:
        return "DISCONNECTED";
    case LinkState::Connecting:
        return "CONNECTING";
    case LinkState::Connected:
        return "CONNECTED";
    }
    return "UNKNOWN";
}

} // namespace aof
