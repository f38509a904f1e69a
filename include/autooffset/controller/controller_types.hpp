/**
 * @file controller_types.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <cstdint>
#include <string>

namespace aof {

enum class ControllerStatus {
    Ok,
    Busy,
    Unreachable,
    NativeError,
    UnknownMachine,
    Shutdown,
};

const char* toString(ControllerStatus status);

/**
 * @brief Outcome of one controller call; `value` is only meaningful for reads.
 */
struct ControllerResult {
    ControllerStatus status = ControllerStatus::Ok;
    std::int32_t value = 0;
    std::string message;

    bool ok() const noexcept { return status == ControllerStatus::Ok; }
};

struct ControllerEndpoint {
    std::string ip;
    std::uint16_t port = 8193;
    std::uint32_t timeoutSeconds = 10;

    std::string describe() const { return ip + ":" + std::to_string(port); }
};

} // namespace aof
