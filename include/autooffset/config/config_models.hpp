/**
 * @file config_models.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "autooffset/core/measurement.hpp"
#include "autooffset/gauge/measurement_router.hpp"

namespace aof {

/**
 * @brief Gauge connection and wire-protocol parameters.
 *
 * Command hex strings are decoded at startup; empty strings select the
 * built-in command set.
 */
struct GaugeConfig {
    std::string host = "192.168.0.100";
    std::uint16_t port = 5002;
    bool simulate = false;
    std::uint32_t pollIntervalMs = 200;
    std::uint32_t reconnectBackoffMs = 5000;
    std::uint32_t receiveTimeoutMs = 50;
    int connectTimeoutMs = 3000;
    std::string readCommandHex;
    std::string resetAssertHex;
    std::string resetClearHex;
    ResetProtocol resetProtocol = ResetProtocol::Handshake;
    std::vector<std::size_t> slotOffsets{31, 35};
    std::size_t minimumFrameBytes = 51;
    std::uint32_t simulatorFrameIntervalMs = 1000;
};

struct MachineConfig {
    std::uint16_t id = 0;
    std::string name;
    std::string ip;
    std::uint16_t port = 8193;
    std::uint32_t timeoutSeconds = 10;

    bool simulated() const { return ip == "dummy"; }
};

struct AppConfig {
    GaugeConfig gauge;
    std::vector<MachineConfig> machines;
    std::vector<ToolProfile> tools;
    std::size_t batchThreshold = 5;
    std::int32_t offsetScale = kFixedPointScale;
    std::string historyPath;
    std::size_t historyMemoryLimit = 1000;
    std::uint32_t pollerIntervalMs = 1000;
    std::uint32_t controllerReconnectBackoffMs = 5000;

    /**
     * @brief Two lathes with tool slots 11 and 12 at basic size 48.0.
     */
    static AppConfig defaults();
};

} // namespace aof
