/**
 * @file measurement.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace aof {

/**
 * @brief Fixed-point scale shared by gauge slots and controller offsets (1e-4 units).
 */
constexpr std::int32_t kFixedPointScale = 10000;

inline double fromFixedPoint(std::int32_t raw, std::int32_t scale = kFixedPointScale) {
    return static_cast<double>(raw) / static_cast<double>(scale);
}

/**
 * @brief One completed gauge cycle for one source line (machine).
 */
struct Measurement {
    std::uint16_t sourceLineId = 0;
    std::int32_t rawValue = 0;
    bool completionFlag = false;

    double value() const { return fromFixedPoint(rawValue); }
};

/**
 * @brief Calibration state of one physical tool on one machine.
 *
 * `lastComputedOffset` is derived from `lastAvgMeasurement` and the three
 * calibration parameters; only ToolProfileTable writes it.
 */
struct ToolProfile {
    std::uint16_t machineId = 0;
    std::int16_t toolSlot = 0;
    double basicSize = 0.0;
    double manualOffset = 0.0;
    double offsetRate = 1.0;
    bool active = true;
    std::optional<double> lastAvgMeasurement;
    std::optional<double> lastComputedOffset;
};

/**
 * @brief Immutable record for one attempted or detected offset write.
 */
struct OffsetChangeRecord {
    std::chrono::system_clock::time_point timestamp{};
    std::uint16_t machineId = 0;
    std::int16_t toolSlot = 0;
    std::int32_t oldValue = 0;
    std::int32_t delta = 0;
    std::int32_t newValue = 0;
    bool success = false;
};

} // namespace aof
