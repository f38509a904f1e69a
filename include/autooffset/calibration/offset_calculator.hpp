/**
 * @file offset_calculator.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <cstdint>
#include <optional>

#include "autooffset/core/measurement.hpp"

namespace aof {

/**
 * @brief Maps a batch average onto a tool-offset correction.
 *
 * correction = (basicSize - average + manualOffset) * offsetRate
 */
class OffsetCalculator {
public:
    static double correction(double basicSize, double average, double manualOffset, double offsetRate);

    /**
     * @brief Correction for a profile; empty when inactive or no average is known.
     */
    static std::optional<double> correctionFor(const ToolProfile& profile);

    /**
     * @brief Scale to controller fixed-point units, rounding half away from zero.
     *
     * Empty when the correction is not finite or does not fit a controller offset.
     */
    static std::optional<std::int32_t> toControllerUnits(double correction, std::int32_t scale = kFixedPointScale);
};

} // namespace aof
