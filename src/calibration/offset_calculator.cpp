#include "autooffset/calibration/offset_calculator.hpp"

#include <cmath>
#include <limits>

namespace aof {

double OffsetCalculator::correction(double basicSize, double average, double manualOffset, double offsetRate) {
    return (basicSize - average + manualOffset) * offsetRate;
}

std::optional<double> OffsetCalculator::correctionFor(const ToolProfile& profile) {
    if (!profile.active || !profile.lastAvgMeasurement.has_value()) {
        return std::nullopt;
    }
    return correction(profile.basicSize, *profile.lastAvgMeasurement, profile.manualOffset,
                      profile.offsetRate);
}

std::optional<std::int32_t> OffsetCalculator::toControllerUnits(double correction, std::int32_t scale) {
    // std::round rounds halfway cases away from zero.
    const double scaled = std::round(correction * static_cast<double>(scale));
    if (!std::isfinite(scaled) || scaled < static_cast<double>(std::numeric_limits<std::int32_t>::min()) ||
        scaled > static_cast<double>(std::numeric_limits<std::int32_t>::max())) {
        return std::nullopt;
    }
    return static_cast<std::int32_t>(scaled);
}

} // namespace aof
