/**
 * @file tool_profile_table.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include "autooffset/core/measurement.hpp"

namespace aof {

/**
 * @brief Thread-safe registry of tool profiles keyed by machine, then slot.
 *
 * Every mutation recomputes `lastComputedOffset` from the stored average and
 * calibration parameters so the derived value never drifts.
 */
class ToolProfileTable {
public:
    void upsert(const ToolProfile& profile);
    bool remove(std::uint16_t machineId, std::int16_t toolSlot);

    std::optional<ToolProfile> find(std::uint16_t machineId, std::int16_t toolSlot) const;
    std::vector<ToolProfile> profilesFor(std::uint16_t machineId) const;
    std::vector<ToolProfile> allProfiles() const;
    bool hasMachine(std::uint16_t machineId) const;

    /**
     * @brief Store a new batch average on every profile of the machine.
     * @return updated snapshots, empty when the machine has no profiles.
     */
    std::vector<ToolProfile> recordAverage(std::uint16_t machineId, double average);

    bool updateCalibration(std::uint16_t machineId,
                           std::int16_t toolSlot,
                           double basicSize,
                           double manualOffset,
                           double offsetRate,
                           bool active);

private:
    static void recompute(ToolProfile& profile);
    ToolProfile* findLocked(std::uint16_t machineId, std::int16_t toolSlot);

    mutable std::mutex mutex_;
    std::map<std::uint16_t, std::vector<ToolProfile>> profiles_;
};

} // namespace aof
