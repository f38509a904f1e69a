#include "autooffset/calibration/tool_profile_table.hpp"

#include <algorithm>

#include "autooffset/calibration/offset_calculator.hpp"

namespace aof {

void ToolProfileTable::upsert(const ToolProfile& profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* existing = findLocked(profile.machineId, profile.toolSlot);
    if (existing == nullptr) {
        auto& slots = profiles_[profile.machineId];
        slots.push_back(profile);
        std::sort(slots.begin(), slots.end(),
                  [](const ToolProfile& a, const ToolProfile& b) { return a.toolSlot < b.toolSlot; });
        existing = findLocked(profile.machineId, profile.toolSlot);
    } else {
        *existing = profile;
    }
    recompute(*existing);
}

bool ToolProfileTable::remove(std::uint16_t machineId, std::int16_t toolSlot) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = profiles_.find(machineId);
    if (it == profiles_.end()) {
        return false;
    }
    auto& slots = it->second;
    const auto before = slots.size();
    slots.erase(std::remove_if(slots.begin(), slots.end(),
                               [toolSlot](const ToolProfile& p) { return p.toolSlot == toolSlot; }),
                slots.end());
    const bool removed = before != slots.size();
    if (slots.empty()) {
        profiles_.erase(it);
    }
    return removed;
}

std::optional<ToolProfile> ToolProfileTable::find(std::uint16_t machineId, std::int16_t toolSlot) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = profiles_.find(machineId);
    if (it == profiles_.end()) {
        return std::nullopt;
    }
    for (const auto& profile : it->second) {
        if (profile.toolSlot == toolSlot) {
            return profile;
        }
    }
    return std::nullopt;
}

std::vector<ToolProfile> ToolProfileTable::profilesFor(std::uint16_t machineId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = profiles_.find(machineId);
    if (it == profiles_.end()) {
        return {};
    }
    return it->second;
}

std::vector<ToolProfile> ToolProfileTable::allProfiles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ToolProfile> out;
    for (const auto& [machineId, slots] : profiles_) {
        out.insert(out.end(), slots.begin(), slots.end());
    }
    return out;
}

bool ToolProfileTable::hasMachine(std::uint16_t machineId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return profiles_.find(machineId) != profiles_.end();
}

std::vector<ToolProfile> ToolProfileTable::recordAverage(std::uint16_t machineId, double average) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = profiles_.find(machineId);
    if (it == profiles_.end()) {
        return {};
    }
    for (auto& profile : it->second) {
        profile.lastAvgMeasurement = average;
        recompute(profile);
    }
    return it->second;
}

bool ToolProfileTable::updateCalibration(std::uint16_t machineId,
                                         std::int16_t toolSlot,
                                         double basicSize,
                                         double manualOffset,
                                         double offsetRate,
                                         bool active) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* profile = findLocked(machineId, toolSlot);
    if (profile == nullptr) {
        return false;
    }
    profile->basicSize = basicSize;
    profile->manualOffset = manualOffset;
    profile->offsetRate = offsetRate;
    profile->active = active;
    recompute(*profile);
    return true;
}

void ToolProfileTable::recompute(ToolProfile& profile) {
    if (!profile.lastAvgMeasurement.has_value()) {
        profile.lastComputedOffset.reset();
        return;
    }
    profile.lastComputedOffset = OffsetCalculator::correction(
        profile.basicSize, *profile.lastAvgMeasurement, profile.manualOffset, profile.offsetRate);
}

ToolProfile* ToolProfileTable::findLocked(std::uint16_t machineId, std::int16_t toolSlot) {
    const auto it = profiles_.find(machineId);
    if (it == profiles_.end()) {
        return nullptr;
    }
    for (auto& profile : it->second) {
        if (profile.toolSlot == toolSlot) {
            return &profile;
        }
    }
    return nullptr;
}

} // namespace aof
