/**
 * @file batch_aggregator.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "autooffset/calibration/tool_profile_table.hpp"

namespace aof {

/**
 * @brief Per-machine sample queues reduced to a trimmed mean once a batch fills.
 */
class BatchAggregator {
public:
    using AvailabilityFn = std::function<bool(std::uint16_t machineId)>;

    static constexpr std::size_t kDefaultThreshold = 5U;
    static constexpr std::size_t kMaxThreshold = 30U;

    BatchAggregator(ToolProfileTable& profiles, AvailabilityFn availability);

    void insert(std::uint16_t machineId, double value);

    /**
     * @brief Drain a full batch and store its trimmed mean on the machine's profiles.
     *
     * Returns nothing while the batch is incomplete or the machine controller is
     * unavailable. A full batch for an unavailable machine is discarded.
     */
    std::optional<double> tryExtract(std::uint16_t machineId);

    bool setThreshold(std::size_t threshold, std::string& outError);
    std::size_t threshold() const;
    std::size_t pendingCount(std::uint16_t machineId) const;
    std::uint64_t discardedBatches() const;

    /**
     * @brief Mean after dropping one minimum and one maximum (when more than two values).
     */
    static std::optional<double> trimmedMean(std::vector<double> values);

private:
    ToolProfileTable& profiles_;
    AvailabilityFn availability_;
    mutable std::mutex mutex_;
    std::size_t threshold_ = kDefaultThreshold;
    std::uint64_t discardedBatches_ = 0;
    std::map<std::uint16_t, std::vector<double>> queues_;
};

} // namespace aof
