/**
 * @file offset_poller.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

#include "autooffset/controller/controller_registry.hpp"
#include "autooffset/core/measurement.hpp"

namespace aof {

struct OffsetPollerOptions {
    std::chrono::milliseconds interval{1000};
};

/**
 * @brief Periodically reads tool offsets and reports values changed outside this process.
 *
 * The first successful read of a slot only seeds the baseline. Machines that are
 * busy, unreachable or reported by `skipMachine` are left out of the cycle.
 */
class OffsetPoller {
public:
    using SlotSource = std::function<std::vector<std::pair<std::uint16_t, std::int16_t>>()>;
    using RecordSink = std::function<void(const OffsetChangeRecord& record)>;
    using SkipPredicate = std::function<bool(std::uint16_t machineId)>;

    OffsetPoller(ControllerRegistry& registry, SlotSource slots, RecordSink sink);
    ~OffsetPoller();

    OffsetPoller(const OffsetPoller&) = delete;
    OffsetPoller& operator=(const OffsetPoller&) = delete;

    void setSkipPredicate(SkipPredicate skip);

    bool start(OffsetPollerOptions options);
    void stop();
    bool isRunning() const noexcept;

    /**
     * @brief Run one diff pass synchronously; returns the number of changes detected.
     */
    std::size_t pollOnce();

    /**
     * @brief Record a value written by this process so it is not reported as external.
     */
    void noteOwnWrite(std::uint16_t machineId, std::int16_t toolSlot, std::int32_t value);

    std::optional<std::int32_t> knownValue(std::uint16_t machineId, std::int16_t toolSlot) const;

private:
    ControllerRegistry& registry_;
    SlotSource slots_;
    RecordSink sink_;

    mutable std::mutex mutex_;
    SkipPredicate skip_;
    std::map<std::pair<std::uint16_t, std::int16_t>, std::int32_t> known_;
    std::uint64_t ownWrites_ = 0;

    std::atomic<bool> running_{false};
    std::mutex wakeMutex_;
    std::condition_variable wake_;
    std::thread worker_;
};

} // namespace aof
