/**
 * @file write_coordinator.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "autooffset/controller/controller_registry.hpp"
#include "autooffset/core/measurement.hpp"

namespace aof {

/**
 * @brief One slot correction (millimetres) of a completed batch.
 */
struct OffsetWriteRequest {
    std::int16_t toolSlot = 0;
    double correction = 0.0;
};

enum class DispatchResult {
    Dispatched,
    UnknownMachine,
    Unavailable,
    InFlight,
    NothingToWrite,
    ShuttingDown,
};

const char* toString(DispatchResult result);

/**
 * @brief Applies batch corrections on a worker per machine, at most one in flight per machine.
 *
 * Each request reads the current offset and writes `current + delta`; every
 * attempted write produces one OffsetChangeRecord.
 */
class WriteCoordinator {
public:
    using RecordSink = std::function<void(const OffsetChangeRecord& record)>;
    using WriteObserver = std::function<void(std::uint16_t machineId, std::int16_t toolSlot, std::int32_t value)>;

    WriteCoordinator(ControllerRegistry& registry, RecordSink sink, std::int32_t scale = kFixedPointScale);
    ~WriteCoordinator();

    WriteCoordinator(const WriteCoordinator&) = delete;
    WriteCoordinator& operator=(const WriteCoordinator&) = delete;

    DispatchResult dispatch(std::uint16_t machineId, std::vector<OffsetWriteRequest> requests);

    /**
     * @brief Called with the new value after each successful write, before the machine leaves flight.
     */
    void setWriteObserver(WriteObserver observer);

    bool isInFlight(std::uint16_t machineId) const;
    void waitIdle();
    void shutdown();

private:
    void runTask(std::uint16_t machineId, const std::vector<OffsetWriteRequest>& requests);

    ControllerRegistry& registry_;
    RecordSink sink_;
    std::int32_t scale_;

    mutable std::mutex mutex_;
    std::condition_variable idle_;
    WriteObserver observer_;
    std::set<std::uint16_t> inFlight_;
    std::map<std::uint16_t, std::thread> workers_;
    bool shuttingDown_ = false;
};

} // namespace aof
