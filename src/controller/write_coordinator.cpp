#include "autooffset/controller/write_coordinator.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <iostream>

#include "autooffset/calibration/offset_calculator.hpp"

namespace aof {

const char* toString(DispatchResult result) {
    switch (result) {
    case DispatchResult::Dispatched:
        return "Dispatched";
    case DispatchResult::UnknownMachine:
        return "UnknownMachine";
    case DispatchResult::Unavailable:
        return "Unavailable";
    case DispatchResult::InFlight:
        return "InFlight";
    case DispatchResult::NothingToWrite:
        return "NothingToWrite";
    case DispatchResult::ShuttingDown:
        return "ShuttingDown";
    }
    return "Unknown";
}

WriteCoordinator::WriteCoordinator(ControllerRegistry& registry, RecordSink sink, std::int32_t scale)
    : registry_(registry), sink_(std::move(sink)), scale_(scale) {}

WriteCoordinator::~WriteCoordinator() { shutdown(); }

DispatchResult WriteCoordinator::dispatch(std::uint16_t machineId, std::vector<OffsetWriteRequest> requests) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shuttingDown_) {
        return DispatchResult::ShuttingDown;
    }
    const auto* handle = registry_.find(machineId);
    if (handle == nullptr) {
        std::cerr << "[aof-writer] no controller configured for machine " << machineId << '\n';
        return DispatchResult::UnknownMachine;
    }
    if (requests.empty()) {
        return DispatchResult::NothingToWrite;
    }
    if (inFlight_.count(machineId) != 0U) {
        std::cout << "[aof-writer] machine " << machineId << " still applying previous batch, skipping\n";
        return DispatchResult::InFlight;
    }
    if (!handle->isAvailable()) {
        std::cout << "[aof-writer] machine " << machineId << " controller busy or unreachable, skipping\n";
        return DispatchResult::Unavailable;
    }

    // The previous worker for this machine has left flight and only needs reaping.
    auto previous = workers_.find(machineId);
    if (previous != workers_.end() && previous->second.joinable()) {
        previous->second.join();
    }

    inFlight_.insert(machineId);
    workers_[machineId] = std::thread([this, machineId, requests = std::move(requests)]() {
        runTask(machineId, requests);
        {
            std::lock_guard<std::mutex> taskLock(mutex_);
            inFlight_.erase(machineId);
        }
        idle_.notify_all();
    });
    return DispatchResult::Dispatched;
}

void WriteCoordinator::setWriteObserver(WriteObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = std::move(observer);
}

bool WriteCoordinator::isInFlight(std::uint16_t machineId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inFlight_.count(machineId) != 0U;
}

void WriteCoordinator::waitIdle() {
    std::map<std::uint16_t, std::thread> finished;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_.wait(lock, [this]() { return inFlight_.empty(); });
        finished.swap(workers_);
    }
    for (auto& entry : finished) {
        if (entry.second.joinable()) {
            entry.second.join();
        }
    }
}

void WriteCoordinator::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shuttingDown_ = true;
    }
    waitIdle();
}

void WriteCoordinator::runTask(std::uint16_t machineId, const std::vector<OffsetWriteRequest>& requests) {
    auto* handle = registry_.find(machineId);
    if (handle == nullptr) {
        return;
    }

    for (const auto& request : requests) {
        const auto current = handle->readOffset(request.toolSlot);
        if (!current.ok()) {
            std::cerr << "[aof-writer] machine " << machineId << " slot " << request.toolSlot
                      << " read failed (" << toString(current.status) << "): " << current.message << '\n';
            continue;
        }

        const auto scaled = OffsetCalculator::toControllerUnits(request.correction, scale_);
        if (!scaled.has_value()) {
            std::cerr << "[aof-writer] machine " << machineId << " slot " << request.toolSlot << " correction "
                      << request.correction << " out of controller range, skipped\n";
            continue;
        }
        const auto delta = *scaled;
        const auto sum = static_cast<std::int64_t>(current.value) + delta;
        if (sum < std::numeric_limits<std::int32_t>::min() || sum > std::numeric_limits<std::int32_t>::max()) {
            std::cerr << "[aof-writer] machine " << machineId << " slot " << request.toolSlot << ": "
                      << current.value << " + " << delta << " overflows the controller offset, skipped\n";
            continue;
        }
        const auto newValue = static_cast<std::int32_t>(sum);
        const auto written = handle->writeOffset(request.toolSlot, newValue);

        OffsetChangeRecord record;
        record.timestamp = std::chrono::system_clock::now();
        record.machineId = machineId;
        record.toolSlot = request.toolSlot;
        record.oldValue = current.value;
        record.delta = delta;
        record.newValue = newValue;
        record.success = written.ok();

        if (written.ok()) {
            std::cout << "[aof-writer] machine " << machineId << " slot " << request.toolSlot << ": "
                      << current.value << " + " << delta << " -> " << newValue << '\n';
            WriteObserver observer;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                observer = observer_;
            }
            if (observer) {
                observer(machineId, request.toolSlot, newValue);
            }
        } else {
            std::cerr << "[aof-writer] machine " << machineId << " slot " << request.toolSlot
                      << " write failed (" << toString(written.status) << "): " << written.message << '\n';
        }
        if (sink_) {
            sink_(record);
        }
    }
}

} // namespace aof
