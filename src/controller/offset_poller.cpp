#include "autooffset/controller/offset_poller.hpp"

#include <iostream>

namespace aof {

OffsetPoller::OffsetPoller(ControllerRegistry& registry, SlotSource slots, RecordSink sink)
    : registry_(registry), slots_(std::move(slots)), sink_(std::move(sink)) {}

OffsetPoller::~OffsetPoller() { stop(); }

void OffsetPoller::setSkipPredicate(SkipPredicate skip) {
    std::lock_guard<std::mutex> lock(mutex_);
    skip_ = std::move(skip);
}

bool OffsetPoller::start(OffsetPollerOptions options) {
    if (running_.exchange(true)) {
        return false;
    }

    worker_ = std::thread([this, options]() {
        while (running_.load()) {
            pollOnce();
            std::unique_lock<std::mutex> lock(wakeMutex_);
            wake_.wait_for(lock, options.interval, [this]() { return !running_.load(); });
        }
    });
    return true;
}

void OffsetPoller::stop() {
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        running_.store(false);
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool OffsetPoller::isRunning() const noexcept { return running_.load(); }

std::size_t OffsetPoller::pollOnce() {
    if (!slots_) {
        return 0U;
    }

    SkipPredicate skip;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        skip = skip_;
    }

    std::size_t changes = 0;
    for (const auto& [machineId, toolSlot] : slots_()) {
        auto* handle = registry_.find(machineId);
        if (handle == nullptr || !handle->isAvailable() || (skip && skip(machineId))) {
            continue;
        }
        std::uint64_t ownWritesBefore = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ownWritesBefore = ownWrites_;
        }
        const auto current = handle->readOffset(toolSlot);
        if (!current.ok()) {
            continue;
        }
        // A batch write that started or finished around the read makes the value ambiguous.
        if (skip && skip(machineId)) {
            continue;
        }

        OffsetChangeRecord record;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (ownWrites_ != ownWritesBefore) {
                continue;
            }
            const auto key = std::make_pair(machineId, toolSlot);
            const auto it = known_.find(key);
            if (it == known_.end()) {
                known_.emplace(key, current.value);
                continue;
            }
            if (it->second == current.value) {
                continue;
            }
            record.timestamp = std::chrono::system_clock::now();
            record.machineId = machineId;
            record.toolSlot = toolSlot;
            record.oldValue = it->second;
            record.delta = current.value - it->second;
            record.newValue = current.value;
            record.success = true;
            it->second = current.value;
        }

        ++changes;
        std::cout << "[aof-poller] machine " << machineId << " slot " << toolSlot << " changed externally: "
                  << record.oldValue << " -> " << record.newValue << '\n';
        if (sink_) {
            sink_(record);
        }
    }
    return changes;
}

void OffsetPoller::noteOwnWrite(std::uint16_t machineId, std::int16_t toolSlot, std::int32_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    known_[std::make_pair(machineId, toolSlot)] = value;
    ++ownWrites_;
}

std::optional<std::int32_t> OffsetPoller::knownValue(std::uint16_t machineId, std::int16_t toolSlot) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = known_.find(std::make_pair(machineId, toolSlot));
    if (it == known_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace aof
