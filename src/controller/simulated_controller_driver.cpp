#include "autooffset/controller/simulated_controller_driver.hpp"

#include <iostream>

namespace aof {

SimulatedControllerDriver::~SimulatedControllerDriver() { setWritesBlocked(false); }

bool SimulatedControllerDriver::connect(const ControllerEndpoint& endpoint,
                                        NativeHandle& outHandle,
                                        std::string& outError) {
    std::uint64_t token = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++connectCount_;
        if (!reachable_) {
            outError = "controller " + endpoint.describe() + " unreachable";
            return false;
        }
        if (connectFailures_ > 0U) {
            --connectFailures_;
            outError = "injected connect failure for " + endpoint.describe();
            return false;
        }
        token = nextToken_++;
        handles_[token] = endpoint.describe();
        offsets_[endpoint.describe()];
    }
    outHandle = NativeHandle(this, token);
    return true;
}

bool SimulatedControllerDriver::readOffset(const NativeHandle& handle,
                                           std::int16_t toolSlot,
                                           std::int32_t& outValue,
                                           std::string& outError) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key;
    if (!resolveLocked(handle, key, outError)) {
        return false;
    }
    if (readFailures_ > 0U) {
        --readFailures_;
        outError = "injected read failure";
        return false;
    }
    const auto& slots = offsets_[key];
    const auto it = slots.find(toolSlot);
    outValue = it == slots.end() ? 0 : it->second;
    return true;
}

bool SimulatedControllerDriver::writeOffset(const NativeHandle& handle,
                                            std::int16_t toolSlot,
                                            std::int32_t value,
                                            std::string& outError) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (writesBlocked_) {
        ++blockedWriters_;
        writeGate_.notify_all();
        writeGate_.wait(lock, [this]() { return !writesBlocked_; });
        --blockedWriters_;
    }
    ++writeCount_;
    std::string key;
    if (!resolveLocked(handle, key, outError)) {
        return false;
    }
    if (writeFailures_ > 0U) {
        --writeFailures_;
        outError = "injected write failure";
        return false;
    }
    auto& slots = offsets_[key];
    const auto previous = slots.count(toolSlot) != 0U ? slots[toolSlot] : 0;
    slots[toolSlot] = value;
    std::cout << "[aof-sim] " << key << " slot " << toolSlot << ": " << previous << " -> " << value << '\n';
    return true;
}

void SimulatedControllerDriver::injectConnectFailures(std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    connectFailures_ = count;
}

void SimulatedControllerDriver::injectReadFailures(std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    readFailures_ = count;
}

void SimulatedControllerDriver::injectWriteFailures(std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    writeFailures_ = count;
}

void SimulatedControllerDriver::setReachable(bool reachable) {
    std::lock_guard<std::mutex> lock(mutex_);
    reachable_ = reachable;
}

void SimulatedControllerDriver::setWritesBlocked(bool blocked) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        writesBlocked_ = blocked;
    }
    writeGate_.notify_all();
}

bool SimulatedControllerDriver::waitForBlockedWrite(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return writeGate_.wait_for(lock, timeout, [this]() { return blockedWriters_ > 0U; });
}

void SimulatedControllerDriver::setOffset(const ControllerEndpoint& endpoint,
                                          std::int16_t toolSlot,
                                          std::int32_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    offsets_[endpoint.describe()][toolSlot] = value;
}

std::optional<std::int32_t> SimulatedControllerDriver::offset(const ControllerEndpoint& endpoint,
                                                              std::int16_t toolSlot) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto endpointIt = offsets_.find(endpoint.describe());
    if (endpointIt == offsets_.end()) {
        return std::nullopt;
    }
    const auto slotIt = endpointIt->second.find(toolSlot);
    if (slotIt == endpointIt->second.end()) {
        return std::nullopt;
    }
    return slotIt->second;
}

std::size_t SimulatedControllerDriver::connectCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connectCount_;
}

std::size_t SimulatedControllerDriver::writeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writeCount_;
}

std::size_t SimulatedControllerDriver::liveHandles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.size();
}

void SimulatedControllerDriver::release(std::uint64_t token) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    handles_.erase(token);
}

bool SimulatedControllerDriver::resolveLocked(const NativeHandle& handle,
                                              std::string& key,
                                              std::string& outError) const {
    const auto it = handles_.find(handle.token());
    if (!handle.valid() || it == handles_.end()) {
        outError = "invalid native handle";
        return false;
    }
    key = it->second;
    return true;
}

} // namespace aof
