#include "autooffset/controller/controller_handle.hpp"

#include <cstdlib>
#include <iostream>

namespace aof {
namespace {

bool controllerTraceEnabled() {
    const char* value = std::getenv("AOF_TRACE_CONTROLLER");
    return value != nullptr && value[0] != '\0' && value[0] != '0';
}

} // namespace

ControllerHandle::ControllerHandle(std::uint16_t machineId,
                                   ControllerEndpoint endpoint,
                                   IControllerDriver& driver,
                                   ControllerHandleOptions options)
    : machineId_(machineId),
      endpoint_(std::move(endpoint)),
      driver_(driver),
      options_(options),
      trace_(controllerTraceEnabled()) {}

ControllerHandle::~ControllerHandle() { shutdown(); }

bool ControllerHandle::open(std::string& outError) {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (shutdown_) {
            outError = "controller handle shut down";
            return false;
        }
        if (connected_) {
            return true;
        }
    }

    NativeHandle fresh;
    if (driver_.connect(endpoint_, fresh, outError)) {
        {
            std::lock_guard<std::mutex> nativeLock(nativeMutex_);
            native_ = std::move(fresh);
        }
        std::lock_guard<std::mutex> lock(stateMutex_);
        connected_ = true;
        std::cout << "[aof-cnc] machine " << machineId_ << " connected to " << endpoint_.describe() << " ("
                  << driver_.name() << ")\n";
        return true;
    }

    std::cerr << "[aof-cnc] machine " << machineId_ << " connect to " << endpoint_.describe()
              << " failed: " << outError << ", retrying in background\n";
    if (!backgroundReconnect_.exchange(true)) {
        if (reconnectThread_.joinable()) {
            reconnectThread_.join();
        }
        reconnectThread_ = std::thread([this]() {
            reconnectUntilConnected(false);
            backgroundReconnect_.store(false);
        });
    }
    return false;
}

ControllerResult ControllerHandle::readOffset(std::int16_t toolSlot) {
    auto result = acquire("read");
    if (!result.ok()) {
        return result;
    }

    std::string error;
    std::int32_t value = 0;
    bool ok = false;
    {
        std::lock_guard<std::mutex> nativeLock(nativeMutex_);
        ok = driver_.readOffset(native_, toolSlot, value, error);
    }
    releaseBusy();

    if (trace_) {
        std::cout << "[aof-cnc] trace machine=" << machineId_ << " read slot=" << toolSlot
                  << " ok=" << ok << " value=" << value << '\n';
    }
    if (!ok) {
        result.status = ControllerStatus::NativeError;
        result.message = "read slot " + std::to_string(toolSlot) + " failed: " + error;
        return result;
    }
    result.value = value;
    return result;
}

ControllerResult ControllerHandle::writeOffset(std::int16_t toolSlot, std::int32_t value) {
    auto result = acquire("write");
    if (!result.ok()) {
        return result;
    }

    while (true) {
        std::string error;
        bool ok = false;
        {
            std::lock_guard<std::mutex> nativeLock(nativeMutex_);
            ok = driver_.writeOffset(native_, toolSlot, value, error);
        }
        if (trace_) {
            std::cout << "[aof-cnc] trace machine=" << machineId_ << " write slot=" << toolSlot
                      << " value=" << value << " ok=" << ok << '\n';
        }
        if (ok) {
            releaseBusy();
            result.value = value;
            return result;
        }

        {
            std::lock_guard<std::mutex> nativeLock(nativeMutex_);
            native_.reset();
        }
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            busy_ = false;
            connected_ = false;
        }
        std::cerr << "[aof-cnc] machine " << machineId_ << " write slot " << toolSlot << " failed: " << error
                  << ", reconnecting\n";

        // On success the session is reconnected and already owned by this write.
        if (!reconnectUntilConnected(true)) {
            result.status = ControllerStatus::Shutdown;
            result.message = "write abandoned during shutdown: " + error;
            return result;
        }
    }
}

void ControllerHandle::shutdown() {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        shutdown_ = true;
    }
    wake_.notify_all();
    if (reconnectThread_.joinable()) {
        reconnectThread_.join();
    }
    std::lock_guard<std::mutex> nativeLock(nativeMutex_);
    native_.reset();
    std::lock_guard<std::mutex> lock(stateMutex_);
    connected_ = false;
}

bool ControllerHandle::isBusy() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return busy_;
}

bool ControllerHandle::isConnected() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return connected_;
}

bool ControllerHandle::isAvailable() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return connected_ && !busy_ && !shutdown_;
}

std::uint64_t ControllerHandle::reconnects() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return reconnects_;
}

ControllerResult ControllerHandle::acquire(const char* operation) {
    ControllerResult result;
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (shutdown_) {
        result.status = ControllerStatus::Shutdown;
        result.message = std::string(operation) + " rejected: handle shut down";
    } else if (busy_) {
        result.status = ControllerStatus::Busy;
        result.message = std::string(operation) + " rejected: controller busy";
    } else if (!connected_) {
        result.status = ControllerStatus::Unreachable;
        result.message = std::string(operation) + " rejected: controller not connected";
    } else {
        busy_ = true;
    }
    return result;
}

void ControllerHandle::releaseBusy() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    busy_ = false;
}

bool ControllerHandle::reconnectUntilConnected(bool claimBusy) {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (shutdown_) {
                return false;
            }
        }

        NativeHandle fresh;
        std::string error;
        if (driver_.connect(endpoint_, fresh, error)) {
            {
                std::lock_guard<std::mutex> nativeLock(nativeMutex_);
                native_ = std::move(fresh);
            }
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (shutdown_) {
                return false;
            }
            connected_ = true;
            busy_ = claimBusy;
            ++reconnects_;
            std::cout << "[aof-cnc] machine " << machineId_ << " reconnected to " << endpoint_.describe() << '\n';
            return true;
        }

        std::cerr << "[aof-cnc] machine " << machineId_ << " reconnect to " << endpoint_.describe()
                  << " failed: " << error << ", retrying in " << options_.reconnectBackoff.count() << " ms\n";
        std::unique_lock<std::mutex> lock(stateMutex_);
        if (wake_.wait_for(lock, options_.reconnectBackoff, [this]() { return shutdown_; })) {
            return false;
        }
    }
}

} // namespace aof
