/**
 * @file controller_handle.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include "autooffset/controller/i_controller_driver.hpp"

namespace aof {

struct ControllerHandleOptions {
    std::chrono::milliseconds reconnectBackoff{5000};
};

/**
 * @brief Session with one machine controller.
 *
 * Every call fails fast with Busy or Unreachable while another call owns the
 * native handle or the connection is down. A failed write releases the native
 * handle, reconnects with a fixed backoff until it succeeds (or shutdown) and
 * retries the write. Reads perform one native call and never reconnect.
 */
class ControllerHandle {
public:
    ControllerHandle(std::uint16_t machineId,
                     ControllerEndpoint endpoint,
                     IControllerDriver& driver,
                     ControllerHandleOptions options = {});
    ~ControllerHandle();

    ControllerHandle(const ControllerHandle&) = delete;
    ControllerHandle& operator=(const ControllerHandle&) = delete;

    /**
     * @brief Initial connect; on failure a background reconnect is started.
     */
    bool open(std::string& outError);

    ControllerResult readOffset(std::int16_t toolSlot);
    ControllerResult writeOffset(std::int16_t toolSlot, std::int32_t value);

    /**
     * @brief Interrupts reconnect waits, rejects further calls and releases the native handle.
     */
    void shutdown();

    bool isBusy() const;
    bool isConnected() const;
    bool isAvailable() const;
    std::uint64_t reconnects() const;

    std::uint16_t machineId() const noexcept { return machineId_; }
    const ControllerEndpoint& endpoint() const noexcept { return endpoint_; }

private:
    ControllerResult acquire(const char* operation);
    void releaseBusy();
    /**
     * @brief Loops until connected or shut down; `claimBusy` marks the session busy in the same step.
     */
    bool reconnectUntilConnected(bool claimBusy);

    std::uint16_t machineId_;
    ControllerEndpoint endpoint_;
    IControllerDriver& driver_;
    ControllerHandleOptions options_;
    bool trace_ = false;

    mutable std::mutex stateMutex_;
    std::condition_variable wake_;
    bool busy_ = false;
    bool connected_ = false;
    bool shutdown_ = false;
    std::uint64_t reconnects_ = 0;

    std::mutex nativeMutex_;
    NativeHandle native_;

    std::atomic<bool> backgroundReconnect_{false};
    std::thread reconnectThread_;
};

} // namespace aof
