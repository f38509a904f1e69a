/**
 * @file simulated_controller_driver.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "autooffset/controller/i_controller_driver.hpp"

namespace aof {

/**
 * @brief In-process controller used for machines configured with ip "dummy" and in tests.
 *
 * Offsets are stored per endpoint and tool slot; unknown slots read as zero.
 */
class SimulatedControllerDriver final : public IControllerDriver {
public:
    SimulatedControllerDriver() = default;
    ~SimulatedControllerDriver() override;

    bool connect(const ControllerEndpoint& endpoint, NativeHandle& outHandle, std::string& outError) override;
    bool readOffset(const NativeHandle& handle,
                    std::int16_t toolSlot,
                    std::int32_t& outValue,
                    std::string& outError) override;
    bool writeOffset(const NativeHandle& handle,
                     std::int16_t toolSlot,
                     std::int32_t value,
                     std::string& outError) override;
    std::string name() const override { return "simulated"; }

    // Fault injection.
    void injectConnectFailures(std::size_t count);
    void injectReadFailures(std::size_t count);
    void injectWriteFailures(std::size_t count);
    void setReachable(bool reachable);

    /**
     * @brief While blocked, writes park inside the native call until unblocked.
     */
    void setWritesBlocked(bool blocked);
    bool waitForBlockedWrite(std::chrono::milliseconds timeout);

    void setOffset(const ControllerEndpoint& endpoint, std::int16_t toolSlot, std::int32_t value);
    std::optional<std::int32_t> offset(const ControllerEndpoint& endpoint, std::int16_t toolSlot) const;

    std::size_t connectCount() const;
    std::size_t writeCount() const;
    std::size_t liveHandles() const;

protected:
    void release(std::uint64_t token) noexcept override;

private:
    bool resolveLocked(const NativeHandle& handle, std::string& key, std::string& outError) const;

    mutable std::mutex mutex_;
    std::condition_variable writeGate_;
    std::map<std::string, std::map<std::int16_t, std::int32_t>> offsets_;
    std::map<std::uint64_t, std::string> handles_;
    std::uint64_t nextToken_ = 1;
    std::size_t connectFailures_ = 0;
    std::size_t readFailures_ = 0;
    std::size_t writeFailures_ = 0;
    std::size_t connectCount_ = 0;
    std::size_t writeCount_ = 0;
    std::size_t blockedWriters_ = 0;
    bool reachable_ = true;
    bool writesBlocked_ = false;
};

} // namespace aof
