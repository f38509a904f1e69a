/**
 * @file gauge_link.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "autooffset/core/link_state.hpp"
#include "autooffset/core/measurement.hpp"
#include "autooffset/gauge/measurement_router.hpp"
#include "autooffset/transport/gauge_frame.hpp"
#include "autooffset/transport/i_gauge_transport.hpp"

namespace aof {

/**
 * @brief Timing and protocol configuration for one gauge connection.
 */
struct GaugeLinkOptions {
    std::chrono::milliseconds pollInterval{200};
    std::chrono::milliseconds reconnectBackoff{5000};
    std::chrono::milliseconds receiveTimeout{50};
    GaugeFrameLayout layout{};
    GaugeCommandSet commands = GaugeCommandSet::defaults();
    ResetProtocol resetProtocol = ResetProtocol::Handshake;
};

struct GaugeLinkStatistics {
    std::uint64_t connects = 0;
    std::uint64_t connectFailures = 0;
    std::uint64_t disconnects = 0;
    std::uint64_t pollsSent = 0;
    std::uint64_t commandsSent = 0;
    std::uint64_t framesDecoded = 0;
    std::uint64_t framesDropped = 0;
    std::uint64_t measurementsPublished = 0;
};

/**
 * @brief Owns the gauge connection lifecycle and the fixed-period poll loop.
 *
 * A dedicated worker connects, then per period drains pending write commands,
 * sends the read command and decodes whatever arrives. Any I/O failure drops
 * the connection and reconnects after the backoff, forever, until `stop()`.
 */
class GaugeLink {
public:
    using MeasurementCallback = std::function<void(const Measurement& measurement)>;

    explicit GaugeLink(IGaugeTransport& transport, GaugeLinkOptions options = {});
    ~GaugeLink();

    GaugeLink(const GaugeLink&) = delete;
    GaugeLink& operator=(const GaugeLink&) = delete;

    bool start(MeasurementCallback callback);
    void stop();

    /**
     * @brief Queue a write command; it is sent before the next read command.
     */
    void enqueueCommand(GaugeCommand command);
    std::size_t pendingCommands() const;

    bool isRunning() const noexcept;
    LinkState state() const noexcept;
    GaugeLinkStatistics statistics() const;
    std::string lastError() const;

private:
    void run();
    bool runConnection();
    bool drainPendingCommands();
    bool pollOnce();
    bool handleReceived(const std::vector<std::uint8_t>& bytes);
    bool sendCommand(GaugeCommand command);
    bool waitFor(std::chrono::steady_clock::time_point deadline);
    const std::vector<std::uint8_t>& commandBytes(GaugeCommand command) const;
    void setError(std::string message);

    IGaugeTransport& transport_;
    GaugeLinkOptions options_;
    GaugeFrameCodec codec_;
    MeasurementRouter router_;
    MeasurementCallback callback_;
    bool traceFrames_ = false;

    std::atomic<bool> running_{false};
    std::atomic<LinkState> state_{LinkState::Disconnected};
    std::thread worker_;
    std::mutex wakeMutex_;
    std::condition_variable wakeCv_;

    mutable std::mutex mutex_;
    std::deque<GaugeCommand> pending_;
    GaugeLinkStatistics statistics_{};
    std::string error_;
};

} // namespace aof
