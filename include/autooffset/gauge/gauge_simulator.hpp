/**
 * @file gauge_simulator.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "autooffset/transport/gauge_frame.hpp"

namespace aof {

struct GaugeSimulatorOptions {
    std::string bindAddress = "127.0.0.1";
    std::uint16_t port = 0;
    std::chrono::milliseconds frameInterval{1000};
    std::vector<std::uint16_t> machineIds{1, 2};
    double nominalValue = 48.0;
    double jitter = 0.005;
    GaugeFrameLayout layout{};
};

/**
 * @brief Local stand-in for the networked gauge (standalone and test mode).
 *
 * Accepts one client at a time and streams response frames whose completion
 * flag toggles every frame; the machine id advances after each falling edge.
 */
class GaugeSimulator {
public:
    explicit GaugeSimulator(GaugeSimulatorOptions options = {});
    ~GaugeSimulator();

    GaugeSimulator(const GaugeSimulator&) = delete;
    GaugeSimulator& operator=(const GaugeSimulator&) = delete;

    bool start(std::string& outError);
    void stop();

    bool isRunning() const noexcept;
    /**
     * @brief Bound port; resolves an ephemeral port requested with 0.
     */
    std::uint16_t port() const noexcept;
    std::uint64_t framesSent() const noexcept;
    std::uint64_t bytesReceived() const noexcept;

private:
    void acceptLoop();
    void serveClient(int clientFd);

    GaugeSimulatorOptions options_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> boundPort_{0};
    std::atomic<std::uint64_t> framesSent_{0};
    std::atomic<std::uint64_t> bytesReceived_{0};
    int listenFd_ = -1;
    std::thread acceptThread_;
};

} // namespace aof
