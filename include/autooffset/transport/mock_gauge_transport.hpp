/**
 * @file mock_gauge_transport.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "autooffset/transport/i_gauge_transport.hpp"

namespace aof {

/**
 * @brief Scripted in-process gauge used by tests and the mock transport spec.
 *
 * Each read command pops one scripted response frame; when the script is empty
 * the idle frame (if any) is answered instead. Raw bytes pushed directly are
 * delivered on the next receive regardless of commands.
 */
class MockGaugeTransport final : public IGaugeTransport {
public:
    explicit MockGaugeTransport(std::vector<std::uint8_t> readCommand = {});

    bool open() override;
    void close() override;
    bool send(const std::vector<std::uint8_t>& bytes) override;
    bool receive(std::vector<std::uint8_t>& outBytes, std::chrono::milliseconds timeout) override;

    std::string describe() const override;
    std::string lastError() const override;

    void setReadCommand(std::vector<std::uint8_t> readCommand);
    void enqueueResponse(std::vector<std::uint8_t> frame);
    void setIdleResponse(std::vector<std::uint8_t> frame);
    void pushRawBytes(const std::vector<std::uint8_t>& bytes);

    void injectOpenFailures(std::size_t count);
    void injectSendFailures(std::size_t count);
    void injectReceiveFailures(std::size_t count);

    std::vector<std::vector<std::uint8_t>> sentCommands() const;
    void clearSentCommands();
    std::size_t openCount() const;
    std::size_t pendingResponses() const;
    bool isOpen() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::uint8_t> readCommand_;
    std::deque<std::vector<std::uint8_t>> scriptedResponses_;
    std::vector<std::uint8_t> idleResponse_;
    std::vector<std::uint8_t> rxPending_;
    std::vector<std::vector<std::uint8_t>> sentCommands_;
    std::size_t remainingOpenFailures_ = 0;
    std::size_t remainingSendFailures_ = 0;
    std::size_t remainingReceiveFailures_ = 0;
    std::size_t openCount_ = 0;
    bool opened_ = false;
    std::string error_;
};

} // namespace aof
