/**
 * @file tcp_gauge_transport.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "autooffset/transport/i_gauge_transport.hpp"

namespace aof {

class TcpGaugeTransport final : public IGaugeTransport {
public:
    TcpGaugeTransport(std::string host, std::uint16_t port);
    ~TcpGaugeTransport() override;

    TcpGaugeTransport(const TcpGaugeTransport&) = delete;
    TcpGaugeTransport& operator=(const TcpGaugeTransport&) = delete;

    void setConnectTimeoutMs(int timeoutMs);

    bool open() override;
    void close() override;
    bool send(const std::vector<std::uint8_t>& bytes) override;
    bool receive(std::vector<std::uint8_t>& outBytes, std::chrono::milliseconds timeout) override;

    std::string describe() const override;
    std::string lastError() const override;

private:
    std::string host_;
    std::uint16_t port_ = 0;
    int connectTimeoutMs_ = 3000;
    int socketFd_ = -1;
    std::vector<std::uint8_t> rxBuffer_;
    std::string error_;
};

} // namespace aof
