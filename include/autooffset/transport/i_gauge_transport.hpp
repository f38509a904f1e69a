/**
 * @file i_gauge_transport.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace aof {

/**
 * @brief Abstract byte-stream transport used by GaugeLink.
 *
 * One `open()` corresponds to one gauge connection. Any failed call leaves the
 * transport in an unusable state until the next `open()`.
 */
class IGaugeTransport {
public:
    virtual ~IGaugeTransport() = default;

    /**
     * @brief Establish a new connection, closing any previous one.
     * @return true on success, false on failure (see lastError()).
     */
    virtual bool open() = 0;
    /**
     * @brief Close and release connection resources.
     */
    virtual void close() = 0;

    /**
     * @brief Send all bytes of one outbound buffer.
     */
    virtual bool send(const std::vector<std::uint8_t>& bytes) = 0;

    /**
     * @brief Receive whatever arrives within `timeout`.
     * @param outBytes replaced with received bytes; empty on timeout.
     * @return false on I/O error or peer close, true otherwise (timeout included).
     */
    virtual bool receive(std::vector<std::uint8_t>& outBytes, std::chrono::milliseconds timeout) = 0;

    virtual std::string describe() const = 0;
    virtual std::string lastError() const = 0;
};

} // namespace aof
