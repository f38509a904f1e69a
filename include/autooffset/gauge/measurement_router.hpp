/**
 * @file measurement_router.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "autooffset/core/measurement.hpp"
#include "autooffset/transport/gauge_frame.hpp"

namespace aof {

/**
 * @brief How the PC acknowledges a completed gauge cycle.
 *
 * Handshake: assert on the rising edge, clear on the falling edge.
 * Pulse: assert and clear back-to-back on the rising edge; falling edge is silent.
 */
enum class ResetProtocol {
    Handshake,
    Pulse,
};

const char* toString(ResetProtocol protocol);
std::optional<ResetProtocol> parseResetProtocol(const std::string& text);

/**
 * @brief Outcome of routing one decoded response.
 */
struct RouteDecision {
    std::optional<Measurement> measurement;
    std::vector<GaugeCommand> commands;
};

/**
 * @brief Edge detector on the gauge "cycle complete" flag.
 *
 * Holds one bit per connection; call `resetConnection()` whenever a new gauge
 * connection starts. Not thread-safe: a single consumer drives it.
 */
class MeasurementRouter {
public:
    explicit MeasurementRouter(ResetProtocol protocol = ResetProtocol::Handshake);

    RouteDecision route(const GaugeResponse& response);
    void resetConnection() noexcept;

    bool previousComplete() const noexcept;
    ResetProtocol protocol() const noexcept;

    /**
     * @brief Combine all slots of one response into one fixed-point value.
     *
     * Slots are averaged with integer division, matching the gauge's own
     * fixed-point arithmetic.
     */
    static std::optional<std::int32_t> combineSlots(const std::vector<std::int32_t>& slots);

private:
    ResetProtocol protocol_;
    bool previousComplete_ = false;
};

} // namespace aof
