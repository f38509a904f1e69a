#include "autooffset/gauge/measurement_router.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace aof {

const char* toString(ResetProtocol protocol) {
    switch (protocol) {
    case ResetProtocol::Handshake:
        return "handshake";
    case ResetProtocol::Pulse:
        return "pulse";
    }
    return "unknown";
}

std::optional<ResetProtocol> parseResetProtocol(const std::string& text) {
    std::string normalized = text;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (normalized == "handshake") {
        return ResetProtocol::Handshake;
    }
    if (normalized == "pulse") {
        return ResetProtocol::Pulse;
    }
    return std::nullopt;
}

MeasurementRouter::MeasurementRouter(ResetProtocol protocol) : protocol_(protocol) {}

RouteDecision MeasurementRouter::route(const GaugeResponse& response) {
    RouteDecision decision;
    const bool rising = response.complete && !previousComplete_;
    const bool falling = !response.complete && previousComplete_;
    previousComplete_ = response.complete;

    if (rising) {
        const auto combined = combineSlots(response.slots);
        if (combined.has_value()) {
            Measurement measurement;
            measurement.sourceLineId = response.machineId;
            measurement.rawValue = *combined;
            measurement.completionFlag = true;
            decision.measurement = measurement;
            std::cout << "[aof-router] cycle complete machine=" << response.machineId
                      << " value=" << measurement.value() << '\n';
        } else {
            std::cerr << "[aof-router] cycle complete without measurement slots, machine="
                      << response.machineId << '\n';
        }

        decision.commands.push_back(GaugeCommand::ResetAssert);
        if (protocol_ == ResetProtocol::Pulse) {
            decision.commands.push_back(GaugeCommand::ResetClear);
        }
        return decision;
    }

    if (falling && protocol_ == ResetProtocol::Handshake) {
        decision.commands.push_back(GaugeCommand::ResetClear);
    }
    return decision;
}

void MeasurementRouter::resetConnection() noexcept { previousComplete_ = false; }

bool MeasurementRouter::previousComplete() const noexcept { return previousComplete_; }

ResetProtocol MeasurementRouter::protocol() const noexcept { return protocol_; }

std::optional<std::int32_t> MeasurementRouter::combineSlots(const std::vector<std::int32_t>& slots) {
    if (slots.empty()) {
        return std::nullopt;
    }
    std::int64_t sum = 0;
    for (const auto slot : slots) {
        sum += slot;
    }
    return static_cast<std::int32_t>(sum / static_cast<std::int64_t>(slots.size()));
}

} // namespace aof
