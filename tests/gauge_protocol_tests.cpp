/**
 * @file gauge_protocol_tests.cpp
 * @brief autooffset source file.
 */

#include <cassert>
#include <string>
#include <vector>

#include "autooffset/gauge/measurement_router.hpp"
#include "autooffset/transport/gauge_frame.hpp"
#include "autooffset/transport/transport_factory.hpp"

namespace {

aof::GaugeResponse makeResponse(std::uint16_t machineId, bool complete, std::vector<std::int32_t> slots) {
    aof::GaugeResponse response;
    response.machineId = machineId;
    response.statusCode = complete ? 1U : 0U;
    response.complete = complete;
    response.slots = std::move(slots);
    return response;
}

} // namespace

int main() {
    const aof::GaugeFrameLayout layout;
    using Status = aof::GaugeFrameCodec::DecodeStatus;

    // Built frames carry the payload length at offset 7 and the slots as int.frac pairs.
    {
        const auto frame = aof::GaugeFrameCodec::buildResponse(makeResponse(1, true, {480010, 479990}), layout);
        assert(frame.size() == 51U);
        assert(frame[7] == 42U && frame[8] == 0U);
        assert(frame[31] == 48U && frame[32] == 0U);
        assert(frame[33] == 10U && frame[34] == 0U);
        assert(aof::GaugeFrameCodec::decodeSlot(frame, 35) == 479990);
        assert(aof::GaugeFrameCodec::decodeSlot(frame, 31) == 480010);
    }

    // Partial and coalesced deliveries split into exactly one frame per decode.
    {
        const auto first = aof::GaugeFrameCodec::buildResponse(makeResponse(1, true, {480010, 479990}), layout);
        const auto second = aof::GaugeFrameCodec::buildResponse(makeResponse(2, false, {470000, 470000}), layout);
        aof::GaugeFrameCodec codec(layout);
        aof::GaugeResponse out;
        std::string diagnostic;

        codec.append(first.data(), 5);
        assert(codec.decodeNext(out, diagnostic) == Status::NeedMoreData);

        std::vector<std::uint8_t> chunk(first.begin() + 5, first.end());
        chunk.insert(chunk.end(), second.begin(), second.begin() + 20);
        codec.append(chunk);
        assert(codec.decodeNext(out, diagnostic) == Status::Decoded);
        assert(out.machineId == 1U);
        assert(out.complete);
        assert(out.slots.size() == 2U);
        assert(out.slots[0] == 480010);
        assert(out.slots[1] == 479990);
        assert(codec.bufferedBytes() == 20U);
        assert(codec.decodeNext(out, diagnostic) == Status::NeedMoreData);

        codec.append(std::vector<std::uint8_t>(second.begin() + 20, second.end()));
        assert(codec.decodeNext(out, diagnostic) == Status::Decoded);
        assert(out.machineId == 2U);
        assert(!out.complete);
        assert(codec.bufferedBytes() == 0U);
    }

    // Short acknowledgement frames and error end codes are dropped without stalling the buffer.
    {
        aof::GaugeFrameCodec codec(layout);
        const std::vector<std::uint8_t> ack{0xD0, 0x00, 0x00, 0xFF, 0xFF, 0x03, 0x00, 0x02, 0x00, 0x00, 0x00};
        auto failed = makeResponse(1, true, {480000, 480000});
        failed.endCode = 0xC059;
        const auto errorFrame = aof::GaugeFrameCodec::buildResponse(failed, layout);
        const auto goodFrame = aof::GaugeFrameCodec::buildResponse(makeResponse(2, true, {480000, 480000}), layout);

        codec.append(ack);
        codec.append(errorFrame);
        codec.append(goodFrame);

        aof::GaugeResponse out;
        std::string diagnostic;
        assert(codec.decodeNext(out, diagnostic) == Status::Dropped);
        assert(diagnostic.find("short") != std::string::npos);
        assert(codec.decodeNext(out, diagnostic) == Status::Dropped);
        assert(diagnostic.find("end code") != std::string::npos);
        assert(codec.decodeNext(out, diagnostic) == Status::Decoded);
        assert(out.machineId == 2U);
        assert(codec.bufferedBytes() == 0U);

        codec.append(goodFrame.data(), 10);
        codec.reset();
        assert(codec.bufferedBytes() == 0U);
    }

    // Command hex strings decode to the wire bytes; malformed strings are rejected.
    {
        const auto commands = aof::GaugeCommandSet::defaults();
        assert(aof::GaugeFrameCodec::toHex(commands.read) == "500000FFFF03000C00200001040000701700A81400");
        assert(commands.read.size() == 21U);
        assert(commands.read[7] == 0x0C);
        assert(commands.resetAssert.size() == 23U);
        assert(commands.resetClear.size() == 23U);
        assert(commands.resetAssert[21] == 0x01 && commands.resetClear[21] == 0x00);

        std::vector<std::uint8_t> bytes;
        std::string error;
        assert(aof::GaugeFrameCodec::parseHex("50 00 ff", bytes, error));
        assert((bytes == std::vector<std::uint8_t>{0x50, 0x00, 0xFF}));
        assert(!aof::GaugeFrameCodec::parseHex("ABC", bytes, error));
        assert(!aof::GaugeFrameCodec::parseHex("GG", bytes, error));
        assert(!aof::GaugeFrameCodec::parseHex("", bytes, error));

        std::vector<std::uint8_t> outbound{0x01};
        aof::GaugeFrameCodec::encodeCommand(commands.read, outbound);
        assert(outbound.size() == 22U);
        assert(outbound[1] == 0x50);
    }

    // Handshake: measurement and assert on the rising edge, clear on the falling edge.
    {
        aof::MeasurementRouter router(aof::ResetProtocol::Handshake);

        auto idle = router.route(makeResponse(1, false, {480000, 480000}));
        assert(!idle.measurement.has_value());
        assert(idle.commands.empty());

        auto rising = router.route(makeResponse(1, true, {480010, 479990}));
        assert(rising.measurement.has_value());
        assert(rising.measurement->sourceLineId == 1U);
        assert(rising.measurement->rawValue == 480000);
        assert(rising.measurement->completionFlag);
        assert(rising.commands.size() == 1U);
        assert(rising.commands[0] == aof::GaugeCommand::ResetAssert);

        // Level-held completion publishes nothing further.
        auto held = router.route(makeResponse(1, true, {480010, 479990}));
        assert(!held.measurement.has_value());
        assert(held.commands.empty());

        auto falling = router.route(makeResponse(1, false, {0, 0}));
        assert(!falling.measurement.has_value());
        assert(falling.commands.size() == 1U);
        assert(falling.commands[0] == aof::GaugeCommand::ResetClear);
    }

    // Pulse: assert and clear together on the rising edge; falling edge is silent.
    {
        aof::MeasurementRouter router(aof::ResetProtocol::Pulse);
        auto rising = router.route(makeResponse(2, true, {470000}));
        assert(rising.measurement.has_value());
        assert(rising.measurement->rawValue == 470000);
        assert(rising.commands.size() == 2U);
        assert(rising.commands[0] == aof::GaugeCommand::ResetAssert);
        assert(rising.commands[1] == aof::GaugeCommand::ResetClear);

        auto falling = router.route(makeResponse(2, false, {470000}));
        assert(falling.commands.empty());
    }

    // A new connection forgets the previous completion flag.
    {
        aof::MeasurementRouter router;
        (void)router.route(makeResponse(1, true, {480000}));
        assert(router.previousComplete());
        router.resetConnection();
        assert(!router.previousComplete());
        auto again = router.route(makeResponse(1, true, {480000}));
        assert(again.measurement.has_value());

        assert(aof::parseResetProtocol("Pulse") == aof::ResetProtocol::Pulse);
        assert(!aof::parseResetProtocol("toggle").has_value());
        assert(!aof::MeasurementRouter::combineSlots({}).has_value());
    }

    // Transport specs.
    {
        aof::TransportFactoryConfig config;
        std::string error;
        assert(aof::TransportFactory::parseTransportSpec("tcp:192.168.0.100:5002", config, error));
        assert(config.kind == aof::TransportKind::Tcp);
        assert(config.host == "192.168.0.100");
        assert(config.port == 5002U);

        assert(aof::TransportFactory::parseTransportSpec(" mock ", config, error));
        assert(config.kind == aof::TransportKind::Mock);
        auto mock = aof::TransportFactory::create(config, error);
        assert(mock != nullptr);

        assert(!aof::TransportFactory::parseTransportSpec("tcp:host", config, error));
        assert(!aof::TransportFactory::parseTransportSpec("tcp:host:70000", config, error));
        assert(!aof::TransportFactory::parseTransportSpec("udp:host:1", config, error));
        assert(!error.empty());
    }

    return 0;
}
