/**
 * @file gauge_frame_dump.cpp
 * @brief autooffset source file.
 */

#include <chrono>
#include <iostream>
#include <string>

#include "autooffset/core/measurement.hpp"
#include "autooffset/transport/gauge_frame.hpp"
#include "autooffset/transport/transport_factory.hpp"

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <transport-spec> [frames] [read-command-hex]\n"
                  << "  transport-spec: mock | tcp:<host>:<port>\n";
        return 1;
    }

    const std::size_t frameLimit = (argc > 2) ? static_cast<std::size_t>(std::stoul(argv[2])) : 20U;
    auto commands = aof::GaugeCommandSet::defaults();
    std::string error;
    if (argc > 3 && !aof::GaugeFrameCodec::parseHex(argv[3], commands.read, error)) {
        std::cerr << "Invalid read command: " << error << '\n';
        return 1;
    }

    aof::TransportFactoryConfig transportConfig;
    if (!aof::TransportFactory::parseTransportSpec(argv[1], transportConfig, error)) {
        std::cerr << "Invalid transport spec: " << error << '\n';
        return 1;
    }
    auto transport = aof::TransportFactory::create(transportConfig, error);
    if (!transport) {
        std::cerr << "Transport create failed: " << error << '\n';
        return 1;
    }
    if (!transport->open()) {
        std::cerr << "Open failed for " << transport->describe() << ": " << transport->lastError() << '\n';
        return 1;
    }

    aof::GaugeFrameLayout layout;
    aof::GaugeFrameCodec codec(layout);
    std::size_t frames = 0;
    std::size_t idlePolls = 0;
    while (frames < frameLimit && idlePolls < 50U) {
        if (!transport->send(commands.read)) {
            std::cerr << "Send failed: " << transport->lastError() << '\n';
            break;
        }
        std::vector<std::uint8_t> bytes;
        if (!transport->receive(bytes, std::chrono::milliseconds(200))) {
            std::cerr << "Receive failed: " << transport->lastError() << '\n';
            break;
        }
        if (bytes.empty()) {
            ++idlePolls;
            continue;
        }
        std::cout << "rx " << aof::GaugeFrameCodec::toHex(bytes) << '\n';
        codec.append(bytes);

        while (true) {
            aof::GaugeResponse response;
            std::string diagnostic;
            const auto status = codec.decodeNext(response, diagnostic);
            if (status == aof::GaugeFrameCodec::DecodeStatus::NeedMoreData) {
                break;
            }
            ++frames;
            if (status == aof::GaugeFrameCodec::DecodeStatus::Dropped) {
                std::cout << "frame=" << frames << " dropped: " << diagnostic << '\n';
                continue;
            }
            std::cout << "frame=" << frames << " machine=" << response.machineId << " status=" << response.statusCode
                      << " complete=" << (response.complete ? 1 : 0);
            for (const auto raw : response.slots) {
                std::cout << " slot=" << raw << " (" << aof::fromFixedPoint(raw) << ")";
            }
            std::cout << '\n';
        }
    }

    transport->close();
    return 0;
}
