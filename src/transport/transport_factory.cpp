#include "autooffset/transport/transport_factory.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "autooffset/transport/gauge_frame.hpp"
#include "autooffset/transport/mock_gauge_transport.hpp"
#include "autooffset/transport/tcp_gauge_transport.hpp"

namespace aof {
namespace {

std::string trimCopy(std::string value) {
    value.erase(value.begin(),
                std::find_if(value.begin(), value.end(), [](unsigned char c) { return !std::isspace(c); }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char c) { return !std::isspace(c); }).base(),
                value.end());
    return value;
}

bool parsePort(const std::string& text, std::uint16_t& outPort) {
    try {
        std::size_t consumed = 0;
        const auto value = std::stoul(text, &consumed, 10);
        if (consumed != text.size() || value == 0UL || value > 0xFFFFUL) {
            return false;
        }
        outPort = static_cast<std::uint16_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

bool TransportFactory::parseTransportSpec(const std::string& spec,
                                          TransportFactoryConfig& outConfig,
                                          std::string& outError) {
    outError.clear();
    const auto trimmed = trimCopy(spec);
    if (trimmed.empty()) {
        outError = "transport spec is empty";
        return false;
    }

    if (trimmed == "mock") {
        outConfig.kind = TransportKind::Mock;
        outConfig.host.clear();
        outConfig.port = 0;
        return true;
    }

    constexpr const char* kTcpPrefix = "tcp:";
    if (trimmed.rfind(kTcpPrefix, 0) == 0) {
        outConfig.kind = TransportKind::Tcp;
        const std::string rest = trimCopy(trimmed.substr(4));
        const auto colon = rest.rfind(':');
        if (rest.empty() || colon == std::string::npos) {
            outError = "tcp transport requires host and port, e.g. tcp:192.168.0.100:5002";
            return false;
        }

        outConfig.host = trimCopy(rest.substr(0, colon));
        if (outConfig.host.empty()) {
            outError = "tcp transport requires host name, e.g. tcp:192.168.0.100:5002";
            return false;
        }
        if (!parsePort(trimCopy(rest.substr(colon + 1)), outConfig.port)) {
            outError = "invalid tcp port in transport spec '" + spec + "'";
            return false;
        }
        return true;
    }

    outError = "unsupported transport spec '" + spec + "', expected 'mock' or 'tcp:<host>:<port>'";
    return false;
}

std::unique_ptr<IGaugeTransport> TransportFactory::create(const TransportFactoryConfig& config,
                                                          std::string& outError) {
    outError.clear();

    if (config.kind == TransportKind::Mock) {
        return std::make_unique<MockGaugeTransport>(GaugeCommandSet::defaults().read);
    }

    if (config.kind != TransportKind::Tcp) {
        outError = "unsupported transport kind";
        return nullptr;
    }

    if (config.host.empty() || config.port == 0U) {
        outError = "tcp transport requires host and port";
        return nullptr;
    }

    auto transport = std::make_unique<TcpGaugeTransport>(config.host, config.port);
    transport->setConnectTimeoutMs(config.connectTimeoutMs);
    return transport;
}

} // namespace aof
