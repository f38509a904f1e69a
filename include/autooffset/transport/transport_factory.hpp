#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "autooffset/transport/i_gauge_transport.hpp"

namespace aof {

enum class TransportKind {
    Mock,
    Tcp,
};

struct TransportFactoryConfig {
    TransportKind kind = TransportKind::Tcp;
    std::string host;
    std::uint16_t port = 0;
    int connectTimeoutMs = 3000;
};

/**
 * @brief Create gauge transport instances from a small runtime config.
 *
 * Transport spec format for parseTransportSpec:
 * - mock
 * - tcp:<host>:<port>
 */
class TransportFactory {
public:
    static bool parseTransportSpec(const std::string& spec,
                                   TransportFactoryConfig& outConfig,
                                   std::string& outError);

    static std::unique_ptr<IGaugeTransport> create(const TransportFactoryConfig& config,
                                                   std::string& outError);
};

} // namespace aof
