/**
 * @file autooffset_daemon.cpp
 * @brief autooffset source file.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "autooffset/config/config_loader.hpp"
#include "autooffset/service/compensation_service.hpp"

using namespace std::chrono_literals;

namespace {

std::atomic<bool> gStopRequested{false};

void onSignal(int) { gStopRequested.store(true); }

} // namespace

int main(int argc, char** argv) {
    const std::string configPath = (argc > 1) ? argv[1] : "examples/config/autooffset.json";

    aof::AppConfig config;
    std::string error;
    if (!aof::ConfigurationLoader::loadFromJsonFile(configPath, config, error)) {
        std::cerr << "Config load failed: " << error << '\n';
        return 1;
    }

    aof::CompensationService service;
    if (!service.configure(config, error)) {
        std::cerr << "Service configuration failed: " << error << '\n';
        return 1;
    }
    if (!service.start()) {
        std::cerr << "Service startup failed: " << service.lastError() << '\n';
        return 1;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    // Periodic status line until interrupted.
    auto nextStatus = std::chrono::steady_clock::now();
    while (!gStopRequested.load()) {
        if (std::chrono::steady_clock::now() >= nextStatus) {
            for (const auto& status : service.machineStatuses()) {
                std::cout << "machine=" << status.id << " endpoint=" << status.endpoint
                          << " connected=" << (status.connected ? 1 : 0) << " busy=" << (status.busy ? 1 : 0)
                          << " pending=" << status.pendingSamples << '\n';
            }
            nextStatus += 10s;
        }
        std::this_thread::sleep_for(100ms);
    }

    std::cout << "Shutting down\n";
    service.stop();
    return 0;
}
