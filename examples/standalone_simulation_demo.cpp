/**
 * @file standalone_simulation_demo.cpp
 * @brief autooffset source file.
 */

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "autooffset/config/config_models.hpp"
#include "autooffset/service/compensation_service.hpp"

int main(int argc, char** argv) {
    const int seconds = (argc > 1) ? std::stoi(argv[1]) : 10;

    // Local gauge simulator plus in-process controllers; nothing leaves the host.
    auto config = aof::AppConfig::defaults();
    config.gauge.simulate = true;
    config.gauge.pollIntervalMs = 50;
    config.gauge.reconnectBackoffMs = 500;
    config.gauge.simulatorFrameIntervalMs = 100;
    config.pollerIntervalMs = 500;
    config.controllerReconnectBackoffMs = 500;
    for (auto& machine : config.machines) {
        machine.ip = "dummy";
    }

    aof::CompensationService service;
    std::string error;
    if (!service.configure(config, error)) {
        std::cerr << "Service configuration failed: " << error << '\n';
        return 1;
    }
    if (!service.start()) {
        std::cerr << "Service startup failed: " << service.lastError() << '\n';
        return 1;
    }

    std::this_thread::sleep_for(std::chrono::seconds(seconds));
    service.waitForIdleWrites();

    for (const auto& status : service.machineStatuses()) {
        for (const auto& tool : status.tools) {
            const auto offset = service.readToolOffset(status.id, tool.toolSlot);
            std::cout << "machine=" << status.id << " slot=" << tool.toolSlot
                      << " avg=" << tool.lastAvgMeasurement.value_or(0.0)
                      << " correction=" << tool.lastComputedOffset.value_or(0.0)
                      << " offset_mm=" << offset.value_or(0.0) << '\n';
        }
    }

    const auto records = service.recentChanges(20).get();
    for (const auto& record : records) {
        std::cout << "change machine=" << record.machineId << " slot=" << record.toolSlot
                  << " old=" << record.oldValue << " delta=" << record.delta << " new=" << record.newValue
                  << " success=" << (record.success ? 1 : 0) << '\n';
    }

    if (const auto* link = service.gaugeLink()) {
        const auto stats = link->statistics();
        std::cout << "gauge frames=" << stats.framesDecoded << " dropped=" << stats.framesDropped
                  << " measurements=" << stats.measurementsPublished << " commands=" << stats.commandsSent << '\n';
    }

    service.stop();
    return 0;
}
