#include <cassert>
#include <chrono>
#include <cmath>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "autooffset/history/history_stores.hpp"
#include "autooffset/service/compensation_service.hpp"
#include "autooffset/transport/mock_gauge_transport.hpp"

using namespace std::chrono_literals;

namespace {

bool waitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 5000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(2ms);
    }
    return predicate();
}

std::vector<std::uint8_t> frame(std::uint16_t machineId, bool complete, std::int32_t raw) {
    aof::GaugeResponse response;
    response.machineId = machineId;
    response.statusCode = complete ? 1U : 0U;
    response.slots = {raw, raw};
    return aof::GaugeFrameCodec::buildResponse(response, aof::GaugeFrameLayout{});
}

aof::AppConfig testConfig() {
    auto config = aof::AppConfig::defaults();
    for (auto& machine : config.machines) {
        machine.ip = "dummy";
    }
    for (auto& tool : config.tools) {
        if (tool.machineId == 2 && tool.toolSlot == 12) {
            tool.active = false;
        }
    }
    config.gauge.pollIntervalMs = 5;
    config.gauge.receiveTimeoutMs = 5;
    config.gauge.reconnectBackoffMs = 20;
    // Keep the external-change poller out of the way of batch availability checks.
    config.pollerIntervalMs = 60000;
    config.controllerReconnectBackoffMs = 20;
    return config;
}

bool near(double a, double b, double epsilon = 1e-9) { return std::fabs(a - b) < epsilon; }

void testGaugeCyclesDriveOffsetWrites() {
    const auto commands = aof::GaugeCommandSet::defaults();
    auto transport = std::make_unique<aof::MockGaugeTransport>(commands.read);
    auto* mock = transport.get();
    mock->setIdleResponse(frame(1, false, 0));
    // Trimmed to 47.995, 47.996 and 47.994: average 47.995, correction +0.005 mm.
    for (const std::int32_t raw : {479950, 479960, 479900, 479990, 479940}) {
        mock->enqueueResponse(frame(1, false, 0));
        mock->enqueueResponse(frame(1, true, raw));
    }

    aof::CompensationService service;
    assert(service.setGaugeTransport(std::move(transport)));
    service.setHistoryStore(std::make_unique<aof::InMemoryHistoryStore>());
    std::string error;
    assert(service.configure(testConfig(), error));
    assert(service.start());
    assert(service.isRunning());

    auto* driver1 = service.simulatedDriver(1);
    auto* driver2 = service.simulatedDriver(2);
    assert(driver1 != nullptr && driver2 != nullptr);
    assert(waitUntil([&]() { return driver1->writeCount() >= 2U; }));
    service.waitForIdleWrites();

    const aof::ControllerEndpoint endpoint1{.ip = "dummy", .port = 8193, .timeoutSeconds = 10};
    assert(*driver1->offset(endpoint1, 11) == 50);
    assert(*driver1->offset(endpoint1, 12) == 50);
    assert(driver2->writeCount() == 0U);

    const auto offset = service.readToolOffset(1, 11);
    assert(offset.has_value());
    assert(near(*offset, 0.005));
    assert(!service.readToolOffset(9, 11).has_value());

    const auto tool = service.toolProfile(1, 11);
    assert(tool.has_value());
    assert(near(*tool->lastAvgMeasurement, 47.995, 1e-9));
    assert(near(*tool->lastComputedOffset, 0.005, 1e-9));

    const auto records = service.recentChanges(10).get();
    assert(records.size() == 2U);
    for (const auto& record : records) {
        assert(record.machineId == 1U);
        assert(record.oldValue == 0);
        assert(record.delta == 50);
        assert(record.newValue == 50);
        assert(record.success);
    }
    const auto slot12 = service.recentChanges(1, 12, 5).get();
    assert(slot12.size() == 1U && slot12[0].toolSlot == 12);
    assert(service.recentChanges(2, 11, 5).get().empty());
    const auto latest = service.latestChange(1, 12).get();
    assert(latest.has_value() && latest->newValue == 50);
    assert(!service.latestChange(2, 11).get().has_value());

    const auto statuses = service.machineStatuses();
    assert(statuses.size() == 2U);
    assert(statuses[0].id == 1U && statuses[0].connected);
    assert(statuses[0].pendingSamples == 0U);
    assert(!statuses[0].writeInFlight);
    assert(statuses[1].tools.size() == 2U);
    assert(!statuses[1].tools[1].active);

    // Five rising edges, five falling edges: one assert and one clear each.
    assert(service.gaugeLink()->statistics().measurementsPublished == 5U);
    assert(waitUntil([&]() { return service.gaugeLink()->statistics().commandsSent == 10U; }));

    // A batch completing while the previous write is still applied is discarded.
    driver1->setWritesBlocked(true);
    for (int i = 0; i < 5; ++i) {
        service.handleMeasurement(aof::Measurement{.sourceLineId = 1, .rawValue = 480000, .completionFlag = true});
    }
    assert(driver1->waitForBlockedWrite(2000ms));
    for (int i = 0; i < 5; ++i) {
        service.handleMeasurement(aof::Measurement{.sourceLineId = 1, .rawValue = 470000, .completionFlag = true});
    }
    auto blocked = service.machineStatuses();
    assert(blocked[0].writeInFlight);
    assert(blocked[0].pendingSamples == 0U);
    assert(near(*service.toolProfile(1, 11)->lastAvgMeasurement, 48.0));

    driver1->setWritesBlocked(false);
    service.waitForIdleWrites();
    assert(*driver1->offset(endpoint1, 11) == 50);
    assert(service.recentChanges(10).get().size() == 4U);

    // Samples from lines without tool profiles never reach a batch.
    service.handleMeasurement(aof::Measurement{.sourceLineId = 7, .rawValue = 480000, .completionFlag = true});

    // Operator surface.
    assert(!service.setBatchThreshold(0));
    assert(service.setBatchThreshold(3));
    assert(service.updateToolCalibration(1, 11, 48.0, 0.001, 1.0, true));
    assert(near(*service.toolProfile(1, 11)->lastComputedOffset, 0.001));
    assert(!service.updateToolCalibration(1, 99, 48.0, 0.0, 1.0, true));
    assert(service.lastError().find("Unknown tool") != std::string::npos);
    assert(!service.updateToolCalibration(1, 11, 48.0, 0.0, 50.0, true));
    assert(service.lastError().find("Invalid calibration") != std::string::npos);
    assert(service.toolProfile(1, 11)->offsetRate == 1.0);

    assert(!service.setGaugeTransport(std::make_unique<aof::MockGaugeTransport>(commands.read)));
    std::string configureError;
    assert(!service.configure(testConfig(), configureError));

    service.stop();
    assert(!service.isRunning());
    assert(!service.start());
    assert(service.lastError().find("not configured") != std::string::npos);
}

void testFiveFrameBatchWritesEveryActiveSlot() {
    const auto commands = aof::GaugeCommandSet::defaults();
    auto transport = std::make_unique<aof::MockGaugeTransport>(commands.read);
    auto* mock = transport.get();
    mock->setIdleResponse(frame(1, false, 0));
    for (const std::int32_t raw : {480010, 479990, 480020, 480000, 479980}) {
        mock->enqueueResponse(frame(1, true, raw));
        mock->enqueueResponse(frame(1, false, 0));
    }

    auto config = testConfig();
    config.tools[1].active = false;

    aof::CompensationService service;
    assert(service.setGaugeTransport(std::move(transport)));
    std::string error;
    assert(service.configure(config, error));
    assert(service.start());

    auto* driver = service.simulatedDriver(1);
    const aof::ControllerEndpoint endpoint{.ip = "dummy", .port = 8193, .timeoutSeconds = 10};
    driver->setOffset(endpoint, 11, 1234);
    assert(waitUntil([&]() { return driver->writeCount() >= 1U; }));
    service.waitForIdleWrites();

    // Trimmed mean 48.000 equals the basic size: the write happens with a zero delta.
    assert(near(*service.toolProfile(1, 11)->lastAvgMeasurement, 48.0));
    assert(driver->writeCount() == 1U);
    assert(*driver->offset(endpoint, 11) == 1234);
    assert(!driver->offset(endpoint, 12).has_value());

    const auto records = service.recentChanges(10).get();
    assert(records.size() == 1U);
    assert(records[0].toolSlot == 11);
    assert(records[0].oldValue == 1234 && records[0].delta == 0 && records[0].newValue == 1234);
    assert(records[0].success);
    service.stop();
}

void testConfigurationRejected() {
    aof::CompensationService service;
    std::string error;

    auto config = testConfig();
    config.machines[1].ip = "192.168.0.146";
    assert(!service.configure(config, error));
    assert(error.find("No controller driver") != std::string::npos);

    config = testConfig();
    config.batchThreshold = 40;
    assert(!service.configure(config, error));
    assert(error.find("batchThreshold") != std::string::npos);

    assert(!service.start());
    assert(service.machineStatuses().empty());
}

} // namespace

int main() {
    testGaugeCyclesDriveOffsetWrites();
    testFiveFrameBatchWritesEveryActiveSlot();
    testConfigurationRejected();
    std::cout << "end_to_end_tests passed\n";
    return 0;
}
