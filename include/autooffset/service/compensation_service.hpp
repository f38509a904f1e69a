/**
 * @file compensation_service.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "autooffset/calibration/batch_aggregator.hpp"
#include "autooffset/calibration/tool_profile_table.hpp"
#include "autooffset/config/config_models.hpp"
#include "autooffset/controller/controller_registry.hpp"
#include "autooffset/controller/offset_poller.hpp"
#include "autooffset/controller/simulated_controller_driver.hpp"
#include "autooffset/controller/write_coordinator.hpp"
#include "autooffset/gauge/gauge_link.hpp"
#include "autooffset/gauge/gauge_simulator.hpp"
#include "autooffset/history/history_logger.hpp"
#include "autooffset/transport/i_gauge_transport.hpp"

namespace aof {

/**
 * @brief Operator view of one configured machine.
 */
struct MachineStatus {
    std::uint16_t id = 0;
    std::string name;
    std::string endpoint;
    bool connected = false;
    bool busy = false;
    bool writeInFlight = false;
    std::size_t pendingSamples = 0;
    std::vector<ToolProfile> tools;
};

/**
 * @brief High-level orchestration of the measure, reduce and compensate pipeline.
 *
 * CompensationService wires the gauge link into the batch aggregator, turns
 * completed batches into per-slot corrections for the write coordinator and
 * forwards every offset change record to the history logger.
 *
 * `stop()` is terminal for the configured pipeline; call `configure()` again
 * before the next `start()`.
 */
class CompensationService {
public:
    CompensationService();
    ~CompensationService();

    CompensationService(const CompensationService&) = delete;
    CompensationService& operator=(const CompensationService&) = delete;

    /**
     * @brief Replace the gauge transport built from configuration (tests, diagnostics).
     */
    bool setGaugeTransport(std::unique_ptr<IGaugeTransport> transport);
    /**
     * @brief Driver for machines whose ip is not "dummy".
     */
    void setControllerDriver(std::unique_ptr<IControllerDriver> driver);
    void setHistoryStore(std::unique_ptr<IHistoryStore> store);

    bool configure(const AppConfig& config, std::string& outError);
    bool start();
    void stop();
    bool isRunning() const;

    /**
     * @brief Feed one completed gauge cycle; normally called from the gauge link worker.
     */
    void handleMeasurement(const Measurement& measurement);

    bool setBatchThreshold(std::size_t threshold);
    bool updateToolCalibration(std::uint16_t machineId,
                               std::int16_t toolSlot,
                               double basicSize,
                               double manualOffset,
                               double offsetRate,
                               bool active);
    std::vector<MachineStatus> machineStatuses() const;

    /**
     * @brief Current controller offset in millimetres.
     */
    std::optional<double> readToolOffset(std::uint16_t machineId, std::int16_t toolSlot);

    std::future<std::optional<OffsetChangeRecord>> latestChange(std::uint16_t machineId, std::int16_t toolSlot);
    std::future<std::vector<OffsetChangeRecord>> recentChanges(std::size_t limit);
    std::future<std::vector<OffsetChangeRecord>> recentChanges(std::uint16_t machineId,
                                                               std::int16_t toolSlot,
                                                               std::size_t limit);

    void waitForIdleWrites();
    SimulatedControllerDriver* simulatedDriver(std::uint16_t machineId) const;
    const GaugeLink* gaugeLink() const;
    std::optional<ToolProfile> toolProfile(std::uint16_t machineId, std::int16_t toolSlot) const;
    std::string lastError() const;

private:
    void teardown();
    bool buildGaugeLink();
    void recordChange(const OffsetChangeRecord& record);
    void setError(std::string message);

    mutable std::recursive_mutex mutex_;
    AppConfig config_;
    bool configured_ = false;
    bool running_ = false;
    std::string error_;

    std::unique_ptr<IControllerDriver> nativeDriver_;
    std::unique_ptr<IHistoryStore> pendingStore_;
    std::unique_ptr<IGaugeTransport> gaugeTransport_;
    bool ownsTransport_ = false;

    std::map<std::uint16_t, std::unique_ptr<SimulatedControllerDriver>> simulatedDrivers_;
    std::unique_ptr<HistoryLogger> history_;
    std::unique_ptr<ToolProfileTable> profiles_;
    std::unique_ptr<ControllerRegistry> registry_;
    std::unique_ptr<WriteCoordinator> coordinator_;
    std::unique_ptr<BatchAggregator> aggregator_;
    std::unique_ptr<OffsetPoller> poller_;
    std::unique_ptr<GaugeSimulator> simulator_;
    std::unique_ptr<GaugeLink> gaugeLink_;
};

} // namespace aof
