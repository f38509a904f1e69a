#include "autooffset/service/compensation_service.hpp"

#include <cmath>
#include <iostream>
#include <sstream>

#include "autooffset/calibration/offset_calculator.hpp"
#include "autooffset/config/config_validator.hpp"
#include "autooffset/history/history_stores.hpp"
#include "autooffset/transport/tcp_gauge_transport.hpp"
#include "autooffset/transport/transport_factory.hpp"

namespace aof {
namespace {

bool decodeCommand(const std::string& hex,
                   const std::vector<std::uint8_t>& fallback,
                   std::vector<std::uint8_t>& outBytes,
                   std::string& outError) {
    if (hex.empty()) {
        outBytes = fallback;
        return true;
    }
    return GaugeFrameCodec::parseHex(hex, outBytes, outError);
}

} // namespace

CompensationService::CompensationService() = default;

CompensationService::~CompensationService() {
    stop();
    teardown();
}

bool CompensationService::setGaugeTransport(std::unique_ptr<IGaugeTransport> transport) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (running_) {
        setError("Cannot replace the gauge transport while running");
        return false;
    }
    gaugeLink_.reset();
    gaugeTransport_ = std::move(transport);
    ownsTransport_ = false;
    return !configured_ || buildGaugeLink();
}

void CompensationService::setControllerDriver(std::unique_ptr<IControllerDriver> driver) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    nativeDriver_ = std::move(driver);
}

void CompensationService::setHistoryStore(std::unique_ptr<IHistoryStore> store) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    pendingStore_ = std::move(store);
}

bool CompensationService::configure(const AppConfig& config, std::string& outError) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    outError.clear();
    if (running_) {
        outError = "Cannot configure while running";
        return false;
    }

    const auto issues = ConfigurationValidator::validate(config);
    for (const auto& issue : issues) {
        if (issue.severity == ValidationSeverity::Warning) {
            std::cout << "[aof] config warning: " << issue.message << '\n';
        }
    }
    if (ConfigurationValidator::hasErrors(issues)) {
        std::ostringstream os;
        os << "Configuration invalid:";
        for (const auto& issue : issues) {
            if (issue.severity == ValidationSeverity::Error) {
                os << "\n  - " << issue.message;
            }
        }
        outError = os.str();
        return false;
    }
    for (const auto& machine : config.machines) {
        if (!machine.simulated() && !nativeDriver_) {
            outError = "No controller driver for machine " + std::to_string(machine.id) + " at " + machine.ip +
                       "; set ip to \"dummy\" or install a controller driver";
            return false;
        }
    }

    teardown();
    config_ = config;

    std::unique_ptr<IHistoryStore> store = std::move(pendingStore_);
    if (!store && !config_.historyPath.empty()) {
        auto database = std::make_unique<SqliteHistoryStore>(config_.historyPath);
        if (!database->open(outError)) {
            return false;
        }
        store = std::move(database);
    }
    if (!store) {
        store = std::make_unique<InMemoryHistoryStore>(config_.historyMemoryLimit);
    }
    history_ = std::make_unique<HistoryLogger>(std::move(store));

    profiles_ = std::make_unique<ToolProfileTable>();
    for (const auto& tool : config_.tools) {
        profiles_->upsert(tool);
    }

    registry_ = std::make_unique<ControllerRegistry>();
    const ControllerHandleOptions handleOptions{
        .reconnectBackoff = std::chrono::milliseconds(config_.controllerReconnectBackoffMs)};
    for (const auto& machine : config_.machines) {
        IControllerDriver* driver = nativeDriver_.get();
        if (machine.simulated()) {
            auto& simulated = simulatedDrivers_[machine.id];
            simulated = std::make_unique<SimulatedControllerDriver>();
            driver = simulated.get();
        }
        const ControllerEndpoint endpoint{
            .ip = machine.ip, .port = machine.port, .timeoutSeconds = machine.timeoutSeconds};
        if (!registry_->add(machine.id, endpoint, *driver, handleOptions, outError)) {
            teardown();
            return false;
        }
    }

    coordinator_ = std::make_unique<WriteCoordinator>(
        *registry_, [this](const OffsetChangeRecord& record) { recordChange(record); }, config_.offsetScale);
    aggregator_ = std::make_unique<BatchAggregator>(*profiles_, [this](std::uint16_t machineId) {
        return registry_->isAvailable(machineId) && !coordinator_->isInFlight(machineId);
    });
    if (!aggregator_->setThreshold(config_.batchThreshold, outError)) {
        teardown();
        return false;
    }

    poller_ = std::make_unique<OffsetPoller>(
        *registry_,
        [this]() {
            std::vector<std::pair<std::uint16_t, std::int16_t>> slots;
            for (const auto& profile : profiles_->allProfiles()) {
                slots.emplace_back(profile.machineId, profile.toolSlot);
            }
            return slots;
        },
        [this](const OffsetChangeRecord& record) { recordChange(record); });
    poller_->setSkipPredicate([this](std::uint16_t machineId) { return coordinator_->isInFlight(machineId); });
    coordinator_->setWriteObserver([this](std::uint16_t machineId, std::int16_t toolSlot, std::int32_t value) {
        poller_->noteOwnWrite(machineId, toolSlot, value);
    });

    if (!buildGaugeLink()) {
        outError = error_;
        teardown();
        return false;
    }

    configured_ = true;
    std::cout << "[aof] configured " << config_.machines.size() << " machines, " << config_.tools.size()
              << " tool profiles, batch threshold " << config_.batchThreshold << '\n';
    return true;
}

bool CompensationService::start() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (running_) {
        return true;
    }
    if (!configured_) {
        setError("Service not configured");
        return false;
    }

    if (!history_->start()) {
        setError("History writer failed to start");
        return false;
    }

    const auto connected = registry_->openAll();
    std::cout << "[aof] " << connected << '/' << registry_->size() << " controllers connected\n";

    if (simulator_) {
        std::string error;
        if (!simulator_->start(error)) {
            setError("Gauge simulator failed to start: " + error);
            history_->stop();
            return false;
        }
        if (!gaugeTransport_) {
            gaugeTransport_ = std::make_unique<TcpGaugeTransport>("127.0.0.1", simulator_->port());
            ownsTransport_ = true;
            if (!buildGaugeLink()) {
                simulator_->stop();
                history_->stop();
                return false;
            }
        }
    }

    if (!gaugeLink_) {
        setError("Gauge link not available");
        history_->stop();
        return false;
    }

    if (!gaugeLink_->start([this](const Measurement& measurement) { handleMeasurement(measurement); })) {
        setError("Gauge link already running");
        history_->stop();
        return false;
    }
    poller_->start(OffsetPollerOptions{.interval = std::chrono::milliseconds(config_.pollerIntervalMs)});
    running_ = true;
    configured_ = false;
    return true;
}

void CompensationService::stop() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!running_) {
        return;
    }
    if (gaugeLink_) {
        gaugeLink_->stop();
    }
    if (poller_) {
        poller_->stop();
    }
    if (registry_) {
        registry_->shutdownAll();
    }
    if (coordinator_) {
        coordinator_->shutdown();
    }
    if (history_) {
        history_->stop();
    }
    if (simulator_) {
        simulator_->stop();
    }
    running_ = false;
    std::cout << "[aof] service stopped\n";
}

bool CompensationService::isRunning() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return running_;
}

void CompensationService::handleMeasurement(const Measurement& measurement) {
    // Components are fixed between configure() and stop(); each is internally synchronized.
    if (!profiles_ || !aggregator_ || !coordinator_) {
        return;
    }
    const auto machineId = measurement.sourceLineId;
    if (!profiles_->hasMachine(machineId)) {
        std::cerr << "[aof-batch] no tool profiles for machine " << machineId << ", sample " << measurement.value()
                  << " discarded\n";
        return;
    }

    aggregator_->insert(machineId, measurement.value());
    const auto average = aggregator_->tryExtract(machineId);
    if (!average.has_value()) {
        return;
    }

    std::vector<OffsetWriteRequest> requests;
    for (const auto& profile : profiles_->profilesFor(machineId)) {
        const auto correction = OffsetCalculator::correctionFor(profile);
        if (!correction.has_value()) {
            continue;
        }
        requests.push_back(OffsetWriteRequest{.toolSlot = profile.toolSlot, .correction = *correction});
    }
    if (requests.empty()) {
        std::cout << "[aof-batch] machine " << machineId << " has no active tools, nothing to write\n";
        return;
    }

    const auto result = coordinator_->dispatch(machineId, std::move(requests));
    if (result != DispatchResult::Dispatched) {
        std::cout << "[aof-batch] machine " << machineId << " batch not applied: " << toString(result) << '\n';
    }
}

bool CompensationService::setBatchThreshold(std::size_t threshold) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!aggregator_) {
        setError("Service not configured");
        return false;
    }
    std::string error;
    if (!aggregator_->setThreshold(threshold, error)) {
        setError(error);
        return false;
    }
    config_.batchThreshold = threshold;
    return true;
}

bool CompensationService::updateToolCalibration(std::uint16_t machineId,
                                                std::int16_t toolSlot,
                                                double basicSize,
                                                double manualOffset,
                                                double offsetRate,
                                                bool active) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!profiles_) {
        setError("Service not configured");
        return false;
    }
    if (!std::isfinite(basicSize) || !std::isfinite(manualOffset) || !std::isfinite(offsetRate) ||
        offsetRate < 0.0 || offsetRate > ConfigurationValidator::kMaxOffsetRate) {
        setError("Invalid calibration for tool " + std::to_string(toolSlot) + " on machine " +
                 std::to_string(machineId));
        return false;
    }
    if (!profiles_->updateCalibration(machineId, toolSlot, basicSize, manualOffset, offsetRate, active)) {
        setError("Unknown tool " + std::to_string(toolSlot) + " on machine " + std::to_string(machineId));
        return false;
    }
    return true;
}

std::vector<MachineStatus> CompensationService::machineStatuses() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<MachineStatus> out;
    if (!registry_) {
        return out;
    }
    for (const auto& machine : config_.machines) {
        MachineStatus status;
        status.id = machine.id;
        status.name = machine.name;
        if (const auto* handle = registry_->find(machine.id)) {
            status.endpoint = handle->endpoint().describe();
            status.connected = handle->isConnected();
            status.busy = handle->isBusy();
        }
        status.writeInFlight = coordinator_->isInFlight(machine.id);
        status.pendingSamples = aggregator_->pendingCount(machine.id);
        status.tools = profiles_->profilesFor(machine.id);
        out.push_back(std::move(status));
    }
    return out;
}

std::optional<double> CompensationService::readToolOffset(std::uint16_t machineId, std::int16_t toolSlot) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto* handle = registry_ ? registry_->find(machineId) : nullptr;
    if (handle == nullptr) {
        setError("Unknown machine " + std::to_string(machineId));
        return std::nullopt;
    }
    const auto result = handle->readOffset(toolSlot);
    if (!result.ok()) {
        setError(std::string(toString(result.status)) + ": " + result.message);
        return std::nullopt;
    }
    return fromFixedPoint(result.value, config_.offsetScale);
}

std::future<std::optional<OffsetChangeRecord>> CompensationService::latestChange(std::uint16_t machineId,
                                                                                  std::int16_t toolSlot) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!history_) {
        std::promise<std::optional<OffsetChangeRecord>> empty;
        empty.set_value(std::optional<OffsetChangeRecord>{});
        return empty.get_future();
    }
    return history_->queryLatest(machineId, toolSlot);
}

std::future<std::vector<OffsetChangeRecord>> CompensationService::recentChanges(std::size_t limit) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!history_) {
        std::promise<std::vector<OffsetChangeRecord>> empty;
        empty.set_value(std::vector<OffsetChangeRecord>{});
        return empty.get_future();
    }
    return history_->queryRecent(limit);
}

std::future<std::vector<OffsetChangeRecord>> CompensationService::recentChanges(std::uint16_t machineId,
                                                                                 std::int16_t toolSlot,
                                                                                 std::size_t limit) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!history_) {
        std::promise<std::vector<OffsetChangeRecord>> empty;
        empty.set_value(std::vector<OffsetChangeRecord>{});
        return empty.get_future();
    }
    return history_->queryRecent(machineId, toolSlot, limit);
}

void CompensationService::waitForIdleWrites() {
    WriteCoordinator* coordinator = nullptr;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        coordinator = coordinator_.get();
    }
    if (coordinator != nullptr) {
        coordinator->waitIdle();
    }
}

SimulatedControllerDriver* CompensationService::simulatedDriver(std::uint16_t machineId) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const auto it = simulatedDrivers_.find(machineId);
    return it == simulatedDrivers_.end() ? nullptr : it->second.get();
}

const GaugeLink* CompensationService::gaugeLink() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return gaugeLink_.get();
}

std::optional<ToolProfile> CompensationService::toolProfile(std::uint16_t machineId, std::int16_t toolSlot) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!profiles_) {
        return std::nullopt;
    }
    return profiles_->find(machineId, toolSlot);
}

std::string CompensationService::lastError() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return error_;
}

void CompensationService::teardown() {
    gaugeLink_.reset();
    if (ownsTransport_) {
        gaugeTransport_.reset();
        ownsTransport_ = false;
    }
    simulator_.reset();
    poller_.reset();
    coordinator_.reset();
    aggregator_.reset();
    registry_.reset();
    simulatedDrivers_.clear();
    profiles_.reset();
    history_.reset();
    configured_ = false;
}

bool CompensationService::buildGaugeLink() {
    const auto& gauge = config_.gauge;

    GaugeLinkOptions options;
    options.pollInterval = std::chrono::milliseconds(gauge.pollIntervalMs);
    options.reconnectBackoff = std::chrono::milliseconds(gauge.reconnectBackoffMs);
    options.receiveTimeout = std::chrono::milliseconds(gauge.receiveTimeoutMs);
    options.layout.slotOffsets = gauge.slotOffsets;
    options.layout.minimumFrameBytes = gauge.minimumFrameBytes;
    options.resetProtocol = gauge.resetProtocol;

    const auto defaults = GaugeCommandSet::defaults();
    std::string error;
    if (!decodeCommand(gauge.readCommandHex, defaults.read, options.commands.read, error) ||
        !decodeCommand(gauge.resetAssertHex, defaults.resetAssert, options.commands.resetAssert, error) ||
        !decodeCommand(gauge.resetClearHex, defaults.resetClear, options.commands.resetClear, error)) {
        setError("Invalid gauge command: " + error);
        return false;
    }

    if (gauge.simulate && !simulator_) {
        GaugeSimulatorOptions simulatorOptions;
        simulatorOptions.frameInterval = std::chrono::milliseconds(gauge.simulatorFrameIntervalMs);
        simulatorOptions.layout = options.layout;
        simulatorOptions.machineIds.clear();
        for (const auto& machine : config_.machines) {
            simulatorOptions.machineIds.push_back(machine.id);
        }
        simulator_ = std::make_unique<GaugeSimulator>(simulatorOptions);
    }

    if (!gaugeTransport_) {
        if (gauge.simulate) {
            // Bound once the simulator listens; see start().
            return true;
        }
        TransportFactoryConfig transportConfig;
        transportConfig.kind = TransportKind::Tcp;
        transportConfig.host = gauge.host;
        transportConfig.port = gauge.port;
        transportConfig.connectTimeoutMs = gauge.connectTimeoutMs;
        gaugeTransport_ = TransportFactory::create(transportConfig, error);
        if (!gaugeTransport_) {
            setError("Gauge transport: " + error);
            return false;
        }
        ownsTransport_ = true;
    }

    gaugeLink_ = std::make_unique<GaugeLink>(*gaugeTransport_, options);
    return true;
}

void CompensationService::recordChange(const OffsetChangeRecord& record) {
    if (history_) {
        history_->log(record);
    }
}

void CompensationService::setError(std::string message) {
    error_ = std::move(message);
    std::cerr << "[aof] " << error_ << '\n';
}

} // namespace aof
