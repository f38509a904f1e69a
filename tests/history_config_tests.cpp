#include <cassert>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "autooffset/config/config_loader.hpp"
#include "autooffset/config/config_validator.hpp"
#include "autooffset/history/history_logger.hpp"
#include "autooffset/history/history_stores.hpp"

namespace {

aof::OffsetChangeRecord makeRecord(std::uint16_t machine, std::int16_t slot, std::int32_t oldValue, std::int32_t delta) {
    aof::OffsetChangeRecord record;
    record.timestamp = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123LL));
    record.machineId = machine;
    record.toolSlot = slot;
    record.oldValue = oldValue;
    record.delta = delta;
    record.newValue = oldValue + delta;
    record.success = true;
    return record;
}

bool hasIssue(const std::vector<aof::ValidationIssue>& issues,
              aof::ValidationSeverity severity,
              const std::string& fragment) {
    for (const auto& issue : issues) {
        if (issue.severity == severity && issue.message.find(fragment) != std::string::npos) {
            return true;
        }
    }
    return false;
}

void testInMemoryStore() {
    aof::InMemoryHistoryStore store;
    std::string error;
    assert(store.append(makeRecord(1, 11, 0, 50), error));
    assert(store.append(makeRecord(1, 12, 0, -10), error));
    assert(store.append(makeRecord(1, 11, 50, 20), error));
    assert(store.size() == 3U);

    const auto latest = store.latest(1, 11);
    assert(latest.has_value());
    assert(latest->oldValue == 50 && latest->newValue == 70);
    assert(!store.latest(2, 11).has_value());

    const auto recent = store.recent(2);
    assert(recent.size() == 2U);
    assert(recent[0].newValue == 70);
    assert(recent[1].toolSlot == 12);
    assert(store.recent(10).size() == 3U);
}

void testInMemoryStoreEvictsOldest() {
    aof::InMemoryHistoryStore store(4);
    assert(store.capacity() == 4U);
    std::string error;
    for (int i = 0; i < 10; ++i) {
        assert(store.append(makeRecord(1, 11, i, 1), error));
    }
    assert(store.size() == 4U);

    const auto recent = store.recent(10);
    assert(recent.size() == 4U);
    assert(recent.front().oldValue == 9);
    assert(recent.back().oldValue == 6);
    assert(store.latest(1, 11)->oldValue == 9);

    assert(aof::InMemoryHistoryStore(0).capacity() == 1U);
}

void testRecentPerTool() {
    aof::InMemoryHistoryStore store;
    std::string error;
    assert(store.append(makeRecord(1, 11, 0, 10), error));
    assert(store.append(makeRecord(1, 12, 0, 20), error));
    assert(store.append(makeRecord(1, 11, 10, 30), error));
    assert(store.append(makeRecord(2, 11, 0, 40), error));
    assert(store.append(makeRecord(1, 12, 20, 50), error));
    assert(store.append(makeRecord(1, 11, 40, 60), error));

    const auto slot11 = store.recent(1, 11, 10);
    assert(slot11.size() == 3U);
    assert(slot11[0].delta == 60 && slot11[1].delta == 30 && slot11[2].delta == 10);
    for (const auto& record : slot11) {
        assert(record.machineId == 1U && record.toolSlot == 11);
    }

    const auto slot12 = store.recent(1, 12, 1);
    assert(slot12.size() == 1U);
    assert(slot12[0].delta == 50);
    assert(store.recent(3, 11, 5).empty());
}

void testSqliteStorePersistsAcrossRuns() {
    namespace fs = std::filesystem;
    const auto base = fs::temp_directory_path() / "aof_history_test";
    fs::remove_all(base);
    const auto path = (base / "logs" / "history.db").string();

    std::string error;
    {
        aof::SqliteHistoryStore store(path);
        assert(!store.append(makeRecord(1, 11, 0, 1), error));
        assert(error.find("not open") != std::string::npos);

        assert(store.open(error));
        assert(store.append(makeRecord(1, 11, 0, 50), error));
        assert(store.append(makeRecord(1, 12, 0, -5), error));
        assert(store.append(makeRecord(1, 11, 50, 10), error));
        assert(store.count() == 3U);
    }
    assert(fs::exists(path));

    {
        aof::SqliteHistoryStore store(path);
        assert(store.open(error));
        assert(store.describe() == "sqlite:" + path);
        assert(store.append(makeRecord(2, 11, 7, 3), error));

        const auto latest = store.latest(1, 11);
        assert(latest.has_value());
        assert(latest->oldValue == 50 && latest->newValue == 60);
        assert(latest->timestamp == makeRecord(1, 11, 0, 0).timestamp);
        assert(latest->success);
        assert(!store.latest(3, 11).has_value());

        const auto recent = store.recent(10);
        assert(recent.size() == 4U);
        assert(recent[0].machineId == 2U);
        assert(recent[3].delta == 50);
        assert(store.recent(0).empty());

        const auto slot11 = store.recent(1, 11, 10);
        assert(slot11.size() == 2U);
        assert(slot11[0].delta == 10 && slot11[1].delta == 50);
        const auto slot12 = store.recent(1, 12, 10);
        assert(slot12.size() == 1U && slot12[0].newValue == -5);
    }

    // A regular file where the directory should be blocks opening.
    {
        std::ofstream blocker(base / "blocker");
        blocker << "x";
    }
    aof::SqliteHistoryStore blocked((base / "blocker" / "history.db").string());
    assert(!blocked.open(error));
    assert(!error.empty());

    fs::remove_all(base);
}

void testHistoryLogger() {
    auto store = std::make_unique<aof::InMemoryHistoryStore>();
    auto* raw = store.get();
    aof::HistoryLogger logger(std::move(store));

    // Nothing is accepted before the writer runs.
    logger.log(makeRecord(1, 11, 0, 1));
    assert(!logger.queryLatest(1, 11).get().has_value());
    assert(logger.queryRecent(5).get().empty());

    assert(logger.start());
    assert(!logger.start());
    for (int i = 0; i < 20; ++i) {
        logger.log(makeRecord(1, 11, i * 10, 10));
    }
    logger.log(makeRecord(2, 12, 0, -5));

    // Queries run behind every record logged before them.
    const auto latest = logger.queryLatest(1, 11).get();
    assert(latest.has_value());
    assert(latest->newValue == 200);
    const auto recent = logger.queryRecent(3).get();
    assert(recent.size() == 3U);
    assert(recent[0].machineId == 2U);
    const auto slot12 = logger.queryRecent(2, 12, 5).get();
    assert(slot12.size() == 1U && slot12[0].delta == -5);
    const auto slot11 = logger.queryRecent(1, 11, 2).get();
    assert(slot11.size() == 2U);
    assert(slot11[0].newValue == 200 && slot11[1].newValue == 190);

    logger.stop();
    assert(raw->size() == 21U);
    assert(logger.appendFailures() == 0U);
    assert(logger.queuedJobs() == 0U);
}

void testConfigLoaderFromString() {
    const std::string json = R"({
  "gauge": { "host": "10.0.0.5", "port": 6000, "simulate": true, "resetProtocol": "pulse",
             "slotOffsets": [31], "minimumFrameBytes": 35 },
  "machines": [
    { "id": 3, "name": "Lathe #3", "ip": "dummy", "port": 8195 }
  ],
  "tools": [
    { "machine": 3, "slot": 7, "basicSize": 25.5, "manualOffset": -0.01, "offsetRate": 0.8, "active": false }
  ],
  "batchThreshold": 7,
  "offsetScale": 1000,
  "historyPath": "h.db",
  "historyMemoryLimit": 250
})";

    aof::AppConfig config;
    std::string error;
    assert(aof::ConfigurationLoader::loadFromJsonString(json, config, error));
    assert(error.empty());
    assert(config.gauge.host == "10.0.0.5");
    assert(config.gauge.port == 6000U);
    assert(config.gauge.simulate);
    assert(config.gauge.resetProtocol == aof::ResetProtocol::Pulse);
    assert(config.gauge.slotOffsets.size() == 1U && config.gauge.slotOffsets[0] == 31U);
    assert(config.gauge.minimumFrameBytes == 35U);
    assert(config.gauge.pollIntervalMs == 200U);

    assert(config.machines.size() == 1U);
    assert(config.machines[0].id == 3U);
    assert(config.machines[0].simulated());
    assert(config.machines[0].port == 8195U);

    assert(config.tools.size() == 1U);
    assert(config.tools[0].toolSlot == 7);
    assert(config.tools[0].basicSize == 25.5);
    assert(config.tools[0].manualOffset == -0.01);
    assert(config.tools[0].offsetRate == 0.8);
    assert(!config.tools[0].active);

    assert(config.batchThreshold == 7U);
    assert(config.offsetScale == 1000);
    assert(config.historyPath == "h.db");
    assert(config.historyMemoryLimit == 250U);
    assert(config.pollerIntervalMs == 1000U);
    assert(!aof::ConfigurationValidator::hasErrors(aof::ConfigurationValidator::validate(config)));

    // Absent sections keep the defaults.
    assert(aof::ConfigurationLoader::loadFromJsonString("{}", config, error));
    assert(config.machines.size() == 2U);
    assert(config.tools.size() == 4U);

    assert(!aof::ConfigurationLoader::loadFromJsonString(R"({"gauge": {"resetProtocol": "toggle"}})", config, error));
    assert(error.find("toggle") != std::string::npos);
    assert(!aof::ConfigurationLoader::loadFromJsonString(R"({"machines": [{"id": 70000}]})", config, error));
    assert(!error.empty());
}

void testConfigLoaderFromFile() {
    namespace fs = std::filesystem;
    const auto base = fs::temp_directory_path() / "aof_config_test";
    fs::create_directories(base);
    const auto path = base / "autooffset.json";
    {
        std::ofstream out(path);
        out << R"({"machines": [{"id": 1, "name": "A", "ip": "192.168.0.10"}], )"
            << R"("tools": [{"machine": 1, "slot": 11, "basicSize": 48.0}], "pollerIntervalMs": 250})";
    }

    aof::AppConfig config;
    std::string error;
    assert(aof::ConfigurationLoader::loadFromJsonFile(path.string(), config, error));
    assert(config.machines.size() == 1U);
    assert(config.machines[0].port == 8193U);
    assert(config.tools[0].offsetRate == 1.0);
    assert(config.tools[0].active);
    assert(config.pollerIntervalMs == 250U);

    assert(!aof::ConfigurationLoader::loadFromJsonFile((base / "absent.json").string(), config, error));
    assert(error.find("Cannot open") != std::string::npos);

    fs::remove_all(base);
}

void testValidator() {
    const auto defaults = aof::AppConfig::defaults();
    assert(defaults.machines.size() == 2U);
    assert(defaults.tools.size() == 4U);
    const auto defaultIssues = aof::ConfigurationValidator::validate(defaults);
    assert(!aof::ConfigurationValidator::hasErrors(defaultIssues));
    assert(hasIssue(defaultIssues, aof::ValidationSeverity::Warning, "historyPath"));

    auto config = defaults;
    config.machines.push_back(config.machines[0]);
    config.machines.back().ip.clear();
    config.tools.push_back(config.tools[0]);
    config.tools.back().offsetRate = 0.0;
    config.tools.push_back(config.tools[1]);
    config.tools.back().offsetRate = 20.0;
    config.tools.push_back(config.tools[2]);
    config.tools.back().manualOffset = std::nan("");
    config.historyMemoryLimit = 0;
    aof::ToolProfile orphan;
    orphan.machineId = 9;
    orphan.toolSlot = 1;
    orphan.basicSize = 10.0;
    config.tools.push_back(orphan);
    config.batchThreshold = 31;
    config.offsetScale = 0;
    config.gauge.readCommandHex = "5000";
    config.gauge.resetAssertHex = "ZZ";
    config.gauge.slotOffsets = {31, 49};

    const auto issues = aof::ConfigurationValidator::validate(config);
    assert(aof::ConfigurationValidator::hasErrors(issues));
    assert(hasIssue(issues, aof::ValidationSeverity::Error, "Duplicate machine id"));
    assert(hasIssue(issues, aof::ValidationSeverity::Error, "missing controller ip"));
    assert(hasIssue(issues, aof::ValidationSeverity::Error, "configured twice"));
    assert(hasIssue(issues, aof::ValidationSeverity::Warning, "offsetRate 0"));
    assert(hasIssue(issues, aof::ValidationSeverity::Error, "offsetRate 20 outside 0..10"));
    assert(hasIssue(issues, aof::ValidationSeverity::Error, "non-finite calibration value"));
    assert(hasIssue(issues, aof::ValidationSeverity::Error, "historyMemoryLimit"));
    assert(hasIssue(issues, aof::ValidationSeverity::Error, "unknown machine"));
    assert(hasIssue(issues, aof::ValidationSeverity::Error, "batchThreshold 31"));
    assert(hasIssue(issues, aof::ValidationSeverity::Error, "offsetScale"));
    assert(hasIssue(issues, aof::ValidationSeverity::Error, "shorter than the frame header"));
    assert(hasIssue(issues, aof::ValidationSeverity::Error, "resetAssertHex is not valid hex"));
    assert(hasIssue(issues, aof::ValidationSeverity::Error, "slot offset 49"));

    aof::AppConfig empty;
    empty.gauge.host.clear();
    const auto emptyIssues = aof::ConfigurationValidator::validate(empty);
    assert(hasIssue(emptyIssues, aof::ValidationSeverity::Error, "at least one machine"));
    assert(hasIssue(emptyIssues, aof::ValidationSeverity::Error, "Gauge host"));
    empty.gauge.simulate = true;
    assert(!hasIssue(aof::ConfigurationValidator::validate(empty), aof::ValidationSeverity::Error, "Gauge host"));
}

} // namespace

int main() {
    testInMemoryStore();
    testInMemoryStoreEvictsOldest();
    testRecentPerTool();
    testSqliteStorePersistsAcrossRuns();
    testHistoryLogger();
    testConfigLoaderFromString();
    testConfigLoaderFromFile();
    testValidator();
    std::cout << "history_config_tests passed\n";
    return 0;
}
