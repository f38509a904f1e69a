/**
 * @file config_validator.cpp
 * @brief autooffset source file.
 */

#include "autooffset/config/config_validator.hpp"

#include <cmath>
#include <set>
#include <sstream>
#include <utility>

#include "autooffset/calibration/batch_aggregator.hpp"
#include "autooffset/transport/gauge_frame.hpp"

namespace aof {
namespace {

void checkCommandHex(const std::string& name, const std::string& hex, std::vector<ValidationIssue>& issues) {
    if (hex.empty()) {
        return;
    }
    std::vector<std::uint8_t> bytes;
    std::string error;
    if (!GaugeFrameCodec::parseHex(hex, bytes, error)) {
        issues.push_back({ValidationSeverity::Error, "Gauge " + name + " is not valid hex: " + error});
    } else if (bytes.size() < GaugeFrameCodec::kHeaderBytes) {
        issues.push_back({ValidationSeverity::Error, "Gauge " + name + " is shorter than the frame header"});
    }
}

} // namespace

std::vector<ValidationIssue> ConfigurationValidator::validate(const AppConfig& config) {
    std::vector<ValidationIssue> issues;

    if (config.machines.empty()) {
        issues.push_back({ValidationSeverity::Error, "Configuration must contain at least one machine"});
    }

    std::set<std::uint16_t> machineIds;
    for (const auto& machine : config.machines) {
        const auto [_, inserted] = machineIds.insert(machine.id);
        if (!inserted) {
            issues.push_back({ValidationSeverity::Error, "Duplicate machine id: " + std::to_string(machine.id)});
        }
        if (machine.ip.empty()) {
            issues.push_back({ValidationSeverity::Error,
                              "Machine " + std::to_string(machine.id) + " missing controller ip"});
        }
        if (machine.port == 0U) {
            issues.push_back({ValidationSeverity::Error,
                              "Machine " + std::to_string(machine.id) + " has controller port 0"});
        }
    }

    std::set<std::pair<std::uint16_t, std::int16_t>> toolKeys;
    std::set<std::uint16_t> machinesWithTools;
    for (const auto& tool : config.tools) {
        std::ostringstream label;
        label << "Tool " << tool.toolSlot << " on machine " << tool.machineId;
        if (machineIds.count(tool.machineId) == 0U) {
            issues.push_back({ValidationSeverity::Error, label.str() + " references an unknown machine"});
        }
        if (!toolKeys.insert({tool.machineId, tool.toolSlot}).second) {
            issues.push_back({ValidationSeverity::Error, label.str() + " is configured twice"});
        }
        if (!std::isfinite(tool.basicSize) || !std::isfinite(tool.manualOffset) || !std::isfinite(tool.offsetRate)) {
            issues.push_back({ValidationSeverity::Error, label.str() + " has a non-finite calibration value"});
        } else if (tool.offsetRate < 0.0 || tool.offsetRate > kMaxOffsetRate) {
            std::ostringstream os;
            os << label.str() << " offsetRate " << tool.offsetRate << " outside 0.." << kMaxOffsetRate;
            issues.push_back({ValidationSeverity::Error, os.str()});
        } else if (tool.offsetRate == 0.0) {
            issues.push_back({ValidationSeverity::Warning, label.str() + " has offsetRate 0, corrections are zero"});
        }
        if (tool.basicSize <= 0.0) {
            issues.push_back({ValidationSeverity::Warning, label.str() + " has non-positive basicSize"});
        }
        machinesWithTools.insert(tool.machineId);
    }
    for (const auto& machine : config.machines) {
        if (machinesWithTools.count(machine.id) == 0U) {
            issues.push_back({ValidationSeverity::Warning,
                              "Machine " + std::to_string(machine.id) + " has no tool profiles"});
        }
    }

    if (config.batchThreshold == 0U || config.batchThreshold > BatchAggregator::kMaxThreshold) {
        std::ostringstream os;
        os << "batchThreshold " << config.batchThreshold << " outside 1.." << BatchAggregator::kMaxThreshold;
        issues.push_back({ValidationSeverity::Error, os.str()});
    }
    if (config.offsetScale <= 0) {
        issues.push_back({ValidationSeverity::Error, "offsetScale must be positive"});
    }
    if (config.pollerIntervalMs == 0U) {
        issues.push_back({ValidationSeverity::Error, "pollerIntervalMs must be positive"});
    }
    if (config.historyPath.empty()) {
        issues.push_back({ValidationSeverity::Warning, "historyPath empty, history is kept in memory only"});
        if (config.historyMemoryLimit == 0U) {
            issues.push_back({ValidationSeverity::Error, "historyMemoryLimit must be positive"});
        }
    }

    const auto& gauge = config.gauge;
    if (!gauge.simulate) {
        if (gauge.host.empty()) {
            issues.push_back({ValidationSeverity::Error, "Gauge host cannot be empty"});
        }
        if (gauge.port == 0U) {
            issues.push_back({ValidationSeverity::Error, "Gauge port cannot be 0"});
        }
    }
    if (gauge.pollIntervalMs == 0U) {
        issues.push_back({ValidationSeverity::Error, "Gauge pollIntervalMs must be positive"});
    }
    checkCommandHex("readCommandHex", gauge.readCommandHex, issues);
    checkCommandHex("resetAssertHex", gauge.resetAssertHex, issues);
    checkCommandHex("resetClearHex", gauge.resetClearHex, issues);

    if (gauge.slotOffsets.empty()) {
        issues.push_back({ValidationSeverity::Error, "Gauge slotOffsets cannot be empty"});
    }
    for (const auto offset : gauge.slotOffsets) {
        if (offset + 4U > gauge.minimumFrameBytes) {
            std::ostringstream os;
            os << "Gauge slot offset " << offset << " does not fit minimumFrameBytes " << gauge.minimumFrameBytes;
            issues.push_back({ValidationSeverity::Error, os.str()});
        }
    }

    return issues;
}

bool ConfigurationValidator::hasErrors(const std::vector<ValidationIssue>& issues) {
    for (const auto& issue : issues) {
        if (issue.severity == ValidationSeverity::Error) {
            return true;
        }
    }
    return false;
}

} // namespace aof
