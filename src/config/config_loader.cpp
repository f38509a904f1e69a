/**
 * @file config_loader.cpp
 * @brief autooffset source file.
 */

#include "autooffset/config/config_loader.hpp"

#include <fstream>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace aof {
namespace {

bool readFile(const std::string& path, std::string& out, std::string& outError) {
    std::ifstream file(path);
    if (!file) {
        outError = "Cannot open file: " + path;
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

std::optional<std::string> extractObject(const std::string& json, const std::string& key) {
    std::regex re("\"" + key + "\"\\s*:\\s*\\{([^\\{\\}]*)\\}");
    std::smatch match;
    if (!std::regex_search(json, match, re) || match.size() < 2) {
        return std::nullopt;
    }
    return match[1].str();
}

std::optional<std::vector<std::string>> extractObjectArray(const std::string& json, const std::string& key) {
    std::regex arrayRe("\"" + key + "\"\\s*:\\s*\\[([^\\]]*)\\]");
    std::smatch match;
    if (!std::regex_search(json, match, arrayRe) || match.size() < 2) {
        return std::nullopt;
    }
    const auto body = match[1].str();
    std::vector<std::string> objects;
    std::regex objectRe("\\{([^\\{\\}]*)\\}");
    for (std::sregex_iterator it(body.begin(), body.end(), objectRe), end; it != end; ++it) {
        objects.push_back((*it)[1].str());
    }
    return objects;
}

std::optional<std::string> stringField(const std::string& object, const std::string& key) {
    std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
    std::smatch match;
    if (!std::regex_search(object, match, re)) {
        return std::nullopt;
    }
    return match[1].str();
}

std::optional<std::string> numberText(const std::string& object, const std::string& key) {
    std::regex re("\"" + key + "\"\\s*:\\s*(-?[0-9]+(?:\\.[0-9]+)?(?:[eE][-+]?[0-9]+)?)");
    std::smatch match;
    if (!std::regex_search(object, match, re)) {
        return std::nullopt;
    }
    return match[1].str();
}

std::optional<bool> boolField(const std::string& object, const std::string& key) {
    std::regex re("\"" + key + "\"\\s*:\\s*(true|false)");
    std::smatch match;
    if (!std::regex_search(object, match, re)) {
        return std::nullopt;
    }
    return match[1].str() == "true";
}

template <typename T>
void assignUnsigned(const std::string& object, const std::string& key, T& target, unsigned long long maxValue) {
    if (const auto text = numberText(object, key)) {
        std::size_t consumed = 0;
        const auto value = std::stoull(*text, &consumed, 10);
        if (consumed != text->size() || value > maxValue) {
            throw std::out_of_range("value of '" + key + "' out of range: " + *text);
        }
        target = static_cast<T>(value);
    }
}

void assignDouble(const std::string& object, const std::string& key, double& target) {
    if (const auto text = numberText(object, key)) {
        target = std::stod(*text);
    }
}

std::vector<std::size_t> numberArray(const std::string& object, const std::string& key, bool& found) {
    std::regex re("\"" + key + "\"\\s*:\\s*\\[([^\\]]*)\\]");
    std::smatch match;
    found = std::regex_search(object, match, re);
    std::vector<std::size_t> values;
    if (!found) {
        return values;
    }
    const auto body = match[1].str();
    std::regex numberRe("[0-9]+");
    for (std::sregex_iterator it(body.begin(), body.end(), numberRe), end; it != end; ++it) {
        values.push_back(static_cast<std::size_t>(std::stoul(it->str())));
    }
    return values;
}

bool parseGauge(const std::string& object, GaugeConfig& gauge, std::string& outError) {
    if (const auto host = stringField(object, "host")) {
        gauge.host = *host;
    }
    assignUnsigned(object, "port", gauge.port, 0xFFFFULL);
    if (const auto simulate = boolField(object, "simulate")) {
        gauge.simulate = *simulate;
    }
    assignUnsigned(object, "pollIntervalMs", gauge.pollIntervalMs, 0xFFFFFFFFULL);
    assignUnsigned(object, "reconnectBackoffMs", gauge.reconnectBackoffMs, 0xFFFFFFFFULL);
    assignUnsigned(object, "receiveTimeoutMs", gauge.receiveTimeoutMs, 0xFFFFFFFFULL);
    assignUnsigned(object, "connectTimeoutMs", gauge.connectTimeoutMs, 0x7FFFFFFFULL);
    assignUnsigned(object, "minimumFrameBytes", gauge.minimumFrameBytes, 0xFFFFULL);
    assignUnsigned(object, "simulatorFrameIntervalMs", gauge.simulatorFrameIntervalMs, 0xFFFFFFFFULL);
    if (const auto hex = stringField(object, "readCommandHex")) {
        gauge.readCommandHex = *hex;
    }
    if (const auto hex = stringField(object, "resetAssertHex")) {
        gauge.resetAssertHex = *hex;
    }
    if (const auto hex = stringField(object, "resetClearHex")) {
        gauge.resetClearHex = *hex;
    }
    if (const auto protocolText = stringField(object, "resetProtocol")) {
        const auto protocol = parseResetProtocol(*protocolText);
        if (!protocol) {
            outError = "Unknown reset protocol: " + *protocolText;
            return false;
        }
        gauge.resetProtocol = *protocol;
    }
    bool found = false;
    auto offsets = numberArray(object, "slotOffsets", found);
    if (found) {
        gauge.slotOffsets = std::move(offsets);
    }
    return true;
}

MachineConfig parseMachine(const std::string& object) {
    MachineConfig machine;
    assignUnsigned(object, "id", machine.id, 0xFFFFULL);
    if (const auto name = stringField(object, "name")) {
        machine.name = *name;
    }
    if (const auto ip = stringField(object, "ip")) {
        machine.ip = *ip;
    }
    assignUnsigned(object, "port", machine.port, 0xFFFFULL);
    assignUnsigned(object, "timeoutSeconds", machine.timeoutSeconds, 0xFFFFFFFFULL);
    return machine;
}

ToolProfile parseTool(const std::string& object) {
    ToolProfile tool;
    assignUnsigned(object, "machine", tool.machineId, 0xFFFFULL);
    if (const auto slotText = numberText(object, "slot")) {
        const auto slot = std::stoi(*slotText);
        if (slot < -32768 || slot > 32767) {
            throw std::out_of_range("tool slot out of range: " + *slotText);
        }
        tool.toolSlot = static_cast<std::int16_t>(slot);
    }
    assignDouble(object, "basicSize", tool.basicSize);
    assignDouble(object, "manualOffset", tool.manualOffset);
    assignDouble(object, "offsetRate", tool.offsetRate);
    if (const auto active = boolField(object, "active")) {
        tool.active = *active;
    }
    return tool;
}

} // namespace

bool ConfigurationLoader::loadFromJsonFile(const std::string& filePath, AppConfig& outConfig, std::string& outError) {
    std::string json;
    if (!readFile(filePath, json, outError)) {
        return false;
    }
    return loadFromJsonString(json, outConfig, outError);
}

bool ConfigurationLoader::loadFromJsonString(const std::string& json, AppConfig& outConfig, std::string& outError) {
    outConfig = AppConfig::defaults();
    outError.clear();

    try {
        if (const auto gauge = extractObject(json, "gauge")) {
            if (!parseGauge(*gauge, outConfig.gauge, outError)) {
                return false;
            }
        }

        if (const auto machines = extractObjectArray(json, "machines")) {
            outConfig.machines.clear();
            for (const auto& object : *machines) {
                outConfig.machines.push_back(parseMachine(object));
            }
        }

        if (const auto tools = extractObjectArray(json, "tools")) {
            outConfig.tools.clear();
            for (const auto& object : *tools) {
                outConfig.tools.push_back(parseTool(object));
            }
        }

        assignUnsigned(json, "batchThreshold", outConfig.batchThreshold, 0xFFFFULL);
        assignUnsigned(json, "offsetScale", outConfig.offsetScale, 0x7FFFFFFFULL);
        assignUnsigned(json, "pollerIntervalMs", outConfig.pollerIntervalMs, 0xFFFFFFFFULL);
        assignUnsigned(json, "controllerReconnectBackoffMs", outConfig.controllerReconnectBackoffMs, 0xFFFFFFFFULL);
        assignUnsigned(json, "historyMemoryLimit", outConfig.historyMemoryLimit, 0xFFFFFFFFULL);
        if (const auto historyPath = stringField(json, "historyPath")) {
            outConfig.historyPath = *historyPath;
        }
        return true;
    } catch (const std::exception& ex) {
        outError = std::string("Configuration parse error: ") + ex.what();
        return false;
    }
}

} // namespace aof
