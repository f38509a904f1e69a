#include "autooffset/controller/controller_registry.hpp"

namespace aof {

ControllerRegistry::~ControllerRegistry() { clear(); }

bool ControllerRegistry::add(std::uint16_t machineId,
                             ControllerEndpoint endpoint,
                             IControllerDriver& driver,
                             ControllerHandleOptions options,
                             std::string& outError) {
    if (handles_.find(machineId) != handles_.end()) {
        outError = "duplicate controller for machine " + std::to_string(machineId);
        return false;
    }
    handles_.emplace(machineId,
                     std::make_unique<ControllerHandle>(machineId, std::move(endpoint), driver, options));
    return true;
}

ControllerHandle* ControllerRegistry::find(std::uint16_t machineId) const {
    const auto it = handles_.find(machineId);
    return it == handles_.end() ? nullptr : it->second.get();
}

bool ControllerRegistry::isAvailable(std::uint16_t machineId) const {
    const auto* handle = find(machineId);
    return handle != nullptr && handle->isAvailable();
}

std::vector<std::uint16_t> ControllerRegistry::machineIds() const {
    std::vector<std::uint16_t> ids;
    ids.reserve(handles_.size());
    for (const auto& entry : handles_) {
        ids.push_back(entry.first);
    }
    return ids;
}

std::size_t ControllerRegistry::openAll() {
    std::size_t connected = 0;
    for (auto& [machineId, handle] : handles_) {
        std::string error;
        if (handle->open(error)) {
            ++connected;
        }
    }
    return connected;
}

void ControllerRegistry::shutdownAll() {
    for (auto& entry : handles_) {
        entry.second->shutdown();
    }
}

void ControllerRegistry::clear() {
    shutdownAll();
    handles_.clear();
}

} // namespace aof
