/**
 * @file controller_registry.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "autooffset/controller/controller_handle.hpp"

namespace aof {

/**
 * @brief One ControllerHandle per configured machine, addressed by machine id.
 */
class ControllerRegistry {
public:
    ControllerRegistry() = default;
    ~ControllerRegistry();

    bool add(std::uint16_t machineId,
             ControllerEndpoint endpoint,
             IControllerDriver& driver,
             ControllerHandleOptions options,
             std::string& outError);

    ControllerHandle* find(std::uint16_t machineId) const;
    bool isAvailable(std::uint16_t machineId) const;
    std::vector<std::uint16_t> machineIds() const;
    std::size_t size() const noexcept { return handles_.size(); }

    /**
     * @brief Open every handle; returns the number that connected immediately.
     */
    std::size_t openAll();
    void shutdownAll();
    void clear();

private:
    std::map<std::uint16_t, std::unique_ptr<ControllerHandle>> handles_;
};

} // namespace aof
