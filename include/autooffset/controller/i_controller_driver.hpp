/**
 * @file i_controller_driver.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <cstdint>
#include <string>

#include "autooffset/controller/controller_types.hpp"

namespace aof {

class IControllerDriver;

/**
 * @brief Owned, move-only native controller handle.
 *
 * The handle is returned to its driver when it is reset, reassigned or destroyed.
 */
class NativeHandle {
public:
    NativeHandle() = default;
    NativeHandle(IControllerDriver* driver, std::uint64_t token) noexcept;
    ~NativeHandle();

    NativeHandle(const NativeHandle&) = delete;
    NativeHandle& operator=(const NativeHandle&) = delete;
    NativeHandle(NativeHandle&& other) noexcept;
    NativeHandle& operator=(NativeHandle&& other) noexcept;

    void reset() noexcept;
    bool valid() const noexcept { return driver_ != nullptr; }
    std::uint64_t token() const noexcept { return token_; }

private:
    IControllerDriver* driver_ = nullptr;
    std::uint64_t token_ = 0;
};

/**
 * @brief Vendor controller capability: tool-offset read and write over a native handle.
 */
class IControllerDriver {
public:
    virtual ~IControllerDriver() = default;

    virtual bool connect(const ControllerEndpoint& endpoint, NativeHandle& outHandle, std::string& outError) = 0;
    virtual bool readOffset(const NativeHandle& handle,
                            std::int16_t toolSlot,
                            std::int32_t& outValue,
                            std::string& outError) = 0;
    virtual bool writeOffset(const NativeHandle& handle,
                             std::int16_t toolSlot,
                             std::int32_t value,
                             std::string& outError) = 0;
    virtual std::string name() const = 0;

protected:
    friend class NativeHandle;
    virtual void release(std::uint64_t token) noexcept = 0;
};

} // namespace aof
