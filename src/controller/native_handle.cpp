#include "autooffset/controller/i_controller_driver.hpp"

#include <utility>

namespace aof {

NativeHandle::NativeHandle(IControllerDriver* driver, std::uint64_t token) noexcept
    : driver_(driver), token_(token) {}

NativeHandle::~NativeHandle() { reset(); }

NativeHandle::NativeHandle(NativeHandle&& other) noexcept
    : driver_(std::exchange(other.driver_, nullptr)), token_(std::exchange(other.token_, 0U)) {}

NativeHandle& NativeHandle::operator=(NativeHandle&& other) noexcept {
    if (this != &other) {
        reset();
        driver_ = std::exchange(other.driver_, nullptr);
        token_ = std::exchange(other.token_, 0U);
    }
    return *this;
}

void NativeHandle::reset() noexcept {
    if (driver_ != nullptr) {
        driver_->release(token_);
    }
    driver_ = nullptr;
    token_ = 0;
}

const char* toString(ControllerStatus status) {
    switch (status) {
    case ControllerStatus::Ok:
        return "Ok";
    case ControllerStatus::Busy:
        return "Busy";
    case ControllerStatus::Unreachable:
        return "Unreachable";
    case ControllerStatus::NativeError:
        return "NativeError";
    case ControllerStatus::UnknownMachine:
        return "UnknownMachine";
    case ControllerStatus::Shutdown:
        return "Shutdown";
    }
    return "Unknown";
}

} // namespace aof
