#include "autooffset/transport/mock_gauge_transport.hpp"

namespace aof {

MockGaugeTransport::MockGaugeTransport(std::vector<std::uint8_t> readCommand)
    : readCommand_(std::move(readCommand)) {}

bool MockGaugeTransport::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (remainingOpenFailures_ > 0U) {
        --remainingOpenFailures_;
        error_ = "Injected connect failure";
        opened_ = false;
        return false;
    }
    opened_ = true;
    rxPending_.clear();
    ++openCount_;
    error_.clear();
    return true;
}

void MockGaugeTransport::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    opened_ = false;
    rxPending_.clear();
}

bool MockGaugeTransport::send(const std::vector<std::uint8_t>& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!opened_) {
        error_ = "Transport not open";
        return false;
    }
    if (remainingSendFailures_ > 0U) {
        --remainingSendFailures_;
        error_ = "Injected send failure";
        return false;
    }

    sentCommands_.push_back(bytes);
    if (!readCommand_.empty() && bytes == readCommand_) {
        if (!scriptedResponses_.empty()) {
            const auto& frame = scriptedResponses_.front();
            rxPending_.insert(rxPending_.end(), frame.begin(), frame.end());
            scriptedResponses_.pop_front();
        } else if (!idleResponse_.empty()) {
            rxPending_.insert(rxPending_.end(), idleResponse_.begin(), idleResponse_.end());
        }
    }
    return true;
}

bool MockGaugeTransport::receive(std::vector<std::uint8_t>& outBytes, std::chrono::milliseconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    outBytes.clear();
    if (!opened_) {
        error_ = "Transport not open";
        return false;
    }
    if (remainingReceiveFailures_ > 0U) {
        --remainingReceiveFailures_;
        error_ = "Injected receive failure";
        return false;
    }
    outBytes.swap(rxPending_);
    return true;
}

std::string MockGaugeTransport::describe() const { return "mock"; }

std::string MockGaugeTransport::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

void MockGaugeTransport::setReadCommand(std::vector<std::uint8_t> readCommand) {
    std::lock_guard<std::mutex> lock(mutex_);
    readCommand_ = std::move(readCommand);
}

void MockGaugeTransport::enqueueResponse(std::vector<std::uint8_t> frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    scriptedResponses_.push_back(std::move(frame));
}

void MockGaugeTransport::setIdleResponse(std::vector<std::uint8_t> frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    idleResponse_ = std::move(frame);
}

void MockGaugeTransport::pushRawBytes(const std::vector<std::uint8_t>& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    rxPending_.insert(rxPending_.end(), bytes.begin(), bytes.end());
}

void MockGaugeTransport::injectOpenFailures(std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    remainingOpenFailures_ = count;
}

void MockGaugeTransport::injectSendFailures(std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    remainingSendFailures_ = count;
}

void MockGaugeTransport::injectReceiveFailures(std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    remainingReceiveFailures_ = count;
}

std::vector<std::vector<std::uint8_t>> MockGaugeTransport::sentCommands() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sentCommands_;
}

void MockGaugeTransport::clearSentCommands() {
    std::lock_guard<std::mutex> lock(mutex_);
    sentCommands_.clear();
}

std::size_t MockGaugeTransport::openCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return openCount_;
}

std::size_t MockGaugeTransport::pendingResponses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scriptedResponses_.size();
}

bool MockGaugeTransport::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return opened_;
}

} // namespace aof
