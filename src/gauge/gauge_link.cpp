#include "autooffset/gauge/gauge_link.hpp"

#include <cstdlib>
#include <iostream>

namespace aof {

GaugeLink::GaugeLink(IGaugeTransport& transport, GaugeLinkOptions options)
    : transport_(transport),
      options_(std::move(options)),
      codec_(options_.layout),
      router_(options_.resetProtocol) {}

GaugeLink::~GaugeLink() { stop(); }

bool GaugeLink::start(MeasurementCallback callback) {
    if (running_.exchange(true)) {
        return false;
    }
    callback_ = std::move(callback);
    traceFrames_ = (std::getenv("AOF_TRACE_FRAMES") != nullptr);
    worker_ = std::thread([this]() { run(); });
    return true;
}

void GaugeLink::stop() {
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        running_.store(false);
    }
    wakeCv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void GaugeLink::enqueueCommand(GaugeCommand command) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(command);
}

std::size_t GaugeLink::pendingCommands() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool GaugeLink::isRunning() const noexcept { return running_.load(); }

LinkState GaugeLink::state() const noexcept { return state_.load(); }

GaugeLinkStatistics GaugeLink::statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return statistics_;
}

std::string GaugeLink::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

void GaugeLink::run() {
    const auto endpoint = transport_.describe();
    while (running_.load()) {
        state_.store(LinkState::Connecting);
        if (!transport_.open()) {
            setError("connect failed: " + transport_.lastError());
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++statistics_.connectFailures;
            }
            std::cerr << "[aof-gauge] failed to connect to " << endpoint << ": " << transport_.lastError()
                      << ". Retrying in " << options_.reconnectBackoff.count() << " ms\n";
            state_.store(LinkState::Disconnected);
            if (!waitFor(std::chrono::steady_clock::now() + options_.reconnectBackoff)) {
                break;
            }
            continue;
        }

        std::cout << "[aof-gauge] connected to " << endpoint << '\n';
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++statistics_.connects;
            // Stale acknowledgements belong to the previous connection.
            pending_.clear();
        }
        codec_.reset();
        router_.resetConnection();
        state_.store(LinkState::Connected);

        const bool failed = runConnection();
        transport_.close();
        state_.store(LinkState::Disconnected);
        if (!failed) {
            break;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++statistics_.disconnects;
        }
        std::cerr << "[aof-gauge] disconnected from " << endpoint << ": " << lastError()
                  << ". Reconnecting in " << options_.reconnectBackoff.count() << " ms\n";
        if (!waitFor(std::chrono::steady_clock::now() + options_.reconnectBackoff)) {
            break;
        }
    }
    state_.store(LinkState::Disconnected);
}

bool GaugeLink::runConnection() {
    auto nextWake = std::chrono::steady_clock::now();
    while (running_.load()) {
        // Resets go out ahead of the poll so the physical ack never races the next read.
        if (!drainPendingCommands() || !pollOnce()) {
            return true;
        }
        nextWake += options_.pollInterval;
        if (!waitFor(nextWake)) {
            return false;
        }
    }
    return false;
}

bool GaugeLink::drainPendingCommands() {
    while (true) {
        GaugeCommand command = GaugeCommand::Read;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pending_.empty()) {
                return true;
            }
            command = pending_.front();
            pending_.pop_front();
        }
        if (!sendCommand(command)) {
            return false;
        }
    }
}

bool GaugeLink::pollOnce() {
    if (!sendCommand(GaugeCommand::Read)) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++statistics_.pollsSent;
    }

    std::vector<std::uint8_t> received;
    if (!transport_.receive(received, options_.receiveTimeout)) {
        setError("receive failed: " + transport_.lastError());
        return false;
    }
    return handleReceived(received);
}

bool GaugeLink::handleReceived(const std::vector<std::uint8_t>& bytes) {
    if (bytes.empty()) {
        return true;
    }
    if (traceFrames_) {
        std::cerr << "[aof-gauge] rx " << GaugeFrameCodec::toHex(bytes) << '\n';
    }
    codec_.append(bytes);

    while (true) {
        GaugeResponse response;
        std::string diagnostic;
        const auto status = codec_.decodeNext(response, diagnostic);
        if (status == GaugeFrameCodec::DecodeStatus::NeedMoreData) {
            return true;
        }
        if (status == GaugeFrameCodec::DecodeStatus::Dropped) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++statistics_.framesDropped;
            }
            // Write acknowledgements are short frames; only surface them when tracing.
            if (traceFrames_ || diagnostic.rfind("short frame", 0) != 0) {
                std::cerr << "[aof-gauge] dropped frame: " << diagnostic << '\n';
            }
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++statistics_.framesDecoded;
        }
        auto decision = router_.route(response);
        for (const auto command : decision.commands) {
            enqueueCommand(command);
        }
        if (decision.measurement.has_value()) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++statistics_.measurementsPublished;
            }
            if (callback_) {
                callback_(*decision.measurement);
            }
        }
    }
}

bool GaugeLink::sendCommand(GaugeCommand command) {
    std::vector<std::uint8_t> outbound;
    GaugeFrameCodec::encodeCommand(commandBytes(command), outbound);
    if (outbound.empty()) {
        setError(std::string("no bytes configured for command ") + toString(command));
        return false;
    }
    if (!transport_.send(outbound)) {
        setError(std::string("send ") + toString(command) + " failed: " + transport_.lastError());
        return false;
    }
    if (command != GaugeCommand::Read) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++statistics_.commandsSent;
    }
    if (traceFrames_) {
        std::cerr << "[aof-gauge] tx " << toString(command) << ' ' << GaugeFrameCodec::toHex(outbound) << '\n';
    }
    return true;
}

bool GaugeLink::waitFor(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(wakeMutex_);
    wakeCv_.wait_until(lock, deadline, [this]() { return !running_.load(); });
    return running_.load();
}

const std::vector<std::uint8_t>& GaugeLink::commandBytes(GaugeCommand command) const {
    switch (command) {
    case GaugeCommand::ResetAssert:
        return options_.commands.resetAssert;
    case GaugeCommand::ResetClear:
        return options_.commands.resetClear;
    case GaugeCommand::Read:
        break;
    }
    return options_.commands.read;
}

void GaugeLink::setError(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_ = std::move(message);
}

} // namespace aof
