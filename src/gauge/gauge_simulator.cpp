#include "autooffset/gauge/gauge_simulator.hpp"

#include <cerrno>
#include <cmath>
#include <cstring>
#include <iostream>
#include <random>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace aof {
namespace {

constexpr int kSelectSliceMs = 20;

bool waitReadable(int fd, int timeoutMs) {
    fd_set readSet;
    FD_ZERO(&readSet);
    FD_SET(fd, &readSet);
    timeval timeout {};
    timeout.tv_sec = timeoutMs / 1000;
    timeout.tv_usec = (timeoutMs % 1000) * 1000;
    return ::select(fd + 1, &readSet, nullptr, nullptr, &timeout) > 0;
}

bool sendAll(int fd, const std::vector<std::uint8_t>& bytes) {
    std::size_t offset = 0;
    while (offset < bytes.size()) {
        const auto sent = ::send(fd, bytes.data() + offset, bytes.size() - offset, MSG_NOSIGNAL);
        if (sent <= 0) {
            if (sent < 0 && errno == EINTR) {
                continue;
            }
            return false;
        }
        offset += static_cast<std::size_t>(sent);
    }
    return true;
}

} // namespace

GaugeSimulator::GaugeSimulator(GaugeSimulatorOptions options) : options_(std::move(options)) {
    if (options_.machineIds.empty()) {
        options_.machineIds.push_back(1);
    }
}

GaugeSimulator::~GaugeSimulator() { stop(); }

bool GaugeSimulator::start(std::string& outError) {
    if (running_.load()) {
        outError = "simulator already running";
        return false;
    }

    listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listenFd_ < 0) {
        outError = "socket() failed: " + std::string(std::strerror(errno));
        return false;
    }
    const int reuse = 1;
    ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in addr {};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(options_.port);
    if (::inet_pton(AF_INET, options_.bindAddress.c_str(), &addr.sin_addr) != 1) {
        outError = "invalid bind address: " + options_.bindAddress;
        ::close(listenFd_);
        listenFd_ = -1;
        return false;
    }
    if (::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        outError = "bind() failed: " + std::string(std::strerror(errno));
        ::close(listenFd_);
        listenFd_ = -1;
        return false;
    }
    if (::listen(listenFd_, 1) < 0) {
        outError = "listen() failed: " + std::string(std::strerror(errno));
        ::close(listenFd_);
        listenFd_ = -1;
        return false;
    }

    sockaddr_in bound {};
    socklen_t boundLength = sizeof(bound);
    if (::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&bound), &boundLength) == 0) {
        boundPort_.store(ntohs(bound.sin_port));
    } else {
        boundPort_.store(options_.port);
    }

    running_.store(true);
    acceptThread_ = std::thread([this]() { acceptLoop(); });
    std::cout << "[aof-sim] gauge simulator listening on " << options_.bindAddress << ':' << port() << '\n';
    return true;
}

void GaugeSimulator::stop() {
    running_.store(false);
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    if (listenFd_ >= 0) {
        ::close(listenFd_);
        listenFd_ = -1;
    }
}

bool GaugeSimulator::isRunning() const noexcept { return running_.load(); }

std::uint16_t GaugeSimulator::port() const noexcept { return boundPort_.load(); }

std::uint64_t GaugeSimulator::framesSent() const noexcept { return framesSent_.load(); }

std::uint64_t GaugeSimulator::bytesReceived() const noexcept { return bytesReceived_.load(); }

void GaugeSimulator::acceptLoop() {
    while (running_.load()) {
        if (!waitReadable(listenFd_, kSelectSliceMs * 5)) {
            continue;
        }
        const int clientFd = ::accept(listenFd_, nullptr, nullptr);
        if (clientFd < 0) {
            continue;
        }
        serveClient(clientFd);
        ::close(clientFd);
    }
}

void GaugeSimulator::serveClient(int clientFd) {
    std::mt19937 rng(std::random_device{}());
    std::uniform_real_distribution<double> noise(-options_.jitter, options_.jitter);

    std::size_t machineIndex = 0;
    bool complete = false;
    std::vector<std::uint8_t> scratch(1024U);
    auto nextFrame = std::chrono::steady_clock::now();

    while (running_.load()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= nextFrame) {
            complete = !complete;
            GaugeResponse response;
            response.machineId = options_.machineIds[machineIndex];
            response.statusCode = complete ? options_.layout.completeStatusCode : 0U;
            for (std::size_t i = 0; i < options_.layout.slotOffsets.size(); ++i) {
                const double value = options_.nominalValue + noise(rng);
                response.slots.push_back(static_cast<std::int32_t>(std::lround(value * 10000.0)));
            }
            if (!sendAll(clientFd, GaugeFrameCodec::buildResponse(response, options_.layout))) {
                return;
            }
            framesSent_.fetch_add(1U);
            if (!complete) {
                machineIndex = (machineIndex + 1U) % options_.machineIds.size();
            }
            nextFrame += options_.frameInterval;
        }

        // Drain read/ack commands; their content does not change the stream.
        if (waitReadable(clientFd, kSelectSliceMs)) {
            const auto received = ::recv(clientFd, scratch.data(), scratch.size(), 0);
            if (received <= 0) {
                return;
            }
            bytesReceived_.fetch_add(static_cast<std::uint64_t>(received));
        }
    }
}

} // namespace aof
