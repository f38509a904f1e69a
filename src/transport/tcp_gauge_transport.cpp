/**
 * @file tcp_gauge_transport.cpp
 * @brief TCP socket lifecycle and byte-stream I/O for the gauge connection.
 */

#include "autooffset/transport/tcp_gauge_transport.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace aof {
namespace {

constexpr std::size_t kReceiveChunkBytes = 4096;

bool waitWritable(int socketFd, int timeoutMs, std::string& outError) {
    fd_set writeSet;
    FD_ZERO(&writeSet);
    FD_SET(socketFd, &writeSet);

    timeval timeout {};
    timeout.tv_sec = timeoutMs / 1000;
    timeout.tv_usec = (timeoutMs % 1000) * 1000;

    const int selectResult = ::select(socketFd + 1, nullptr, &writeSet, nullptr, &timeout);
    if (selectResult == 0) {
        outError = "connect timeout";
        return false;
    }
    if (selectResult < 0) {
        outError = "select() failed: " + std::string(std::strerror(errno));
        return false;
    }

    int socketError = 0;
    socklen_t length = sizeof(socketError);
    if (::getsockopt(socketFd, SOL_SOCKET, SO_ERROR, &socketError, &length) < 0) {
        outError = "getsockopt(SO_ERROR) failed: " + std::string(std::strerror(errno));
        return false;
    }
    if (socketError != 0) {
        outError = "connect() failed: " + std::string(std::strerror(socketError));
        return false;
    }
    return true;
}

bool connectWithTimeout(const std::string& host,
                        std::uint16_t port,
                        int timeoutMs,
                        int& outSocketFd,
                        std::string& outError) {
    addrinfo hints {};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* results = nullptr;
    const auto service = std::to_string(port);
    const int gaiResult = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
    if (gaiResult != 0 || results == nullptr) {
        outError = "getaddrinfo(" + host + ") failed: " + std::string(::gai_strerror(gaiResult));
        return false;
    }

    bool connected = false;
    for (addrinfo* entry = results; entry != nullptr && !connected; entry = entry->ai_next) {
        const int fd = ::socket(entry->ai_family, entry->ai_socktype, entry->ai_protocol);
        if (fd < 0) {
            outError = "socket() failed: " + std::string(std::strerror(errno));
            continue;
        }

        const int flags = ::fcntl(fd, F_GETFL, 0);
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        const int result = ::connect(fd, entry->ai_addr, entry->ai_addrlen);
        if (result < 0 && errno != EINPROGRESS) {
            outError = "connect() failed: " + std::string(std::strerror(errno));
            ::close(fd);
            continue;
        }
        if (result < 0 && !waitWritable(fd, timeoutMs, outError)) {
            ::close(fd);
            continue;
        }

        ::fcntl(fd, F_SETFL, flags);
        const int noDelay = 1;
        ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay));
        outSocketFd = fd;
        connected = true;
    }

    ::freeaddrinfo(results);
    return connected;
}

} // namespace

TcpGaugeTransport::TcpGaugeTransport(std::string host, std::uint16_t port)
    : host_(std::move(host)), port_(port) {}

TcpGaugeTransport::~TcpGaugeTransport() { close(); }

void TcpGaugeTransport::setConnectTimeoutMs(int timeoutMs) {
    connectTimeoutMs_ = timeoutMs > 0 ? timeoutMs : 1;
}

bool TcpGaugeTransport::open() {
    close();
    error_.clear();
    if (!connectWithTimeout(host_, port_, connectTimeoutMs_, socketFd_, error_)) {
        socketFd_ = -1;
        return false;
    }
    return true;
}

void TcpGaugeTransport::close() {
    if (socketFd_ >= 0) {
        ::shutdown(socketFd_, SHUT_RDWR);
        ::close(socketFd_);
        socketFd_ = -1;
    }
}

bool TcpGaugeTransport::send(const std::vector<std::uint8_t>& bytes) {
    if (socketFd_ < 0) {
        error_ = "transport not open";
        return false;
    }

    std::size_t offset = 0;
    while (offset < bytes.size()) {
        const auto sent = ::send(socketFd_, bytes.data() + offset, bytes.size() - offset, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            error_ = "send() failed: " + std::string(std::strerror(errno));
            return false;
        }
        offset += static_cast<std::size_t>(sent);
    }
    return true;
}

bool TcpGaugeTransport::receive(std::vector<std::uint8_t>& outBytes, std::chrono::milliseconds timeout) {
    outBytes.clear();
    if (socketFd_ < 0) {
        error_ = "transport not open";
        return false;
    }

    fd_set readSet;
    FD_ZERO(&readSet);
    FD_SET(socketFd_, &readSet);

    const auto timeoutMs = static_cast<long>(timeout.count());
    timeval tv {};
    tv.tv_sec = timeoutMs / 1000;
    tv.tv_usec = (timeoutMs % 1000) * 1000;

    const int selectResult = ::select(socketFd_ + 1, &readSet, nullptr, nullptr, &tv);
    if (selectResult == 0) {
        return true;
    }
    if (selectResult < 0) {
        if (errno == EINTR) {
            return true;
        }
        error_ = "select() failed: " + std::string(std::strerror(errno));
        return false;
    }

    rxBuffer_.resize(kReceiveChunkBytes);
    const auto received = ::recv(socketFd_, rxBuffer_.data(), rxBuffer_.size(), 0);
    if (received < 0) {
        error_ = "recv() failed: " + std::string(std::strerror(errno));
        return false;
    }
    if (received == 0) {
        error_ = "connection closed by peer";
        return false;
    }
    outBytes.assign(rxBuffer_.begin(), rxBuffer_.begin() + received);
    return true;
}

std::string TcpGaugeTransport::describe() const { return host_ + ":" + std::to_string(port_); }

std::string TcpGaugeTransport::lastError() const { return error_; }

} // namespace aof
