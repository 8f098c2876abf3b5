/**
 * @file tcp_socket.cpp
 * @brief TcpSocket implementation.
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#include "cozyd/net/tcp_socket.hpp"
#include "cozyd/utils/logger.hpp"

#include <chrono>

namespace cozyd {
namespace net {

namespace {

int remainingMs(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

#ifdef MSG_NOSIGNAL
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0;
#endif

}  // namespace

TcpSocket::TcpSocket()
    : socket_(INVALID_SOCKET_HANDLE)
    , connected_(false)
    , lastError_(0)
    , peerPort_(0)
{}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept
    : socket_(other.socket_)
    , connected_(other.connected_)
    , lastError_(other.lastError_)
    , peerIp_(std::move(other.peerIp_))
    , peerPort_(other.peerPort_)
{
    other.socket_ = INVALID_SOCKET_HANDLE;
    other.connected_ = false;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        connected_ = other.connected_;
        lastError_ = other.lastError_;
        peerIp_ = std::move(other.peerIp_);
        peerPort_ = other.peerPort_;
        other.socket_ = INVALID_SOCKET_HANDLE;
        other.connected_ = false;
    }
    return *this;
}

TcpStatus TcpSocket::connect(const std::string& ip, uint16_t port, int timeoutMs) {
    close();
    peerIp_ = ip;
    peerPort_ = port;

    sockaddr_in addr;
    if (!makeSockaddr(ip, port, addr)) {
        LOG_ERROR("TcpSocket", "Invalid address: {}", ip);
        lastError_ = 0;
        return TcpStatus::ERROR;
    }

    socket_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (socket_ == INVALID_SOCKET_HANDLE) {
        lastError_ = getLastSocketError();
        LOG_ERROR("TcpSocket", "Failed to create socket: error {}", lastError_);
        return TcpStatus::ERROR;
    }

    if (!setNonBlocking(socket_, true)) {
        lastError_ = getLastSocketError();
        close();
        return TcpStatus::ERROR;
    }

    // Frames are small request/response pairs.
    if (!setSocketFlag(socket_, IPPROTO_TCP, TCP_NODELAY, true)) {
        LOG_DEBUG("TcpSocket", "TCP_NODELAY not set: error {}", getLastSocketError());
    }

    if (::connect(socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        int error = getLastSocketError();
        if (!isInProgress(error)) {
            lastError_ = error;
            close();
            return classifyError(error);
        }

        int ready = waitForSocket(socket_, true, timeoutMs);
        if (ready <= 0) {
            lastError_ = ready == 0 ? 0 : getLastSocketError();
            close();
            return ready == 0 ? TcpStatus::TIMEOUT : TcpStatus::ERROR;
        }

        int soError = 0;
        socklen_t len = sizeof(soError);
        if (getsockopt(socket_, SOL_SOCKET, SO_ERROR,
                       reinterpret_cast<char*>(&soError), &len) != 0) {
            soError = getLastSocketError();
        }
        if (soError != 0) {
            lastError_ = soError;
            close();
            return classifyError(soError);
        }
    }

    connected_ = true;
    lastError_ = 0;
    LOG_TRACE("TcpSocket", "Connected to {}:{}", ip, port);
    return TcpStatus::OK;
}

TcpStatus TcpSocket::sendAll(const void* data, size_t length, int timeoutMs) {
    if (!isOpen()) {
        return TcpStatus::CLOSED;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    const char* cursor = static_cast<const char*>(data);
    size_t left = length;

    while (left > 0) {
#ifdef _WIN32
        int sent = ::send(socket_, cursor, static_cast<int>(left), 0);
#else
        ssize_t sent = ::send(socket_, cursor, left, kSendFlags);
#endif
        if (sent > 0) {
            cursor += sent;
            left -= static_cast<size_t>(sent);
            continue;
        }

        int error = getLastSocketError();
        if (sent < 0 && isInProgress(error)) {
            int ready = waitForSocket(socket_, true, remainingMs(deadline));
            if (ready == 0) {
                return TcpStatus::TIMEOUT;
            }
            if (ready > 0) {
                continue;
            }
            error = getLastSocketError();
        }

        lastError_ = error;
        return classifyError(error);
    }

    return TcpStatus::OK;
}

TcpStatus TcpSocket::receive(void* buffer, size_t bufferSize, int timeoutMs, size_t& received) {
    received = 0;
    if (!isOpen()) {
        return TcpStatus::CLOSED;
    }

    int ready = waitForSocket(socket_, false, timeoutMs);
    if (ready == 0) {
        return TcpStatus::TIMEOUT;
    }
    if (ready < 0) {
        lastError_ = getLastSocketError();
        return TcpStatus::ERROR;
    }

#ifdef _WIN32
    int got = ::recv(socket_, static_cast<char*>(buffer), static_cast<int>(bufferSize), 0);
#else
    ssize_t got = ::recv(socket_, buffer, bufferSize, 0);
#endif

    if (got == 0) {
        lastError_ = 0;
        return TcpStatus::CLOSED;
    }
    if (got < 0) {
        int error = getLastSocketError();
        if (isInProgress(error)) {
            return TcpStatus::TIMEOUT;
        }
        lastError_ = error;
        return classifyError(error);
    }

    received = static_cast<size_t>(got);
    return TcpStatus::OK;
}

void TcpSocket::close() {
    if (socket_ != INVALID_SOCKET_HANDLE) {
        closeSocket(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
    }
    connected_ = false;
}

TcpStatus TcpSocket::classifyError(int error) const {
#ifdef _WIN32
    switch (error) {
        case WSAECONNREFUSED: return TcpStatus::REFUSED;
        case WSAETIMEDOUT: return TcpStatus::TIMEOUT;
        case WSAECONNRESET:
        case WSAECONNABORTED:
        case WSAESHUTDOWN: return TcpStatus::CLOSED;
        default: return TcpStatus::ERROR;
    }
#else
    switch (error) {
        case ECONNREFUSED: return TcpStatus::REFUSED;
        case ETIMEDOUT: return TcpStatus::TIMEOUT;
        case ECONNRESET:
        case EPIPE:
        case ECONNABORTED: return TcpStatus::CLOSED;
        default: return TcpStatus::ERROR;
    }
#endif
}

}  // namespace net
}  // namespace cozyd
