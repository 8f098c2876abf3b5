/**
 * @file udp_socket.cpp
 * @brief UdpSocket implementation.
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#include "cozyd/net/udp_socket.hpp"
#include "cozyd/utils/logger.hpp"

#include <utility>

namespace cozyd {
namespace net {

UdpSocket::UdpSocket()
    : socket_(::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP))
    , lastError_(0)
{
    if (!isValid()) {
        recordError("socket()");
    }
}

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : socket_(std::exchange(other.socket_, INVALID_SOCKET_HANDLE))
    , lastError_(other.lastError_)
{}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = std::exchange(other.socket_, INVALID_SOCKET_HANDLE);
        lastError_ = other.lastError_;
    }
    return *this;
}

bool UdpSocket::bind(uint16_t port, const std::string& address) {
    if (!isValid()) {
        return false;
    }

    sockaddr_in local;
    if (!makeSockaddr(address.empty() ? "0.0.0.0" : address, port, local)) {
        LOG_ERROR("UdpSocket", "Invalid bind address: {}", address);
        return false;
    }

    if (::bind(socket_, reinterpret_cast<const sockaddr*>(&local), sizeof(local)) != 0) {
        return recordError("bind()");
    }

    LOG_TRACE("UdpSocket", "Listening for replies on {}:{}", address, getLocalPort());
    return true;
}

uint16_t UdpSocket::getLocalPort() const {
    sockaddr_in local{};
    socklen_t length = sizeof(local);
    if (!isValid() ||
        getsockname(socket_, reinterpret_cast<sockaddr*>(&local), &length) != 0) {
        return 0;
    }
    return ntohs(local.sin_port);
}

bool UdpSocket::setReuseAddress(bool enable) {
    return isValid() && (setSocketFlag(socket_, SOL_SOCKET, SO_REUSEADDR, enable) ||
                         recordError("SO_REUSEADDR"));
}

bool UdpSocket::setBroadcast(bool enable) {
    return isValid() && (setSocketFlag(socket_, SOL_SOCKET, SO_BROADCAST, enable) ||
                         recordError("SO_BROADCAST"));
}

int UdpSocket::sendTo(const SocketAddress& dest, const void* data, size_t length) {
    sockaddr_in target;
    if (!isValid() || !makeSockaddr(dest.ip, dest.port, target)) {
        return -1;
    }

#ifdef _WIN32
    int sent = ::sendto(socket_, static_cast<const char*>(data), static_cast<int>(length), 0,
                        reinterpret_cast<const sockaddr*>(&target), sizeof(target));
#else
    ssize_t sent = ::sendto(socket_, data, length, 0,
                            reinterpret_cast<const sockaddr*>(&target), sizeof(target));
#endif
    if (sent < 0) {
        recordError("sendto()");
        return -1;
    }
    return static_cast<int>(sent);
}

int UdpSocket::receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                           SocketAddress& sender) {
    if (!isValid()) {
        return -1;
    }

    switch (waitForSocket(socket_, false, timeoutMs)) {
        case 0:
            return 0;
        case -1:
            recordError("select()");
            return -1;
        default:
            break;
    }

    sockaddr_in from{};
    socklen_t fromLength = sizeof(from);
#ifdef _WIN32
    int got = ::recvfrom(socket_, static_cast<char*>(buffer), static_cast<int>(bufferSize), 0,
                         reinterpret_cast<sockaddr*>(&from), &fromLength);
#else
    ssize_t got = ::recvfrom(socket_, buffer, bufferSize, 0,
                             reinterpret_cast<sockaddr*>(&from), &fromLength);
#endif
    if (got < 0) {
        recordError("recvfrom()");
        return -1;
    }

    sender = SocketAddress(addressToString(from), ntohs(from.sin_port));
    return static_cast<int>(got);
}

void UdpSocket::close() {
    if (isValid()) {
        closeSocket(std::exchange(socket_, INVALID_SOCKET_HANDLE));
    }
}

bool UdpSocket::recordError(const char* operation) {
    lastError_ = getLastSocketError();
    LOG_DEBUG("UdpSocket", "{} failed: error {}", operation, lastError_);
    return false;
}

}  // namespace net
}  // namespace cozyd
