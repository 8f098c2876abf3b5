/**
 * @file udp_socket.hpp
 * @brief RAII UDP socket used for the discovery broadcast.
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#pragma once

#include "cozyd/net/export.hpp"
#include "cozyd/net/platform.hpp"

#include <cstdint>
#include <string>

namespace cozyd {
namespace net {

/// Dotted-quad IPv4 address plus UDP port of a datagram peer.
struct COZYD_NET_API SocketAddress {
    std::string ip;
    uint16_t port;

    SocketAddress() : ip("0.0.0.0"), port(0) {}
    SocketAddress(const std::string& ip_, uint16_t port_) : ip(ip_), port(port_) {}

    std::string toString() const { return ip + ":" + std::to_string(port); }

    bool operator==(const SocketAddress& other) const {
        return ip == other.ip && port == other.port;
    }
};

/**
 * @class UdpSocket
 * @brief Owning wrapper around an IPv4 datagram socket.
 *
 * Receives are bounded with select() so a caller can collect replies for a
 * fixed window without ever blocking past it.
 *
 * @code
 * UdpSocket sock;
 * sock.setBroadcast(true);
 * sock.bind(0);
 * sock.sendTo(SocketAddress("255.255.255.255", 6095), probe.data(), probe.size());
 *
 * char buf[1024];
 * SocketAddress sender;
 * int n = sock.receiveFrom(buf, sizeof(buf), 100, sender);
 * @endcode
 */
class COZYD_NET_API UdpSocket {
public:
    /// Opens the datagram socket; check isValid() before use.
    UdpSocket();

    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }

    SocketHandle handle() const { return socket_; }

    /**
     * @brief Attach the socket to a local endpoint so replies can reach it.
     * @param port Local port; 0 lets the kernel pick an ephemeral one.
     * @param address Local interface address, "0.0.0.0" for all of them.
     */
    bool bind(uint16_t port, const std::string& address = "0.0.0.0");

    /// Port reported by getsockname(), 0 when unbound or closed.
    uint16_t getLocalPort() const;

    /// SO_REUSEADDR; only effective before bind().
    bool setReuseAddress(bool enable);

    /// SO_BROADCAST; required before sending to 255.255.255.255.
    bool setBroadcast(bool enable);

    /// Sends one datagram. Returns the byte count, or -1 when the socket is
    /// closed, @p dest is not an IPv4 address or sendto() fails.
    int sendTo(const SocketAddress& dest, const void* data, size_t length);

    /**
     * @brief Wait up to @p timeoutMs for one datagram.
     *
     * A zero timeout polls, a negative one waits indefinitely. On success
     * @p sender holds the origin of the datagram.
     *
     * @return Bytes copied into @p buffer, 0 when nothing arrived in time,
     *         -1 on socket failure (see getLastError()).
     */
    int receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                    SocketAddress& sender);

    void close();

    int getLastError() const { return lastError_; }

private:
    SocketHandle socket_;
    int lastError_;

    // Stores the socket error for getLastError(); always returns false.
    bool recordError(const char* operation);
};

}  // namespace net
}  // namespace cozyd
