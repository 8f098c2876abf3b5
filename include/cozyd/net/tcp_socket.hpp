/**
 * @file tcp_socket.hpp
 * @brief RAII TCP client socket with timeout-bounded operations.
 *
 * The socket is switched to non-blocking mode on creation. connect(),
 * sendAll() and receive() wait with select(), so no call outlives its
 * timeout.
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

/**
 * @enum TcpStatus
 * @brief Outcome of a TCP operation.
 */
enum class TcpStatus {
    OK,
    TIMEOUT,      ///< Deadline passed before the operation completed
    REFUSED,      ///< Peer actively refused the connection
    CLOSED,       ///< Peer closed the connection (orderly or reset)
    ERROR         ///< Any other socket error; see getLastError()
};

inline const char* tcpStatusToString(TcpStatus status) {
    switch (status) {
        case TcpStatus::OK: return "ok";
        case TcpStatus::TIMEOUT: return "timeout";
        case TcpStatus::REFUSED: return "refused";
        case TcpStatus::CLOSED: return "closed";
        case TcpStatus::ERROR: return "error";
        default: return "unknown";
    }
}

/**
 * @class TcpSocket
 * @brief Owning wrapper around one outgoing IPv4 TCP connection.
 *
 * Usage:
 * @code
 * TcpSocket sock;
 * if (sock.connect("192.168.1.20", 5555, 10000) == TcpStatus::OK) {
 *     sock.sendAll(frame.data(), frame.size(), 5000);
 *     char buf[512];
 *     size_t got = 0;
 *     sock.receive(buf, sizeof(buf), 5000, got);
 * }
 * @endcode
 */
class COZYD_NET_API TcpSocket {
public:
    TcpSocket();
    ~TcpSocket();

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;
    TcpSocket(TcpSocket&& other) noexcept;
    TcpSocket& operator=(TcpSocket&& other) noexcept;

    /**
     * @brief True while a connection is established.
     */
    bool isOpen() const { return socket_ != INVALID_SOCKET_HANDLE && connected_; }

    /**
     * @brief Connect to ip:port within the timeout.
     *
     * Any previously open connection is closed first. On failure the
     * descriptor is released before returning.
     */
    TcpStatus connect(const std::string& ip, uint16_t port, int timeoutMs);

    /**
     * @brief Write the whole buffer, waiting up to timeoutMs for space.
     */
    TcpStatus sendAll(const void* data, size_t length, int timeoutMs);

    /**
     * @brief Read whatever is available, waiting up to timeoutMs.
     * @param received Output: number of bytes placed in buffer (> 0 on OK).
     */
    TcpStatus receive(void* buffer, size_t bufferSize, int timeoutMs, size_t& received);

    /**
     * @brief Release the descriptor. Idempotent.
     */
    void close();

    int getLastError() const { return lastError_; }

    const std::string& peerIp() const { return peerIp_; }
    uint16_t peerPort() const { return peerPort_; }

private:
    SocketHandle socket_;
    bool connected_;
    int lastError_;
    std::string peerIp_;
    uint16_t peerPort_;

    TcpStatus classifyError(int error) const;
};

}  // namespace net
}  // namespace cozyd
