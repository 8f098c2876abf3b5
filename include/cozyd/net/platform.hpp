/**
 * @file platform.hpp
 * @brief Socket type definitions shared by the UDP and TCP wrappers.
 *
 * Hides the differences between Winsock2 and POSIX sockets that matter
 * for non-blocking I/O: handle type, close call, error code lookup and
 * the "operation in progress" test after a non-blocking connect.
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#pragma once

#include <cstdint>
#include <string>

#ifdef _WIN32
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <WinSock2.h>
    #include <WS2tcpip.h>

    #pragma comment(lib, "Ws2_32.lib")

    namespace cozyd {
    namespace net {
        using SocketHandle = SOCKET;
        constexpr SocketHandle INVALID_SOCKET_HANDLE = INVALID_SOCKET;

        inline int getLastSocketError() { return WSAGetLastError(); }
        inline void closeSocket(SocketHandle s) { ::closesocket(s); }

        inline bool setNonBlocking(SocketHandle s, bool enable) {
            u_long mode = enable ? 1 : 0;
            return ::ioctlsocket(s, FIONBIO, &mode) == 0;
        }

        inline bool isInProgress(int error) {
            return error == WSAEWOULDBLOCK || error == WSAEINPROGRESS;
        }

        inline bool initializeSockets() {
            WSADATA wsaData;
            return WSAStartup(MAKEWORD(2, 2), &wsaData) == 0;
        }

        inline void cleanupSockets() {
            WSACleanup();
        }
    }  // namespace net
    }  // namespace cozyd

#else
    #include <arpa/inet.h>
    #include <errno.h>
    #include <fcntl.h>
    #include <netinet/in.h>
    #include <netinet/tcp.h>
    #include <sys/select.h>
    #include <sys/socket.h>
    #include <sys/types.h>
    #include <unistd.h>

    namespace cozyd {
    namespace net {
        using SocketHandle = int;
        constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;

        inline int getLastSocketError() { return errno; }
        inline void closeSocket(SocketHandle s) { ::close(s); }

        inline bool setNonBlocking(SocketHandle s, bool enable) {
            int flags = ::fcntl(s, F_GETFL, 0);
            if (flags < 0) {
                return false;
            }
            flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
            return ::fcntl(s, F_SETFL, flags) == 0;
        }

        inline bool isInProgress(int error) {
            return error == EINPROGRESS || error == EWOULDBLOCK || error == EAGAIN;
        }

        inline bool initializeSockets() { return true; }
        inline void cleanupSockets() {}
    }  // namespace net
    }  // namespace cozyd

#endif

namespace cozyd {
namespace net {

/**
 * @brief RAII helper for socket initialization.
 *
 * Create one instance at program startup (a no-op on POSIX).
 */
class SocketInitializer {
public:
    SocketInitializer() : initialized_(initializeSockets()) {}
    ~SocketInitializer() { if (initialized_) cleanupSockets(); }

    bool isInitialized() const { return initialized_; }

    SocketInitializer(const SocketInitializer&) = delete;
    SocketInitializer& operator=(const SocketInitializer&) = delete;

private:
    bool initialized_;
};

/**
 * @brief Fill an IPv4 socket address from dotted-quad text.
 * @return False when @p ip is not a valid IPv4 address.
 */
inline bool makeSockaddr(const std::string& ip, uint16_t port, sockaddr_in& out) {
    out = sockaddr_in{};
    out.sin_family = AF_INET;
    out.sin_port = htons(port);
    return inet_pton(AF_INET, ip.c_str(), &out.sin_addr) == 1;
}

inline std::string addressToString(const sockaddr_in& addr) {
    char text[INET_ADDRSTRLEN] = {};
    if (inet_ntop(AF_INET, &addr.sin_addr, text, sizeof(text)) == nullptr) {
        return std::string();
    }
    return text;
}

/**
 * @brief Set a boolean socket option.
 */
inline bool setSocketFlag(SocketHandle s, int level, int option, bool enable) {
    int value = enable ? 1 : 0;
    return setsockopt(s, level, option, reinterpret_cast<const char*>(&value), sizeof(value)) == 0;
}

/**
 * @brief Wait until a socket is readable or writable.
 * @param s Socket to wait on.
 * @param forWrite Wait for writability instead of readability.
 * @param timeoutMs Timeout in milliseconds (negative waits forever).
 * @return 1 when ready, 0 on timeout, -1 on error.
 */
inline int waitForSocket(SocketHandle s, bool forWrite, int timeoutMs) {
    fd_set set;
    FD_ZERO(&set);
    FD_SET(s, &set);

    struct timeval tv;
    struct timeval* tvp = nullptr;
    if (timeoutMs >= 0) {
        tv.tv_sec = timeoutMs / 1000;
        tv.tv_usec = (timeoutMs % 1000) * 1000;
        tvp = &tv;
    }

#ifdef _WIN32
    int result = ::select(0, forWrite ? nullptr : &set, forWrite ? &set : nullptr,
                          nullptr, tvp);
#else
    int result;
    do {
        result = ::select(s + 1, forWrite ? nullptr : &set, forWrite ? &set : nullptr,
                          nullptr, tvp);
    } while (result < 0 && errno == EINTR);
#endif
    return result < 0 ? -1 : (result == 0 ? 0 : 1);
}

}  // namespace net
}  // namespace cozyd
