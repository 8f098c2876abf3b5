/**
 * @file device_session.hpp
 * @brief One managed TCP connection to one device.
 *
 * A DeviceSession owns the socket to a device, performs the INFO + QUERY
 * handshake, correlates responses by sequence number and tracks
 * availability. Exchanges on one session are strictly serialized; I/O runs
 * on the calling thread and every wait is bounded by a timeout.
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#pragma once

#include "cozyd/core/export.hpp"
#include "cozyd/core/errors.hpp"
#include "cozyd/core/product_catalog.hpp"
#include "cozyd/core/wire_codec.hpp"
#include "cozyd/net/tcp_socket.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cozyd {
namespace core {

/**
 * @struct DeviceIdentity
 * @brief Identity learned from the INFO handshake.
 */
struct COZYD_CORE_API DeviceIdentity {
    std::string device_id;          ///< Vendor-assigned `did`
    int32_t type_code{-1};          ///< 0 = switch, 1 = light
    std::string model_name;
    std::string ip_address;
    std::string product_id;         ///< `pid`
    std::string mac;
    std::string software_version;   ///< `sv`
    std::string hardware_version;   ///< `hv`
    std::vector<int32_t> data_point_ids;

    bool valid() const { return !device_id.empty(); }
};

/**
 * @enum ControlAckPolicy
 * @brief Whether control() waits for a correlated response.
 */
enum class ControlAckPolicy {
    FIRE_AND_FORGET,  ///< A successful write is success
    AWAIT_ACK         ///< Wait for a response with the request's sn
};

inline const char* controlAckPolicyToString(ControlAckPolicy policy) {
    switch (policy) {
        case ControlAckPolicy::FIRE_AND_FORGET: return "fire-and-forget";
        case ControlAckPolicy::AWAIT_ACK: return "await-ack";
        default: return "unknown";
    }
}

/**
 * @struct SessionOptions
 * @brief Timeouts and policies for a session.
 */
struct COZYD_CORE_API SessionOptions {
    uint16_t port{DEVICE_PORT};
    int connect_timeout_ms{10000};
    int read_timeout_ms{5000};
    int read_attempts{3};
    int write_timeout_ms{5000};
    ControlAckPolicy control_ack{ControlAckPolicy::FIRE_AND_FORGET};
    size_t max_frame_size{DEFAULT_MAX_FRAME_SIZE};
};

/**
 * @class DeviceSession
 * @brief Connection and protocol state for a single device.
 *
 * Any I/O failure releases the socket and marks the session unavailable.
 * There is no inline reconnect; the discovery coordinator's health sweep
 * calls connect() again.
 *
 * Usage:
 * @code
 * auto session = std::make_shared<DeviceSession>("192.168.1.20");
 * if (session->connect()) {
 *     DataPoints on;
 *     on[1].set_bool_value(true);
 *     session->control(on);
 * }
 * @endcode
 */
class COZYD_CORE_API DeviceSession {
public:
    /**
     * @param ip Device address.
     * @param options Timeouts and policies.
     * @param catalog Optional product catalog for model and type lookup.
     */
    explicit DeviceSession(std::string ip,
                           SessionOptions options = SessionOptions(),
                           std::shared_ptr<const ProductCatalog> catalog = nullptr);

    ~DeviceSession();

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    /**
     * @brief Connect and handshake using the configured connect timeout.
     */
    bool connect();

    /**
     * @brief Connect within timeoutMs, then run the INFO + QUERY handshake.
     * @return True if the session is now available with a valid identity.
     */
    bool connect(int timeoutMs);

    /**
     * @brief Fetch the current data points.
     * @return The mapping (also stored as last-known state), or nullopt.
     */
    std::optional<DataPoints> query();

    /**
     * @brief Send a SET with the given data points.
     *
     * With FIRE_AND_FORGET the write alone decides success; with AWAIT_ACK a
     * correlated response is required. On success the payload is merged into
     * the last-known state.
     */
    bool control(const DataPoints& payload);

    /**
     * @brief Detect a connection the device closed while the session was idle.
     *
     * Does not wait for a session that is busy with an exchange and sends
     * nothing to the device.
     * @return isAvailable() after the check
     */
    bool checkConnection();

    /**
     * @brief Release the connection. Idempotent.
     */
    void disconnect();

    bool isAvailable() const { return available_.load(); }

    DeviceIdentity identity() const;
    DataPoints lastState() const;
    ErrorKind lastError() const;

    const std::string& ip() const { return ip_; }
    uint16_t port() const { return options_.port; }
    const SessionOptions& options() const { return options_; }

private:
    enum class ReadResult {
        FRAME,
        TIMEOUT,
        MALFORMED,
        OVERSIZED,
        CLOSED
    };

    std::string ip_;
    SessionOptions options_;
    std::shared_ptr<const ProductCatalog> catalog_;

    // Held for the whole of each exchange; guards socket_, frames_, sequence_
    std::mutex ioMutex_;
    net::TcpSocket socket_;
    FrameBuffer frames_;
    SequenceGenerator sequence_;

    mutable std::mutex stateMutex_;
    DeviceIdentity identity_;
    DataPoints lastState_;
    ErrorKind lastError_;

    std::atomic<bool> available_;

    // All *Locked helpers require ioMutex_.
    bool exchangeLocked(Command cmd, const DataPoints& payload,
                        bool awaitResponse, wire::Frame* response);
    ReadResult readFrameLocked(wire::Frame& frame);
    bool drainStaleLocked();
    void releaseLocked();
    void failLocked(ErrorKind kind);

    DeviceIdentity buildIdentity(const wire::Body& info) const;
    void setLastError(ErrorKind kind);
};

}  // namespace core
}  // namespace cozyd
