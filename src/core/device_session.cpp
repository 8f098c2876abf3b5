/**
 * @file device_session.cpp
 * @brief DeviceSession implementation.
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#include "cozyd/core/device_session.hpp"
#include "cozyd/utils/logger.hpp"

#include <chrono>

namespace cozyd {
namespace core {

namespace {

constexpr size_t kReceiveChunk = 1024;

int remainingMs(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

}  // namespace

DeviceSession::DeviceSession(std::string ip,
                             SessionOptions options,
                             std::shared_ptr<const ProductCatalog> catalog)
    : ip_(std::move(ip))
    , options_(options)
    , catalog_(std::move(catalog))
    , frames_(options.max_frame_size)
    , lastError_(ErrorKind::NONE)
    , available_(false)
{
    if (options_.read_attempts < 1) {
        options_.read_attempts = 1;
    }
}

DeviceSession::~DeviceSession() {
    disconnect();
}

// =============================================================================
// Public operations
// =============================================================================

bool DeviceSession::connect() {
    return connect(options_.connect_timeout_ms);
}

bool DeviceSession::connect(int timeoutMs) {
    std::lock_guard<std::mutex> lock(ioMutex_);

    releaseLocked();

    net::TcpStatus status = socket_.connect(ip_, options_.port, timeoutMs);
    if (status != net::TcpStatus::OK) {
        LOG_DEBUG("DeviceSession", "Connect to {}:{} failed: {}",
                  ip_, options_.port, net::tcpStatusToString(status));
        failLocked(ErrorKind::TRANSIENT_NETWORK);
        return false;
    }

    wire::Frame info;
    if (!exchangeLocked(Command::INFO, DataPoints(), true, &info)) {
        LOG_DEBUG("DeviceSession", "INFO handshake with {} failed", ip_);
        return false;
    }

    if (info.msg().did().empty()) {
        LOG_WARN("DeviceSession", "Device at {} sent INFO without a device id", ip_);
        failLocked(ErrorKind::PROTOCOL_DECODE);
        return false;
    }

    DeviceIdentity identity = buildIdentity(info.msg());

    wire::Frame state;
    if (!exchangeLocked(Command::QUERY, DataPoints(), true, &state)) {
        LOG_DEBUG("DeviceSession", "QUERY handshake with {} failed", ip_);
        return false;
    }

    LOG_INFO("DeviceSession", "Connected to {} ({}) at {}",
             identity.device_id, identity.model_name, ip_);

    {
        std::lock_guard<std::mutex> stateLock(stateMutex_);
        identity_ = std::move(identity);
        lastState_ = WireCodec::dataPoints(state.msg());
        lastError_ = ErrorKind::NONE;
    }
    available_.store(true);
    return true;
}

std::optional<DataPoints> DeviceSession::query() {
    std::lock_guard<std::mutex> lock(ioMutex_);

    if (!socket_.isOpen()) {
        setLastError(ErrorKind::NOT_CONNECTED);
        return std::nullopt;
    }

    wire::Frame response;
    if (!exchangeLocked(Command::QUERY, DataPoints(), true, &response)) {
        return std::nullopt;
    }

    DataPoints points = WireCodec::dataPoints(response.msg());
    {
        std::lock_guard<std::mutex> stateLock(stateMutex_);
        lastState_ = points;
        lastError_ = ErrorKind::NONE;
    }
    return points;
}

bool DeviceSession::control(const DataPoints& payload) {
    if (payload.empty()) {
        LOG_WARN("DeviceSession", "Ignoring empty control request for {}", ip_);
        return false;
    }

    std::lock_guard<std::mutex> lock(ioMutex_);

    if (!socket_.isOpen()) {
        setLastError(ErrorKind::NOT_CONNECTED);
        return false;
    }

    bool awaitAck = options_.control_ack == ControlAckPolicy::AWAIT_ACK;
    if (!exchangeLocked(Command::SET, payload, awaitAck, nullptr)) {
        return false;
    }

    std::lock_guard<std::mutex> stateLock(stateMutex_);
    for (const auto& [id, value] : payload) {
        lastState_[id] = value;
    }
    lastError_ = ErrorKind::NONE;
    return true;
}

bool DeviceSession::checkConnection() {
    std::unique_lock<std::mutex> lock(ioMutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return available_.load();
    }
    if (socket_.isOpen()) {
        drainStaleLocked();
    }
    return available_.load();
}

void DeviceSession::disconnect() {
    std::lock_guard<std::mutex> lock(ioMutex_);
    if (socket_.isOpen()) {
        LOG_DEBUG("DeviceSession", "Disconnecting from {}", ip_);
    }
    releaseLocked();
}

DeviceIdentity DeviceSession::identity() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return identity_;
}

DataPoints DeviceSession::lastState() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return lastState_;
}

ErrorKind DeviceSession::lastError() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return lastError_;
}

// =============================================================================
// Exchange protocol
// =============================================================================

bool DeviceSession::exchangeLocked(Command cmd, const DataPoints& payload,
                                   bool awaitResponse, wire::Frame* response) {
    if (!drainStaleLocked()) {
        return false;
    }

    const std::string sn = sequence_.next();
    const std::string bytes = WireCodec::encodeRequest(cmd, sn, payload);
    if (bytes.empty()) {
        failLocked(ErrorKind::PROTOCOL_DECODE);
        return false;
    }

    LOG_TRACE("DeviceSession", "{} -> {}", ip_, bytes.substr(0, bytes.size() - 2));

    net::TcpStatus status = socket_.sendAll(bytes.data(), bytes.size(), options_.write_timeout_ms);
    if (status != net::TcpStatus::OK) {
        LOG_WARN("DeviceSession", "Write of {} to {} failed: {}",
                 commandToString(cmd), ip_, net::tcpStatusToString(status));
        failLocked(ErrorKind::TRANSIENT_NETWORK);
        return false;
    }

    if (!awaitResponse) {
        return true;
    }

    ErrorKind failure = ErrorKind::TRANSIENT_NETWORK;

    for (int attempt = 1; attempt <= options_.read_attempts; ++attempt) {
        wire::Frame frame;
        ReadResult result = readFrameLocked(frame);

        switch (result) {
            case ReadResult::FRAME:
                if (frame.sn() == sn) {
                    if (response) {
                        *response = std::move(frame);
                    }
                    return true;
                }
                LOG_DEBUG("DeviceSession", "Discarding frame from {} with sn {} (expected {})",
                          ip_, frame.sn(), sn);
                failure = ErrorKind::PROTOCOL_DECODE;
                break;

            case ReadResult::TIMEOUT:
                LOG_DEBUG("DeviceSession", "Read timeout from {} on attempt {}/{}",
                          ip_, attempt, options_.read_attempts);
                failure = ErrorKind::TRANSIENT_NETWORK;
                break;

            case ReadResult::MALFORMED:
                failure = ErrorKind::PROTOCOL_DECODE;
                break;

            case ReadResult::OVERSIZED:
                LOG_WARN("DeviceSession", "Frame from {} exceeds {} bytes",
                         ip_, options_.max_frame_size);
                failLocked(ErrorKind::PROTOCOL_DECODE);
                return false;

            case ReadResult::CLOSED:
                LOG_WARN("DeviceSession", "Connection to {} lost during {}",
                         ip_, commandToString(cmd));
                failLocked(ErrorKind::TRANSIENT_NETWORK);
                return false;
        }
    }

    LOG_WARN("DeviceSession", "No valid {} response from {} after {} attempts",
             commandToString(cmd), ip_, options_.read_attempts);
    failLocked(failure);
    return false;
}

DeviceSession::ReadResult DeviceSession::readFrameLocked(wire::Frame& frame) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(options_.read_timeout_ms);
    char buffer[kReceiveChunk];

    while (true) {
        std::string raw;
        FrameBuffer::Result next = frames_.next(raw);

        if (next == FrameBuffer::Result::FRAME) {
            std::string error;
            if (!WireCodec::decode(raw, frame, &error)) {
                LOG_DEBUG("DeviceSession", "Malformed frame from {}: {}", ip_, error);
                return ReadResult::MALFORMED;
            }
            LOG_TRACE("DeviceSession", "{} <- {}", ip_, raw.substr(0, raw.size() - 2));
            return ReadResult::FRAME;
        }
        if (next == FrameBuffer::Result::OVERSIZED) {
            return ReadResult::OVERSIZED;
        }

        int waitMs = remainingMs(deadline);
        if (waitMs == 0) {
            return ReadResult::TIMEOUT;
        }

        size_t received = 0;
        net::TcpStatus status = socket_.receive(buffer, sizeof(buffer), waitMs, received);
        if (status == net::TcpStatus::TIMEOUT) {
            return ReadResult::TIMEOUT;
        }
        if (status != net::TcpStatus::OK) {
            return ReadResult::CLOSED;
        }
        frames_.append(buffer, received);
    }
}

bool DeviceSession::drainStaleLocked() {
    // Responses to earlier fire-and-forget writes are never read; drop them
    // so they do not eat the read attempts of the next request.
    char buffer[kReceiveChunk];
    while (true) {
        size_t received = 0;
        net::TcpStatus status = socket_.receive(buffer, sizeof(buffer), 0, received);
        if (status == net::TcpStatus::TIMEOUT) {
            break;
        }
        if (status != net::TcpStatus::OK) {
            LOG_WARN("DeviceSession", "Connection to {} was closed by the device", ip_);
            failLocked(ErrorKind::TRANSIENT_NETWORK);
            return false;
        }
    }
    frames_.clear();
    return true;
}

// =============================================================================
// Helpers
// =============================================================================

void DeviceSession::releaseLocked() {
    socket_.close();
    frames_.clear();
    available_.store(false);
}

void DeviceSession::failLocked(ErrorKind kind) {
    releaseLocked();
    setLastError(kind);
}

void DeviceSession::setLastError(ErrorKind kind) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    lastError_ = kind;
}

DeviceIdentity DeviceSession::buildIdentity(const wire::Body& info) const {
    DeviceIdentity identity;
    identity.device_id = info.did();
    identity.ip_address = ip_;
    identity.product_id = info.pid();
    identity.mac = info.mac();
    identity.software_version = info.sv();
    identity.hardware_version = info.hv();

    std::optional<ProductInfo> product;
    if (catalog_) {
        product = catalog_->lookup(info.pid());
    }

    if (product) {
        identity.type_code = product->type_code;
        identity.model_name = product->model_name;
        identity.data_point_ids = product->data_point_ids;
    } else {
        if (catalog_ && !catalog_->empty()) {
            LOG_WARN("DeviceSession", "No catalog entry for product {} at {}",
                     info.pid(), ip_);
        }
        identity.type_code = parseTypeCode(info.dtp());
        identity.model_name = info.pid();
    }

    return identity;
}

}  // namespace core
}  // namespace cozyd
