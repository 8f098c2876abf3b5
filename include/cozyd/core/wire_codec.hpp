/**
 * @file wire_codec.hpp
 * @brief Encoding and decoding of the device JSON frame protocol.
 *
 * A frame is one compact JSON document terminated by "\r\n":
 * @code
 * {"pv":0,"cmd":2,"sn":"1636463553873","msg":{"attr":[0]}}\r\n
 * @endcode
 *
 * The frame schema is the cozyd.wire.Frame protobuf message. JSON
 * conversion goes through protobuf's JSON mapping, so unknown keys sent by
 * newer firmware are ignored on input.
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#pragma once

#include "cozyd/core/export.hpp"

#include "cozyd/proto/device_frame.pb.h"

#include <google/protobuf/struct.pb.h>

#include <atomic>
#include <cstdint>
#include <map>
#include <string>

namespace cozyd {
namespace core {

/// TCP port devices listen on.
constexpr uint16_t DEVICE_PORT = 5555;

/// UDP port devices answer discovery probes on.
constexpr uint16_t DISCOVERY_PORT = 6095;

/// Protocol version carried in every frame.
constexpr int32_t PROTOCOL_VERSION = 0;

/// Default upper bound for a single frame on the stream.
constexpr size_t DEFAULT_MAX_FRAME_SIZE = 16 * 1024;

/**
 * @enum Command
 * @brief Command codes of the device protocol.
 */
enum class Command : int32_t {
    INFO = 0,   ///< Identity request, body {}
    QUERY = 2,  ///< State request, body {"attr":[0]}
    SET = 3     ///< State change, body {"attr":[ids],"data":{...}}
};

inline const char* commandToString(Command cmd) {
    switch (cmd) {
        case Command::INFO: return "INFO";
        case Command::QUERY: return "QUERY";
        case Command::SET: return "SET";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Data-point id to value.
 */
using DataPoints = std::map<int32_t, google::protobuf::Value>;

/**
 * @class WireCodec
 * @brief Stateless frame encoder/decoder.
 */
class COZYD_CORE_API WireCodec {
public:
    /**
     * @brief Encode a frame.
     * @param cmd Command code.
     * @param sn Sequence number (decimal string).
     * @param body Message body.
     * @return JSON bytes including the trailing delimiter.
     */
    static std::string encode(Command cmd, const std::string& sn, const wire::Body& body);

    /**
     * @brief Encode the request body a command uses.
     *
     * INFO ignores the payload, QUERY asks for all attributes, SET carries
     * the payload ids in `attr` and the values in `data`.
     */
    static std::string encodeRequest(Command cmd, const std::string& sn,
                                     const DataPoints& payload = {});

    /**
     * @brief Decode one frame.
     * @param bytes Frame bytes, which must end with the delimiter.
     * @param frame Output frame.
     * @param error Optional: reason for a decode failure.
     * @return True on success.
     */
    static bool decode(const std::string& bytes, wire::Frame& frame,
                       std::string* error = nullptr);

    /**
     * @brief Extract the data-point mapping of a body.
     */
    static DataPoints dataPoints(const wire::Body& body);

    /**
     * @brief Render a data-point mapping as a JSON object (for logs and tests).
     */
    static std::string toJson(const DataPoints& points);

    static const std::string& delimiter();
};

/**
 * @class FrameBuffer
 * @brief Accumulates stream bytes and splits them into frames.
 *
 * A frame that grows past the size bound without a delimiter puts the
 * buffer into the overflow state; the stream cannot be resynchronized and
 * the connection must be dropped.
 */
class COZYD_CORE_API FrameBuffer {
public:
    enum class Result {
        FRAME,        ///< A complete frame was extracted
        INCOMPLETE,   ///< More bytes are needed
        OVERSIZED      ///< Bound exceeded without a delimiter
    };

    explicit FrameBuffer(size_t maxFrameSize = DEFAULT_MAX_FRAME_SIZE);

    void append(const char* data, size_t length);

    /**
     * @brief Extract the next complete frame, delimiter included.
     */
    Result next(std::string& frame);

    void clear();

    size_t buffered() const { return buffer_.size(); }

private:
    size_t maxFrameSize_;
    std::string buffer_;
    bool overflowed_;
};

/**
 * @class SequenceGenerator
 * @brief Monotonic sequence numbers seeded from wall-clock milliseconds.
 */
class COZYD_CORE_API SequenceGenerator {
public:
    SequenceGenerator();
    explicit SequenceGenerator(uint64_t seed) : next_(seed) {}

    /**
     * @brief Next sequence number as a decimal string.
     */
    std::string next();

private:
    std::atomic<uint64_t> next_;
};

}  // namespace core
}  // namespace cozyd
