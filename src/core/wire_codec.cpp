/**
 * @file wire_codec.cpp
 * @brief WireCodec, FrameBuffer and SequenceGenerator implementation.
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#include "cozyd/core/wire_codec.hpp"
#include "cozyd/utils/logger.hpp"

#include <google/protobuf/util/json_util.h>

#include <chrono>

namespace cozyd {
namespace core {

namespace {

const std::string kDelimiter = "\r\n";

}  // namespace

// =============================================================================
// WireCodec
// =============================================================================

const std::string& WireCodec::delimiter() {
    return kDelimiter;
}

std::string WireCodec::encode(Command cmd, const std::string& sn, const wire::Body& body) {
    wire::Frame frame;
    frame.set_pv(PROTOCOL_VERSION);
    frame.set_cmd(static_cast<int32_t>(cmd));
    frame.set_sn(sn);
    *frame.mutable_msg() = body;

    std::string json;
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = false;
    auto status = google::protobuf::util::MessageToJsonString(frame, &json, options);
    if (!status.ok()) {
        // Only reachable with a Value holding NaN or infinity.
        LOG_ERROR("WireCodec", "Failed to encode {} frame: {}",
                  commandToString(cmd), status.ToString());
        return std::string();
    }

    json += kDelimiter;
    return json;
}

std::string WireCodec::encodeRequest(Command cmd, const std::string& sn,
                                     const DataPoints& payload) {
    wire::Body body;
    switch (cmd) {
        case Command::INFO:
            break;
        case Command::QUERY:
            body.add_attr(0);
            break;
        case Command::SET:
            for (const auto& [id, value] : payload) {
                body.add_attr(id);
                (*body.mutable_data())[id] = value;
            }
            break;
    }
    return encode(cmd, sn, body);
}

bool WireCodec::decode(const std::string& bytes, wire::Frame& frame, std::string* error) {
    if (bytes.size() < kDelimiter.size() ||
        bytes.compare(bytes.size() - kDelimiter.size(), kDelimiter.size(), kDelimiter) != 0) {
        if (error) {
            *error = "missing frame delimiter";
        }
        return false;
    }

    std::string json = bytes.substr(0, bytes.size() - kDelimiter.size());

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    frame.Clear();
    auto status = google::protobuf::util::JsonStringToMessage(json, &frame, options);
    if (!status.ok()) {
        if (error) {
            *error = status.ToString();
        }
        return false;
    }

    if (!frame.has_cmd()) {
        if (error) {
            *error = "frame has no cmd field";
        }
        return false;
    }

    return true;
}

DataPoints WireCodec::dataPoints(const wire::Body& body) {
    DataPoints points;
    for (const auto& [id, value] : body.data()) {
        points[id] = value;
    }
    return points;
}

std::string WireCodec::toJson(const DataPoints& points) {
    wire::Body body;
    for (const auto& [id, value] : points) {
        (*body.mutable_data())[id] = value;
    }

    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(body, &json);
    if (!status.ok()) {
        return "{}";
    }
    return json;
}

// =============================================================================
// FrameBuffer
// =============================================================================

FrameBuffer::FrameBuffer(size_t maxFrameSize)
    : maxFrameSize_(maxFrameSize)
    , overflowed_(false)
{}

void FrameBuffer::append(const char* data, size_t length) {
    if (overflowed_) {
        return;
    }
    buffer_.append(data, length);
}

FrameBuffer::Result FrameBuffer::next(std::string& frame) {
    if (overflowed_) {
        return Result::OVERSIZED;
    }

    size_t pos = buffer_.find(kDelimiter);
    if (pos == std::string::npos) {
        if (buffer_.size() > maxFrameSize_) {
            overflowed_ = true;
            buffer_.clear();
            return Result::OVERSIZED;
        }
        return Result::INCOMPLETE;
    }

    size_t end = pos + kDelimiter.size();
    if (end > maxFrameSize_ + kDelimiter.size()) {
        overflowed_ = true;
        buffer_.clear();
        return Result::OVERSIZED;
    }

    frame.assign(buffer_, 0, end);
    buffer_.erase(0, end);
    return Result::FRAME;
}

void FrameBuffer::clear() {
    buffer_.clear();
    overflowed_ = false;
}

// =============================================================================
// SequenceGenerator
// =============================================================================

SequenceGenerator::SequenceGenerator()
    : next_(static_cast<uint64_t>(
          std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::system_clock::now().time_since_epoch()).count()))
{}

std::string SequenceGenerator::next() {
    return std::to_string(next_.fetch_add(1));
}

}  // namespace core
}  // namespace cozyd
