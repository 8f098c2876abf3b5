/**
 * @file errors.hpp
 * @brief Error kinds reported by device sessions and discovery.
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#pragma once

#include "cozyd/core/export.hpp"

#include <stdexcept>
#include <string>

namespace cozyd {
namespace core {

/**
 * @enum ErrorKind
 * @brief Classification of the last failed device operation.
 */
enum class ErrorKind {
    NONE,
    TRANSIENT_NETWORK,    ///< Connect timeout/refused, read timeout, reset
    PROTOCOL_DECODE,      ///< Malformed frame, missing delimiter, sn mismatch
    NOT_CONNECTED,        ///< Operation attempted without an open connection
    DUPLICATE_IDENTITY    ///< Another session already holds the device id
};

inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::TRANSIENT_NETWORK: return "transient-network";
        case ErrorKind::PROTOCOL_DECODE: return "protocol-decode";
        case ErrorKind::NOT_CONNECTED: return "not-connected";
        case ErrorKind::DUPLICATE_IDENTITY: return "duplicate-identity";
        default: return "unknown";
    }
}

/**
 * @class ConfigurationError
 * @brief Invalid operator-supplied configuration.
 *
 * Thrown for bad subnet specifications, invalid addresses and out-of-range
 * intervals. The daemon reports it and exits with a non-zero status.
 */
class COZYD_CORE_API ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

}  // namespace core
}  // namespace cozyd
