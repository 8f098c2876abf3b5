/**
 * @file config.hpp
 * @brief cozyd daemon configuration and CLI parsing
 */

#pragma once

#include "cozyd/core/device_session.hpp"
#include "cozyd/core/discovery_coordinator.hpp"
#include "cozyd/core/errors.hpp"
#include "cozyd/core/subnet_scanner.hpp"
#include "cozyd/net/ipv4_range.hpp"
#include "cozyd/utils/logger.hpp"

#include <cstdint>
#include <cstring>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace cozyd {
namespace daemon {

/**
 * @brief Daemon configuration structure
 */
struct Config {
    std::string lang = "en";
    std::vector<std::string> manual_ips;
    std::vector<std::string> subnets;
    int64_t scan_interval_s = 300;
    bool scan_subnets_at_startup = false;

    // Broadcast discovery
    bool broadcast = true;
    std::string broadcast_addr = "255.255.255.255";
    int broadcast_window_ms = 2000;

    // Subnet probing
    int probe_timeout_ms = 1000;
    size_t probe_concurrency = 64;

    // Device sessions
    int connect_timeout_ms = 10000;
    int read_timeout_ms = 5000;
    int read_attempts = 3;
    std::string control_ack = "fire-and-forget";  ///< "fire-and-forget" or "await-ack"
    size_t onboarding_concurrency = 16;

    std::string catalog_path;   ///< "{lang}" is replaced by the locale

    // Host API
    std::string api_bind = "127.0.0.1";
    uint16_t api_port = 5590;

    std::string log_level = "INFO";
    bool help = false;
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "cozyd - Local IoT device discovery and control daemon\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Discovery Options:\n"
              << "  --ip <addr[,addr...]>       Device address to add manually (repeatable)\n"
              << "  --subnet <spec[,spec...]>   Subnet to probe: CIDR, a.b.c.d-e.f.g.h or a.b.c.d-n (repeatable)\n"
              << "  --scan-interval <s>         Seconds between discovery cycles, minimum 60 (default: 300)\n"
              << "  --scan-subnets-at-startup   Include subnet probing in the initial cycle\n"
              << "  --no-broadcast              Disable UDP broadcast discovery\n"
              << "  --broadcast-addr <addr>     Broadcast address for the probe (default: 255.255.255.255)\n"
              << "  --broadcast-window-ms <ms>  Time to collect broadcast replies (default: 2000)\n"
              << "  --probe-timeout-ms <ms>     Subnet probe connect timeout (default: 1000)\n"
              << "  --probe-concurrency <n>     Concurrent subnet probes (default: 64)\n"
              << "\nDevice Options:\n"
              << "  --connect-timeout-ms <ms>   Device connect timeout (default: 10000)\n"
              << "  --read-timeout-ms <ms>      Per-attempt response timeout (default: 5000)\n"
              << "  --read-attempts <n>         Response read attempts (default: 3)\n"
              << "  --control-ack <policy>      fire-and-forget or await-ack (default: fire-and-forget)\n"
              << "  --onboarding-concurrency <n> Concurrent device handshakes (default: 16)\n"
              << "  --catalog <path>            Product catalog JSON file; {lang} expands to --lang\n"
              << "  --lang <code>               Catalog locale (default: en)\n"
              << "\nAPI Options:\n"
              << "  --api-bind <addr>           Bind address for the gRPC API (default: 127.0.0.1)\n"
              << "  --api-port <port>           gRPC API port (default: 5590)\n"
              << "\n  --log-level <level>         TRACE, DEBUG, INFO, WARN, ERROR, FATAL, OFF (default: INFO)\n"
              << "  --help                      Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " --subnet 192.168.2.0/24 --ip 192.168.1.40\n"
              << "  " << program_name << " --catalog /etc/cozyd/product_list_{lang}.json --lang de\n";
}

namespace detail {

inline void splitList(const char* value, std::vector<std::string>& out) {
    std::string list(value);
    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        if (comma == std::string::npos) {
            comma = list.size();
        }
        std::string item = list.substr(start, comma - start);
        size_t b = item.find_first_not_of(" \t");
        size_t e = item.find_last_not_of(" \t");
        if (b != std::string::npos) {
            out.push_back(item.substr(b, e - b + 1));
        }
        start = comma + 1;
    }
}

inline int64_t parseInteger(const char* option, const char* value, int64_t minValue, int64_t maxValue) {
    size_t used = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &used);
    } catch (const std::exception&) {
        throw core::ConfigurationError(std::string(option) + " expects a number, got '" + value + "'");
    }
    if (used != std::strlen(value)) {
        throw core::ConfigurationError(std::string(option) + " expects a number, got '" + value + "'");
    }
    if (parsed < minValue || parsed > maxValue) {
        throw core::ConfigurationError(std::string(option) + " must be between " +
                                       std::to_string(minValue) + " and " + std::to_string(maxValue));
    }
    return parsed;
}

}  // namespace detail

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration
 * @throws core::ConfigurationError for malformed numeric values
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;
    constexpr int64_t kIntMax = std::numeric_limits<int>::max();

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        // Flags without a value
        if (std::strcmp(arg, "--scan-subnets-at-startup") == 0) {
            config.scan_subnets_at_startup = true;
            continue;
        }
        if (std::strcmp(arg, "--no-broadcast") == 0) {
            config.broadcast = false;
            continue;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            std::cerr << "Error: Option " << arg << " requires a value\n";
            config.help = true;
            return config;
        }

        const char* value = argv[++i];

        if (std::strcmp(arg, "--ip") == 0) {
            detail::splitList(value, config.manual_ips);
        } else if (std::strcmp(arg, "--subnet") == 0) {
            detail::splitList(value, config.subnets);
        } else if (std::strcmp(arg, "--scan-interval") == 0) {
            config.scan_interval_s = detail::parseInteger(arg, value, 0, 86400 * 7);
        } else if (std::strcmp(arg, "--broadcast-addr") == 0) {
            config.broadcast_addr = value;
        } else if (std::strcmp(arg, "--broadcast-window-ms") == 0) {
            config.broadcast_window_ms = static_cast<int>(detail::parseInteger(arg, value, 1, kIntMax));
        } else if (std::strcmp(arg, "--probe-timeout-ms") == 0) {
            config.probe_timeout_ms = static_cast<int>(detail::parseInteger(arg, value, 1, kIntMax));
        } else if (std::strcmp(arg, "--probe-concurrency") == 0) {
            config.probe_concurrency = static_cast<size_t>(detail::parseInteger(arg, value, 1, 1024));
        } else if (std::strcmp(arg, "--connect-timeout-ms") == 0) {
            config.connect_timeout_ms = static_cast<int>(detail::parseInteger(arg, value, 1, kIntMax));
        } else if (std::strcmp(arg, "--read-timeout-ms") == 0) {
            config.read_timeout_ms = static_cast<int>(detail::parseInteger(arg, value, 1, kIntMax));
        } else if (std::strcmp(arg, "--read-attempts") == 0) {
            config.read_attempts = static_cast<int>(detail::parseInteger(arg, value, 1, 100));
        } else if (std::strcmp(arg, "--control-ack") == 0) {
            config.control_ack = value;
        } else if (std::strcmp(arg, "--onboarding-concurrency") == 0) {
            config.onboarding_concurrency = static_cast<size_t>(detail::parseInteger(arg, value, 1, 1024));
        } else if (std::strcmp(arg, "--catalog") == 0) {
            config.catalog_path = value;
        } else if (std::strcmp(arg, "--lang") == 0) {
            config.lang = value;
        } else if (std::strcmp(arg, "--api-bind") == 0) {
            config.api_bind = value;
        } else if (std::strcmp(arg, "--api-port") == 0) {
            config.api_port = static_cast<uint16_t>(detail::parseInteger(arg, value, 1, 65535));
        } else if (std::strcmp(arg, "--log-level") == 0) {
            config.log_level = value;
        } else {
            std::cerr << "Error: Unknown option " << arg << "\n";
            config.help = true;
            return config;
        }
    }

    return config;
}

/**
 * @brief Convert log level string to LogLevel enum
 * @param level_str Log level string
 * @return LogLevel value (defaults to INFO if invalid)
 */
inline utils::LogLevel parseLogLevel(const std::string& level_str) {
    utils::LogLevel level = utils::LogLevel::INFO;
    utils::Logger::levelFromString(level_str, level);
    return level;
}

/**
 * @brief Parse the control acknowledgment policy name.
 * @throws core::ConfigurationError for an unknown name
 */
inline core::ControlAckPolicy parseControlAck(const std::string& name) {
    if (name == "fire-and-forget") return core::ControlAckPolicy::FIRE_AND_FORGET;
    if (name == "await-ack") return core::ControlAckPolicy::AWAIT_ACK;
    throw core::ConfigurationError("unknown control ack policy '" + name + "'");
}

/**
 * @brief Catalog path with "{lang}" replaced by the configured locale.
 */
inline std::string resolveCatalogPath(const Config& config) {
    std::string path = config.catalog_path;
    const std::string placeholder = "{lang}";
    size_t pos = path.find(placeholder);
    if (pos != std::string::npos) {
        path.replace(pos, placeholder.size(), config.lang);
    }
    return path;
}

/**
 * @brief Reject configurations the daemon cannot run with.
 * @throws core::ConfigurationError describing the first problem found
 */
inline void validateConfig(const Config& config) {
    if (config.scan_interval_s < core::MIN_SCAN_INTERVAL.count()) {
        throw core::ConfigurationError("--scan-interval must be at least " +
                                       std::to_string(core::MIN_SCAN_INTERVAL.count()) +
                                       " seconds, got " + std::to_string(config.scan_interval_s));
    }

    uint32_t address = 0;
    for (const auto& ip : config.manual_ips) {
        if (!net::parseIpv4(ip, address)) {
            throw core::ConfigurationError("invalid device address '" + ip + "'");
        }
    }

    for (const auto& subnet : config.subnets) {
        core::parseSubnet(subnet);
    }

    if (config.broadcast && !net::parseIpv4(config.broadcast_addr, address)) {
        throw core::ConfigurationError("invalid broadcast address '" + config.broadcast_addr + "'");
    }

    parseControlAck(config.control_ack);

    utils::LogLevel level;
    if (!utils::Logger::levelFromString(config.log_level, level)) {
        throw core::ConfigurationError("unknown log level '" + config.log_level + "'");
    }

    if (!config.broadcast && config.manual_ips.empty() && config.subnets.empty()) {
        throw core::ConfigurationError("no discovery source: broadcast is disabled and no --ip or --subnet was given");
    }
}

/**
 * @brief Session options derived from the configuration.
 */
inline core::SessionOptions toSessionOptions(const Config& config) {
    core::SessionOptions options;
    options.connect_timeout_ms = config.connect_timeout_ms;
    options.read_timeout_ms = config.read_timeout_ms;
    options.read_attempts = config.read_attempts;
    options.control_ack = parseControlAck(config.control_ack);
    return options;
}

/**
 * @brief Coordinator settings derived from the configuration.
 */
inline core::CoordinatorConfig toCoordinatorConfig(const Config& config) {
    core::CoordinatorConfig coordinator;
    coordinator.manual_addresses = config.manual_ips;
    coordinator.scan_interval = std::chrono::seconds(config.scan_interval_s);
    coordinator.scan_subnets_at_startup = config.scan_subnets_at_startup;
    coordinator.onboarding_concurrency = config.onboarding_concurrency;
    coordinator.session = toSessionOptions(config);
    return coordinator;
}

} // namespace daemon
} // namespace cozyd
