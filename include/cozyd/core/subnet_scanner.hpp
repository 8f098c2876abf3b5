/**
 * @file subnet_scanner.hpp
 * @brief Active discovery by TCP connect probes over address ranges.
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#pragma once

#include "cozyd/core/export.hpp"
#include "cozyd/core/candidate_source.hpp"
#include "cozyd/core/wire_codec.hpp"
#include "cozyd/net/ipv4_range.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace cozyd {
namespace core {

/// Ranges larger than this are rejected as a configuration error.
constexpr uint64_t MAX_SCAN_HOSTS = 65536;

/**
 * @struct ScanOptions
 */
struct COZYD_CORE_API ScanOptions {
    uint16_t port{DEVICE_PORT};
    int probe_timeout_ms{1000};
    size_t concurrency{64};
};

/**
 * @brief Parse a subnet specification.
 * @throws ConfigurationError if the text is not a valid CIDR block, range
 *         or address, or covers more than MAX_SCAN_HOSTS hosts.
 */
COZYD_CORE_API net::Ipv4Range parseSubnet(const std::string& spec);

/**
 * @class SubnetScanner
 * @brief Probes every host of the configured ranges.
 *
 * A host is a candidate when a TCP connection to the device port succeeds
 * within the probe timeout; the connection is closed immediately. Probes
 * run concurrently, bounded by the concurrency cap.
 *
 * Usage:
 * @code
 * SubnetScanner scanner({"192.168.2.0/24", "10.0.0.5-20"});
 * auto found = scanner.collect();
 * @endcode
 */
class COZYD_CORE_API SubnetScanner : public CandidateSource {
public:
    /**
     * @throws ConfigurationError for an invalid specification.
     */
    explicit SubnetScanner(const std::vector<std::string>& subnets,
                           ScanOptions options = ScanOptions());

    std::set<std::string> collect() override;

    std::string name() const override { return "subnet-scan"; }

    /**
     * @brief Probe the hosts of one range.
     */
    std::set<std::string> scan(const net::Ipv4Range& range) const;

    /**
     * @brief Probe a list of hosts.
     */
    std::set<std::string> probeHosts(const std::vector<std::string>& hosts) const;

    const std::vector<net::Ipv4Range>& ranges() const { return ranges_; }

private:
    std::vector<net::Ipv4Range> ranges_;
    ScanOptions options_;
};

}  // namespace core
}  // namespace cozyd
