/**
 * @file ipv4_range.hpp
 * @brief Parsing and enumeration of IPv4 subnet specifications.
 *
 * Accepted forms:
 * - CIDR block:          "192.168.2.0/24"
 * - Explicit range:      "192.168.2.10-192.168.2.40"
 * - Last-octet range:    "192.168.2.10-40"
 * - Single address:      "192.168.2.17"
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#pragma once

#include "cozyd/net/export.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cozyd {
namespace net {

/**
 * @brief Parse a dotted-quad IPv4 address into host byte order.
 * @return True if the text is a valid address.
 */
COZYD_NET_API bool parseIpv4(const std::string& text, uint32_t& address);

/**
 * @brief Format a host-byte-order IPv4 address as dotted quad.
 */
COZYD_NET_API std::string formatIpv4(uint32_t address);

/**
 * @class Ipv4Range
 * @brief Inclusive range of IPv4 host addresses.
 *
 * For CIDR blocks of /30 and wider the network and broadcast addresses are
 * excluded. A /31 yields both addresses, a /32 the single address.
 */
class COZYD_NET_API Ipv4Range {
public:
    Ipv4Range() : first_(0), last_(0), empty_(true) {}

    /**
     * @brief Parse a subnet specification.
     * @param spec Specification in one of the accepted forms.
     * @param out Parsed range on success.
     * @param error Optional: reason for rejection.
     * @return True on success.
     */
    static bool parse(const std::string& spec, Ipv4Range& out,
                      std::string* error = nullptr);

    /**
     * @brief Range holding first..last inclusive (empty if first > last).
     */
    static Ipv4Range fromBounds(uint32_t first, uint32_t last);

    bool empty() const { return empty_; }

    /**
     * @brief Number of host addresses in the range.
     */
    uint64_t hostCount() const {
        return empty_ ? 0 : static_cast<uint64_t>(last_) - first_ + 1;
    }

    /**
     * @brief All host addresses in ascending order.
     */
    std::vector<std::string> hosts() const;

    bool contains(uint32_t address) const {
        return !empty_ && address >= first_ && address <= last_;
    }

    uint32_t first() const { return first_; }
    uint32_t last() const { return last_; }

    /**
     * @brief The original specification text, for logging.
     */
    const std::string& spec() const { return spec_; }

private:
    uint32_t first_;
    uint32_t last_;
    bool empty_;
    std::string spec_;
};

}  // namespace net
}  // namespace cozyd
