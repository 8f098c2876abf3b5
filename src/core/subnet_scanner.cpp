/**
 * @file subnet_scanner.cpp
 * @brief SubnetScanner implementation.
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#include "cozyd/core/subnet_scanner.hpp"
#include "cozyd/core/errors.hpp"
#include "cozyd/net/tcp_socket.hpp"
#include "cozyd/utils/logger.hpp"
#include "cozyd/utils/parallel.hpp"

#include <mutex>

namespace cozyd {
namespace core {

net::Ipv4Range parseSubnet(const std::string& spec) {
    net::Ipv4Range range;
    std::string error;
    if (!net::Ipv4Range::parse(spec, range, &error)) {
        throw ConfigurationError("invalid subnet '" + spec + "': " + error);
    }
    if (range.hostCount() > MAX_SCAN_HOSTS) {
        throw ConfigurationError("subnet '" + spec + "' has " +
                                 std::to_string(range.hostCount()) +
                                 " hosts; the limit is " + std::to_string(MAX_SCAN_HOSTS));
    }
    return range;
}

SubnetScanner::SubnetScanner(const std::vector<std::string>& subnets, ScanOptions options)
    : options_(options)
{
    for (const auto& spec : subnets) {
        ranges_.push_back(parseSubnet(spec));
    }
    if (options_.concurrency == 0) {
        options_.concurrency = 1;
    }
}

std::set<std::string> SubnetScanner::collect() {
    std::set<std::string> unique;
    for (const auto& range : ranges_) {
        auto hosts = range.hosts();
        unique.insert(hosts.begin(), hosts.end());
    }

    std::vector<std::string> hosts(unique.begin(), unique.end());
    LOG_INFO("SubnetScanner", "Scanning {} host(s) across {} range(s)",
             hosts.size(), ranges_.size());

    auto found = probeHosts(hosts);
    LOG_INFO("SubnetScanner", "Subnet scan found {} device(s)", found.size());
    return found;
}

std::set<std::string> SubnetScanner::scan(const net::Ipv4Range& range) const {
    LOG_DEBUG("SubnetScanner", "Scanning {} ({} hosts)", range.spec(), range.hostCount());
    return probeHosts(range.hosts());
}

std::set<std::string> SubnetScanner::probeHosts(const std::vector<std::string>& hosts) const {
    std::set<std::string> found;
    std::mutex foundMutex;

    utils::parallelForEach(hosts, options_.concurrency, [&](const std::string& ip) {
        net::TcpSocket probe;
        if (probe.connect(ip, options_.port, options_.probe_timeout_ms) == net::TcpStatus::OK) {
            probe.close();
            LOG_DEBUG("SubnetScanner", "Device port open at {}", ip);
            std::lock_guard<std::mutex> lock(foundMutex);
            found.insert(ip);
        }
    });

    return found;
}

}  // namespace core
}  // namespace cozyd
