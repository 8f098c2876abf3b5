/**
 * @file broadcast_discoverer.hpp
 * @brief UDP broadcast discovery of devices.
 *
 * Sends the INFO probe to the broadcast address on UDP 6095 and collects
 * the source address of every reply within a bounded window:
 *
 * @code
 * {"pv":0,"cmd":0,"sn":"1636463553873","msg":{}}
 * @endcode
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#pragma once

#include "cozyd/core/export.hpp"
#include "cozyd/core/candidate_source.hpp"
#include "cozyd/core/wire_codec.hpp"

#include <cstdint>
#include <set>
#include <string>

namespace cozyd {
namespace core {

/**
 * @struct BroadcastOptions
 */
struct COZYD_CORE_API BroadcastOptions {
    std::string broadcast_address{"255.255.255.255"};
    uint16_t port{DISCOVERY_PORT};
    int probe_count{3};
    int probe_interval_ms{30};
    int window_ms{2000};
};

/**
 * @class BroadcastDiscoverer
 * @brief Finds devices that answer the UDP discovery probe.
 *
 * Zero replies is an empty result. collect() never blocks longer than the
 * probe sends plus the collection window.
 */
class COZYD_CORE_API BroadcastDiscoverer : public CandidateSource {
public:
    explicit BroadcastDiscoverer(BroadcastOptions options = BroadcastOptions());

    std::set<std::string> collect() override;

    std::string name() const override { return "broadcast"; }

    const BroadcastOptions& options() const { return options_; }

private:
    BroadcastOptions options_;
    SequenceGenerator sequence_;
};

}  // namespace core
}  // namespace cozyd
