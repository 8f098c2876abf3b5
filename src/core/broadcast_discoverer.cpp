/**
 * @file broadcast_discoverer.cpp
 * @brief BroadcastDiscoverer implementation.
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#include "cozyd/core/broadcast_discoverer.hpp"
#include "cozyd/net/udp_socket.hpp"
#include "cozyd/utils/logger.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

namespace cozyd {
namespace core {

BroadcastDiscoverer::BroadcastDiscoverer(BroadcastOptions options)
    : options_(std::move(options))
{}

std::set<std::string> BroadcastDiscoverer::collect() {
    net::UdpSocket socket;
    if (!socket.isValid()) {
        throw std::runtime_error("cannot create UDP socket: error " +
                                 std::to_string(socket.getLastError()));
    }

    if (!socket.setReuseAddress(true)) {
        LOG_DEBUG("BroadcastDiscoverer", "SO_REUSEADDR unavailable: error {}", socket.getLastError());
    }
    if (!socket.setBroadcast(true)) {
        throw std::runtime_error("cannot enable broadcast: error " +
                                 std::to_string(socket.getLastError()));
    }
    if (!socket.bind(0)) {
        throw std::runtime_error("cannot bind UDP socket: error " +
                                 std::to_string(socket.getLastError()));
    }

    // The probe is the INFO request without the trailing delimiter.
    std::string probe = WireCodec::encodeRequest(Command::INFO, sequence_.next());
    probe.resize(probe.size() - WireCodec::delimiter().size());

    net::SocketAddress dest{options_.broadcast_address, options_.port};

    int sent = 0;
    for (int i = 0; i < options_.probe_count; ++i) {
        if (i > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(options_.probe_interval_ms));
        }
        if (socket.sendTo(dest, probe.data(), probe.size()) > 0) {
            ++sent;
        } else {
            LOG_WARN("BroadcastDiscoverer", "Probe to {}:{} failed: error {}",
                     dest.ip, dest.port, socket.getLastError());
        }
    }

    if (sent == 0) {
        throw std::runtime_error("no discovery probe could be sent to " + dest.toString());
    }

    std::set<std::string> found;
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(options_.window_ms);
    char buffer[1024];

    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) {
            break;
        }

        net::SocketAddress sender;
        int received = socket.receiveFrom(buffer, sizeof(buffer), static_cast<int>(left), sender);
        if (received < 0) {
            LOG_WARN("BroadcastDiscoverer", "Receive failed: error {}", socket.getLastError());
            break;
        }
        if (received == 0) {
            continue;
        }

        if (found.insert(sender.ip).second) {
            LOG_DEBUG("BroadcastDiscoverer", "Reply from {}", sender.ip);
        }
    }

    LOG_INFO("BroadcastDiscoverer", "Broadcast discovery found {} device(s)", found.size());
    return found;
}

}  // namespace core
}  // namespace cozyd
