/**
 * @file discovery_coordinator.hpp
 * @brief Periodic discovery and reconciliation of the device registry.
 *
 * Each cycle:
 * 1. Collects candidate addresses from the broadcast discoverer, the subnet
 *    scanner and the manual address list.
 * 2. Diffs them against the previous snapshot.
 * 3. Onboards appeared addresses and earlier failures (pending addresses).
 * 4. Retires sessions whose address disappeared from every source.
 * 5. Reconnects registered sessions that are unavailable.
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#pragma once

#include "cozyd/core/export.hpp"
#include "cozyd/core/candidate_source.hpp"
#include "cozyd/core/device_registry.hpp"
#include "cozyd/core/device_session.hpp"
#include "cozyd/core/product_catalog.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace cozyd {
namespace core {

constexpr std::chrono::seconds DEFAULT_SCAN_INTERVAL{300};
constexpr std::chrono::seconds MIN_SCAN_INTERVAL{60};

/**
 * @class DeviceEventListener
 * @brief Receives registry changes made by the coordinator.
 *
 * Callbacks may arrive concurrently from onboarding and health sweep
 * workers and must not block for long.
 */
class DeviceEventListener {
public:
    virtual ~DeviceEventListener() = default;

    virtual void onDeviceAdded(const DeviceIdentity& identity) = 0;
    virtual void onDeviceRemoved(const DeviceIdentity& identity) = 0;
    virtual void onAvailabilityChanged(const DeviceIdentity& identity, bool available) = 0;
};

/**
 * @struct CoordinatorConfig
 */
struct COZYD_CORE_API CoordinatorConfig {
    std::vector<std::string> manual_addresses;
    std::chrono::seconds scan_interval{DEFAULT_SCAN_INTERVAL};
    bool scan_subnets_at_startup{false};
    size_t onboarding_concurrency{16};
    SessionOptions session;
};

/**
 * @struct SnapshotDiff
 */
struct COZYD_CORE_API SnapshotDiff {
    std::set<std::string> appeared;
    std::set<std::string> disappeared;
};

/**
 * @brief appeared = current - previous, disappeared = previous - current.
 */
COZYD_CORE_API SnapshotDiff diffSnapshots(const std::set<std::string>& previous,
                                          const std::set<std::string>& current);

/**
 * @struct CycleReport
 * @brief What one discovery cycle observed and changed.
 */
struct COZYD_CORE_API CycleReport {
    std::set<std::string> snapshot;
    SnapshotDiff diff;
    std::vector<std::string> added;            ///< Device ids onboarded
    std::vector<std::string> removed;          ///< Device ids retired
    std::vector<std::string> restored;         ///< Device ids reconnected
    std::vector<std::string> failed_addresses; ///< Onboarding failures (now pending)
    std::vector<std::string> failed_sources;   ///< Sources that threw (last result reused)
};

/**
 * @class DiscoveryCoordinator
 * @brief Drives discovery cycles and keeps the registry converged.
 *
 * Usage:
 * @code
 * auto registry = std::make_shared<DeviceRegistry>();
 * auto broadcast = std::make_shared<BroadcastDiscoverer>();
 * DiscoveryCoordinator coordinator(registry, config, broadcast, nullptr);
 * coordinator.start();
 * ...
 * coordinator.stop();
 * @endcode
 */
class COZYD_CORE_API DiscoveryCoordinator {
public:
    /**
     * @param registry Registry to reconcile.
     * @param config Manual addresses, interval and session options.
     * @param broadcast Broadcast source (may be null).
     * @param subnets Subnet scan source (may be null).
     * @param catalog Optional product catalog handed to new sessions.
     * @throws ConfigurationError for an interval below the minimum or an
     *         invalid manual address.
     */
    DiscoveryCoordinator(std::shared_ptr<DeviceRegistry> registry,
                         CoordinatorConfig config,
                         std::shared_ptr<CandidateSource> broadcast,
                         std::shared_ptr<CandidateSource> subnets,
                         std::shared_ptr<const ProductCatalog> catalog = nullptr);

    ~DiscoveryCoordinator();

    // Non-copyable
    DiscoveryCoordinator(const DiscoveryCoordinator&) = delete;
    DiscoveryCoordinator& operator=(const DiscoveryCoordinator&) = delete;

    void addListener(std::shared_ptr<DeviceEventListener> listener);

    /**
     * @brief Run one cycle on the calling thread.
     *
     * Blocks while another cycle is in flight; cycles never overlap.
     * @param includeSubnets Whether the subnet scanner takes part.
     */
    CycleReport runCycle(bool includeSubnets = true);

    /**
     * @brief Start the background loop (initial cycle, then every interval).
     */
    void start();

    /**
     * @brief Stop the loop and disconnect every registered session.
     *
     * An in-flight cycle is allowed to finish first. Sessions are
     * disconnected even when start() was never called.
     */
    void stop();

    /**
     * @brief Wake the loop for an early full cycle.
     * @return False if the loop is not running.
     */
    bool requestCycle();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Addresses found by the last completed cycle.
     */
    std::set<std::string> snapshot() const;

    /**
     * @brief Addresses in the snapshot whose onboarding has not succeeded.
     */
    std::set<std::string> pendingAddresses() const;

    uint64_t cycleCount() const { return cycleCount_.load(); }

    const CoordinatorConfig& config() const { return config_; }

private:
    std::shared_ptr<DeviceRegistry> registry_;
    CoordinatorConfig config_;
    std::shared_ptr<CandidateSource> broadcast_;
    std::shared_ptr<CandidateSource> subnets_;
    std::shared_ptr<const ProductCatalog> catalog_;

    std::mutex listenerMutex_;
    std::vector<std::shared_ptr<DeviceEventListener>> listeners_;

    // Serializes cycles
    std::mutex cycleMutex_;

    mutable std::mutex stateMutex_;
    std::set<std::string> previous_;
    std::set<std::string> pending_;
    std::set<std::string> reportedOffline_;
    // Last successful result per source, stands in when the source throws.
    std::map<const CandidateSource*, std::set<std::string>> lastFound_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> cycleCount_{0};
    std::thread loopThread_;
    std::mutex wakeMutex_;
    std::condition_variable wakeCv_;
    bool wakeRequested_{false};

    void runLoop();

    std::set<std::string> collect(bool includeSubnets, CycleReport& report);
    void onboard(const std::set<std::string>& addresses, CycleReport& report);
    void retire(const std::set<std::string>& addresses, CycleReport& report);
    void healthSweep(CycleReport& report);

    std::vector<std::shared_ptr<DeviceEventListener>> listeners();
    void notifyAdded(const DeviceIdentity& identity);
    void notifyRemoved(const DeviceIdentity& identity);
    void notifyAvailability(const DeviceIdentity& identity, bool available);
};

}  // namespace core
}  // namespace cozyd
