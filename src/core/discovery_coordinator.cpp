/**
 * @file discovery_coordinator.cpp
 * @brief DiscoveryCoordinator implementation.
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#include "cozyd/core/discovery_coordinator.hpp"
#include "cozyd/core/errors.hpp"
#include "cozyd/net/ipv4_range.hpp"
#include "cozyd/utils/logger.hpp"
#include "cozyd/utils/parallel.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <stdexcept>

namespace cozyd {
namespace core {

SnapshotDiff diffSnapshots(const std::set<std::string>& previous,
                           const std::set<std::string>& current) {
    SnapshotDiff diff;
    std::set_difference(current.begin(), current.end(),
                        previous.begin(), previous.end(),
                        std::inserter(diff.appeared, diff.appeared.end()));
    std::set_difference(previous.begin(), previous.end(),
                        current.begin(), current.end(),
                        std::inserter(diff.disappeared, diff.disappeared.end()));
    return diff;
}

DiscoveryCoordinator::DiscoveryCoordinator(std::shared_ptr<DeviceRegistry> registry,
                                           CoordinatorConfig config,
                                           std::shared_ptr<CandidateSource> broadcast,
                                           std::shared_ptr<CandidateSource> subnets,
                                           std::shared_ptr<const ProductCatalog> catalog)
    : registry_(std::move(registry))
    , config_(std::move(config))
    , broadcast_(std::move(broadcast))
    , subnets_(std::move(subnets))
    , catalog_(std::move(catalog))
{
    if (!registry_) {
        throw std::invalid_argument("DiscoveryCoordinator requires a registry");
    }
    if (config_.scan_interval < MIN_SCAN_INTERVAL) {
        throw ConfigurationError("scan interval " + std::to_string(config_.scan_interval.count()) +
                                 "s is below the minimum of " +
                                 std::to_string(MIN_SCAN_INTERVAL.count()) + "s");
    }
    for (const auto& ip : config_.manual_addresses) {
        uint32_t address = 0;
        if (!net::parseIpv4(ip, address)) {
            throw ConfigurationError("invalid device address '" + ip + "'");
        }
    }
    if (config_.onboarding_concurrency == 0) {
        config_.onboarding_concurrency = 1;
    }
}

DiscoveryCoordinator::~DiscoveryCoordinator() {
    stop();
}

void DiscoveryCoordinator::addListener(std::shared_ptr<DeviceEventListener> listener) {
    if (!listener) {
        return;
    }
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listeners_.push_back(std::move(listener));
}

// =============================================================================
// Cycle
// =============================================================================

CycleReport DiscoveryCoordinator::runCycle(bool includeSubnets) {
    std::lock_guard<std::mutex> cycleLock(cycleMutex_);

    CycleReport report;
    auto started = std::chrono::steady_clock::now();

    report.snapshot = collect(includeSubnets, report);

    std::set<std::string> toOnboard;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        report.diff = diffSnapshots(previous_, report.snapshot);

        // Pending addresses only stay pending while some source still sees them.
        for (auto it = pending_.begin(); it != pending_.end(); ) {
            if (report.snapshot.count(*it)) {
                toOnboard.insert(*it);
                ++it;
            } else {
                it = pending_.erase(it);
            }
        }
    }
    toOnboard.insert(report.diff.appeared.begin(), report.diff.appeared.end());

    onboard(toOnboard, report);
    retire(report.diff.disappeared, report);
    healthSweep(report);

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        previous_ = report.snapshot;
    }
    cycleCount_.fetch_add(1);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    LOG_INFO("DiscoveryCoordinator",
             "Cycle done in {}ms: {} address(es), +{} -{} restored {}, {} device(s) registered",
             elapsed, report.snapshot.size(), report.added.size(), report.removed.size(),
             report.restored.size(), registry_->size());
    return report;
}

std::set<std::string> DiscoveryCoordinator::collect(bool includeSubnets, CycleReport& report) {
    std::vector<std::shared_ptr<CandidateSource>> sources;
    if (broadcast_) {
        sources.push_back(broadcast_);
    }
    if (includeSubnets && subnets_) {
        sources.push_back(subnets_);
    }

    std::set<std::string> snapshot(config_.manual_addresses.begin(),
                                   config_.manual_addresses.end());
    std::mutex snapshotMutex;

    utils::parallelForEach(sources, sources.size(),
        [&](const std::shared_ptr<CandidateSource>& source) {
            std::set<std::string> found;
            try {
                found = source->collect();
            } catch (const std::exception& e) {
                // A failed source confirms nothing, so what it last saw stays.
                {
                    std::lock_guard<std::mutex> lock(stateMutex_);
                    auto last = lastFound_.find(source.get());
                    if (last != lastFound_.end()) {
                        found = last->second;
                    }
                }
                LOG_WARN("DiscoveryCoordinator", "Source {} failed: {} (keeping {} address(es))",
                         source->name(), e.what(), found.size());
                std::lock_guard<std::mutex> lock(snapshotMutex);
                report.failed_sources.push_back(source->name());
                snapshot.insert(found.begin(), found.end());
                return;
            }
            LOG_DEBUG("DiscoveryCoordinator", "Source {} returned {} address(es)",
                      source->name(), found.size());
            {
                std::lock_guard<std::mutex> lock(stateMutex_);
                lastFound_[source.get()] = found;
            }
            std::lock_guard<std::mutex> lock(snapshotMutex);
            snapshot.insert(found.begin(), found.end());
        });

    return snapshot;
}

void DiscoveryCoordinator::onboard(const std::set<std::string>& addresses, CycleReport& report) {
    std::mutex reportMutex;

    utils::parallelForEach(addresses, config_.onboarding_concurrency, [&](const std::string& ip) {
        if (registry_->findByAddress(ip)) {
            std::lock_guard<std::mutex> lock(stateMutex_);
            pending_.erase(ip);
            return;
        }

        auto session = std::make_shared<DeviceSession>(ip, config_.session, catalog_);
        ErrorKind failure = ErrorKind::NONE;
        if (!session->connect()) {
            failure = session->lastError();
        } else if (!registry_->add(session)) {
            session->disconnect();
            failure = ErrorKind::DUPLICATE_IDENTITY;
        }

        if (failure != ErrorKind::NONE) {
            LOG_DEBUG("DiscoveryCoordinator", "Onboarding {} failed ({}), will retry",
                      ip, errorKindToString(failure));
            {
                std::lock_guard<std::mutex> lock(stateMutex_);
                pending_.insert(ip);
            }
            std::lock_guard<std::mutex> lock(reportMutex);
            report.failed_addresses.push_back(ip);
            return;
        }

        DeviceIdentity identity = session->identity();
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            pending_.erase(ip);
        }
        {
            std::lock_guard<std::mutex> lock(reportMutex);
            report.added.push_back(identity.device_id);
        }
        notifyAdded(identity);
    });
}

void DiscoveryCoordinator::retire(const std::set<std::string>& addresses, CycleReport& report) {
    for (const auto& ip : addresses) {
        std::string deviceId = registry_->deviceIdForAddress(ip);
        if (deviceId.empty()) {
            continue;
        }

        auto session = registry_->remove(deviceId);
        if (!session) {
            continue;
        }

        DeviceIdentity identity = session->identity();
        session->disconnect();
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            reportedOffline_.erase(deviceId);
        }

        LOG_INFO("DiscoveryCoordinator", "Device {} at {} is gone", deviceId, ip);
        report.removed.push_back(deviceId);
        notifyRemoved(identity);
    }
}

void DiscoveryCoordinator::healthSweep(CycleReport& report) {
    std::vector<DeviceRegistry::SessionPtr> offline;
    for (const auto& session : registry_->list()) {
        if (!session->checkConnection()) {
            offline.push_back(session);
        }
    }

    if (offline.empty()) {
        return;
    }

    LOG_DEBUG("DiscoveryCoordinator", "Health sweep: {} unavailable session(s)", offline.size());
    std::mutex reportMutex;

    utils::parallelForEach(offline, config_.onboarding_concurrency,
        [&](const DeviceRegistry::SessionPtr& session) {
            const std::string registeredId = registry_->deviceIdForAddress(session->ip());
            const DeviceIdentity previous = session->identity();

            if (!session->connect()) {
                bool firstFailure = false;
                {
                    std::lock_guard<std::mutex> lock(stateMutex_);
                    firstFailure = reportedOffline_.insert(previous.device_id).second;
                }
                if (firstFailure) {
                    LOG_WARN("DiscoveryCoordinator", "Device {} at {} is unavailable",
                             previous.device_id, session->ip());
                    notifyAvailability(previous, false);
                }
                return;
            }

            DeviceIdentity current = session->identity();
            if (!registeredId.empty() && current.device_id != registeredId) {
                LOG_WARN("DiscoveryCoordinator", "Address {} now answers as {} instead of {}",
                         session->ip(), current.device_id, registeredId);
                registry_->remove(registeredId);
                session->disconnect();
                {
                    std::lock_guard<std::mutex> lock(stateMutex_);
                    reportedOffline_.erase(registeredId);
                    pending_.insert(session->ip());
                }
                {
                    std::lock_guard<std::mutex> lock(reportMutex);
                    report.removed.push_back(registeredId);
                }
                notifyRemoved(previous);
                return;
            }

            {
                std::lock_guard<std::mutex> lock(stateMutex_);
                reportedOffline_.erase(current.device_id);
            }
            {
                std::lock_guard<std::mutex> lock(reportMutex);
                report.restored.push_back(current.device_id);
            }
            LOG_INFO("DiscoveryCoordinator", "Device {} at {} is available again",
                     current.device_id, session->ip());
            notifyAvailability(current, true);
        });
}

// =============================================================================
// Loop
// =============================================================================

void DiscoveryCoordinator::start() {
    if (running_.exchange(true)) {
        return;
    }

    LOG_INFO("DiscoveryCoordinator", "Starting discovery: interval {}s, {} manual address(es)",
             config_.scan_interval.count(), config_.manual_addresses.size());
    loopThread_ = std::thread(&DiscoveryCoordinator::runLoop, this);
}

void DiscoveryCoordinator::stop() {
    if (running_.exchange(false)) {
        {
            std::lock_guard<std::mutex> lock(wakeMutex_);
            wakeRequested_ = true;
        }
        wakeCv_.notify_all();
    }

    if (loopThread_.joinable()) {
        loopThread_.join();
    }

    // Sessions opened by runCycle() alone are closed here too.

    for (const auto& session : registry_->list()) {
        session->disconnect();
    }

    LOG_INFO("DiscoveryCoordinator", "Discovery stopped");
}

bool DiscoveryCoordinator::requestCycle() {
    if (!running_.load()) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        wakeRequested_ = true;
    }
    wakeCv_.notify_all();
    return true;
}

void DiscoveryCoordinator::runLoop() {
    bool initial = true;

    while (running_.load()) {
        runCycle(initial ? config_.scan_subnets_at_startup : true);
        initial = false;

        std::unique_lock<std::mutex> lock(wakeMutex_);
        wakeCv_.wait_for(lock, config_.scan_interval, [this] {
            return wakeRequested_ || !running_.load();
        });
        wakeRequested_ = false;
    }
}

std::set<std::string> DiscoveryCoordinator::snapshot() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return previous_;
}

std::set<std::string> DiscoveryCoordinator::pendingAddresses() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return pending_;
}

// =============================================================================
// Events
// =============================================================================

std::vector<std::shared_ptr<DeviceEventListener>> DiscoveryCoordinator::listeners() {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    return listeners_;
}

void DiscoveryCoordinator::notifyAdded(const DeviceIdentity& identity) {
    for (const auto& listener : listeners()) {
        listener->onDeviceAdded(identity);
    }
}

void DiscoveryCoordinator::notifyRemoved(const DeviceIdentity& identity) {
    for (const auto& listener : listeners()) {
        listener->onDeviceRemoved(identity);
    }
}

void DiscoveryCoordinator::notifyAvailability(const DeviceIdentity& identity, bool available) {
    for (const auto& listener : listeners()) {
        listener->onAvailabilityChanged(identity, available);
    }
}

}  // namespace core
}  // namespace cozyd
