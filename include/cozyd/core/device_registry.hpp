/**
 * @file device_registry.hpp
 * @brief Thread-safe collection of known device sessions.
 *
 * The DeviceRegistry maps device ids to sessions and keeps a secondary
 * index by IP address. All access is thread-safe using a read-write lock
 * (shared_mutex).
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#pragma once

#include "cozyd/core/export.hpp"
#include "cozyd/core/device_session.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cozyd {
namespace core {

/**
 * @class DeviceRegistry
 * @brief Device id -> session, with no two entries sharing a device id.
 *
 * Usage:
 * @code
 * DeviceRegistry registry;
 * registry.add(session);
 * for (const auto& light : registry.findByType(1)) {
 *     light->query();
 * }
 * @endcode
 */
class COZYD_CORE_API DeviceRegistry {
public:
    using SessionPtr = std::shared_ptr<DeviceSession>;

    DeviceRegistry() = default;
    ~DeviceRegistry() = default;

    // Non-copyable
    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    /**
     * @brief Insert a session under its identity's device id.
     * @return False if the session has no identity or the id is taken.
     */
    bool add(const SessionPtr& session);

    /**
     * @brief Remove the entry for a device id. No-op if absent.
     * @return The removed session, or nullptr.
     */
    SessionPtr remove(const std::string& deviceId);

    SessionPtr find(const std::string& deviceId) const;

    /**
     * @brief Find the session registered for an address.
     */
    SessionPtr findByAddress(const std::string& ip) const;

    /**
     * @brief Device id an address is registered under, or empty.
     */
    std::string deviceIdForAddress(const std::string& ip) const;

    /**
     * @brief Snapshot of all sessions.
     */
    std::vector<SessionPtr> list() const;

    /**
     * @brief Snapshot of sessions whose type code matches.
     */
    std::vector<SessionPtr> findByType(int32_t typeCode) const;

    size_t size() const;

    /**
     * @brief Remove every entry.
     * @return The removed sessions.
     */
    std::vector<SessionPtr> clear();

private:
    struct Entry {
        SessionPtr session;
        DeviceIdentity identity;
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> devices_;
    std::unordered_map<std::string, std::string> byAddress_;
};

}  // namespace core
}  // namespace cozyd
