/**
 * @file device_registry.cpp
 * @brief DeviceRegistry implementation.
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#include "cozyd/core/device_registry.hpp"
#include "cozyd/utils/logger.hpp"

namespace cozyd {
namespace core {

bool DeviceRegistry::add(const SessionPtr& session) {
    if (!session) {
        return false;
    }

    DeviceIdentity identity = session->identity();
    if (!identity.valid()) {
        LOG_WARN("DeviceRegistry", "Rejecting session for {} without identity", session->ip());
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (devices_.count(identity.device_id)) {
        LOG_WARN("DeviceRegistry", "Duplicate device id {} at {} (already at {})",
                 identity.device_id, session->ip(),
                 devices_[identity.device_id].session->ip());
        return false;
    }

    const std::string key = identity.device_id;
    byAddress_[session->ip()] = key;
    devices_[key] = Entry{session, std::move(identity)};
    LOG_INFO("DeviceRegistry", "Added device {} at {}", key, session->ip());
    return true;
}

DeviceRegistry::SessionPtr DeviceRegistry::remove(const std::string& deviceId) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = devices_.find(deviceId);
    if (it == devices_.end()) {
        return nullptr;
    }

    SessionPtr session = it->second.session;
    auto addr = byAddress_.find(session->ip());
    if (addr != byAddress_.end() && addr->second == deviceId) {
        byAddress_.erase(addr);
    }
    devices_.erase(it);

    LOG_INFO("DeviceRegistry", "Removed device {}", deviceId);
    return session;
}

DeviceRegistry::SessionPtr DeviceRegistry::find(const std::string& deviceId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = devices_.find(deviceId);
    return it != devices_.end() ? it->second.session : nullptr;
}

DeviceRegistry::SessionPtr DeviceRegistry::findByAddress(const std::string& ip) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto addr = byAddress_.find(ip);
    if (addr == byAddress_.end()) {
        return nullptr;
    }
    auto it = devices_.find(addr->second);
    return it != devices_.end() ? it->second.session : nullptr;
}

std::string DeviceRegistry::deviceIdForAddress(const std::string& ip) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto addr = byAddress_.find(ip);
    return addr != byAddress_.end() ? addr->second : std::string();
}

std::vector<DeviceRegistry::SessionPtr> DeviceRegistry::list() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<SessionPtr> result;
    result.reserve(devices_.size());
    for (const auto& [id, entry] : devices_) {
        result.push_back(entry.session);
    }
    return result;
}

std::vector<DeviceRegistry::SessionPtr> DeviceRegistry::findByType(int32_t typeCode) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<SessionPtr> result;
    for (const auto& [id, entry] : devices_) {
        if (entry.identity.type_code == typeCode) {
            result.push_back(entry.session);
        }
    }
    return result;
}

size_t DeviceRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_.size();
}

std::vector<DeviceRegistry::SessionPtr> DeviceRegistry::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::vector<SessionPtr> removed;
    removed.reserve(devices_.size());
    for (auto& [id, entry] : devices_) {
        removed.push_back(std::move(entry.session));
    }
    devices_.clear();
    byAddress_.clear();
    return removed;
}

}  // namespace core
}  // namespace cozyd
