/**
 * @file device_service.hpp
 * @brief Async gRPC host API over the device registry.
 *
 * DeviceService is the API integration layers use:
 * - ListDevices / GetDevice: Registry snapshots
 * - QueryDevice: Fresh state from a device
 * - ControlDevice: Send data points to a device
 * - Rescan: Ask the coordinator for an early discovery cycle
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#pragma once

#include "cozyd/services/export.hpp"
#include "cozyd/core/device_registry.hpp"
#include "cozyd/core/discovery_coordinator.hpp"

#include <grpcpp/grpcpp.h>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

// Include generated gRPC service base
#include "cozyd/proto/device_service.grpc.pb.h"

namespace cozyd {
namespace services {

/**
 * @brief Fill an API descriptor from a session.
 */
COZYD_SERVICES_API void fillDeviceInfo(const core::DeviceSession& session, api::DeviceInfo* info);

/**
 * @class DeviceServiceImpl
 * @brief Implementation of the DeviceService gRPC service.
 *
 * Registry lookups are answered on the gRPC callback thread. Device I/O
 * (QueryDevice, ControlDevice) blocks for up to the session timeouts, so
 * it is handed to a small pool of worker threads which finish the RPC.
 *
 * Usage:
 * @code
 * auto registry = std::make_shared<DeviceRegistry>();
 * DeviceServiceImpl service(registry, coordinator);
 *
 * grpc::ServerBuilder builder;
 * builder.AddListeningPort("127.0.0.1:5590", grpc::InsecureServerCredentials());
 * builder.RegisterService(&service);
 * auto server = builder.BuildAndStart();
 * @endcode
 */
class COZYD_SERVICES_API DeviceServiceImpl final : public api::DeviceService::CallbackService {
public:
    /**
     * @brief Create device service implementation.
     * @param registry Shared device registry.
     * @param coordinator Coordinator for Rescan (may be null).
     * @param ioWorkers Threads available for blocking device I/O.
     */
    DeviceServiceImpl(std::shared_ptr<core::DeviceRegistry> registry,
                      std::shared_ptr<core::DiscoveryCoordinator> coordinator,
                      size_t ioWorkers = 4);

    ~DeviceServiceImpl() override;

    // =========================================================================
    // gRPC Service Methods (Async Callback API)
    // =========================================================================

    grpc::ServerUnaryReactor* ListDevices(
        grpc::CallbackServerContext* context,
        const api::ListDevicesRequest* request,
        api::ListDevicesResponse* response) override;

    grpc::ServerUnaryReactor* GetDevice(
        grpc::CallbackServerContext* context,
        const api::GetDeviceRequest* request,
        api::DeviceInfo* response) override;

    /**
     * @brief Handle QueryDevice RPC.
     * NOT_FOUND for an unknown id, UNAVAILABLE when the exchange fails.
     */
    grpc::ServerUnaryReactor* QueryDevice(
        grpc::CallbackServerContext* context,
        const api::QueryDeviceRequest* request,
        api::QueryDeviceResponse* response) override;

    /**
     * @brief Handle ControlDevice RPC.
     * INVALID_ARGUMENT for an empty payload, otherwise as QueryDevice.
     */
    grpc::ServerUnaryReactor* ControlDevice(
        grpc::CallbackServerContext* context,
        const api::ControlDeviceRequest* request,
        api::ControlDeviceResponse* response) override;

    grpc::ServerUnaryReactor* Rescan(
        grpc::CallbackServerContext* context,
        const api::RescanRequest* request,
        api::RescanResponse* response) override;

    /**
     * @brief Queue blocking work for the I/O workers.
     */
    void submit(std::function<void()> job);

    core::DeviceRegistry& registry() { return *registry_; }

private:
    std::shared_ptr<core::DeviceRegistry> registry_;
    std::shared_ptr<core::DiscoveryCoordinator> coordinator_;

    std::mutex jobMutex_;
    std::condition_variable jobCv_;
    std::deque<std::function<void()>> jobs_;
    std::atomic<bool> stopping_{false};
    std::vector<std::thread> workers_;

    void workerLoop();
};

}  // namespace services
}  // namespace cozyd
