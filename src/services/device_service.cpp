/**
 * @file device_service.cpp
 * @brief DeviceServiceImpl implementation.
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#include "cozyd/services/device_service.hpp"
#include "cozyd/utils/logger.hpp"

namespace cozyd {
namespace services {

void fillDeviceInfo(const core::DeviceSession& session, api::DeviceInfo* info) {
    core::DeviceIdentity identity = session.identity();
    info->set_device_id(identity.device_id);
    info->set_type_code(identity.type_code);
    info->set_model_name(identity.model_name);
    info->set_ip_address(session.ip());
    info->set_product_id(identity.product_id);
    info->set_mac(identity.mac);
    info->set_software_version(identity.software_version);
    info->set_hardware_version(identity.hardware_version);
    info->set_available(session.isAvailable());
    for (int32_t id : identity.data_point_ids) {
        info->add_data_point_ids(id);
    }
    auto* state = info->mutable_state();
    for (const auto& [id, value] : session.lastState()) {
        (*state)[id] = value;
    }
}

DeviceServiceImpl::DeviceServiceImpl(std::shared_ptr<core::DeviceRegistry> registry,
                                     std::shared_ptr<core::DiscoveryCoordinator> coordinator,
                                     size_t ioWorkers)
    : registry_(std::move(registry))
    , coordinator_(std::move(coordinator))
{
    if (ioWorkers == 0) {
        ioWorkers = 1;
    }
    for (size_t i = 0; i < ioWorkers; ++i) {
        workers_.emplace_back(&DeviceServiceImpl::workerLoop, this);
    }
    LOG_INFO("DeviceService", "Created device service with {} I/O workers", ioWorkers);
}

DeviceServiceImpl::~DeviceServiceImpl() {
    {
        std::lock_guard<std::mutex> lock(jobMutex_);
        stopping_.store(true);
    }
    jobCv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void DeviceServiceImpl::submit(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(jobMutex_);
        jobs_.push_back(std::move(job));
    }
    jobCv_.notify_one();
}

void DeviceServiceImpl::workerLoop() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(jobMutex_);
            jobCv_.wait(lock, [this] { return stopping_.load() || !jobs_.empty(); });
            // Queued jobs still run during shutdown so every RPC is finished.
            if (jobs_.empty()) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        job();
    }
}

// =============================================================================
// ListDevices
// =============================================================================

class ListDevicesReactor : public grpc::ServerUnaryReactor {
public:
    ListDevicesReactor(std::shared_ptr<core::DeviceRegistry> registry,
                       const api::ListDevicesRequest* request,
                       api::ListDevicesResponse* response)
    {
        auto sessions = request->has_type_code()
            ? registry->findByType(request->type_code())
            : registry->list();

        for (const auto& session : sessions) {
            fillDeviceInfo(*session, response->add_devices());
        }

        LOG_DEBUG("DeviceService", "ListDevices: returning {} devices", sessions.size());
        Finish(grpc::Status::OK);
    }

    void OnDone() override {
        delete this;
    }
};

grpc::ServerUnaryReactor* DeviceServiceImpl::ListDevices(
    grpc::CallbackServerContext* context,
    const api::ListDevicesRequest* request,
    api::ListDevicesResponse* response) {

    return new ListDevicesReactor(registry_, request, response);
}

// =============================================================================
// GetDevice
// =============================================================================

class GetDeviceReactor : public grpc::ServerUnaryReactor {
public:
    GetDeviceReactor(std::shared_ptr<core::DeviceRegistry> registry,
                     const api::GetDeviceRequest* request,
                     api::DeviceInfo* response)
    {
        auto session = registry->find(request->device_id());
        if (!session) {
            Finish(grpc::Status(grpc::StatusCode::NOT_FOUND,
                                "Unknown device: " + request->device_id()));
            return;
        }

        fillDeviceInfo(*session, response);
        Finish(grpc::Status::OK);
    }

    void OnDone() override {
        delete this;
    }
};

grpc::ServerUnaryReactor* DeviceServiceImpl::GetDevice(
    grpc::CallbackServerContext* context,
    const api::GetDeviceRequest* request,
    api::DeviceInfo* response) {

    return new GetDeviceReactor(registry_, request, response);
}

// =============================================================================
// QueryDevice
// =============================================================================

class QueryDeviceReactor : public grpc::ServerUnaryReactor {
public:
    QueryDeviceReactor(DeviceServiceImpl* service,
                       const api::QueryDeviceRequest* request,
                       api::QueryDeviceResponse* response)
    {
        auto session = service->registry().find(request->device_id());
        if (!session) {
            Finish(grpc::Status(grpc::StatusCode::NOT_FOUND,
                                "Unknown device: " + request->device_id()));
            return;
        }
        if (!session->isAvailable()) {
            Finish(grpc::Status(grpc::StatusCode::UNAVAILABLE,
                                "Device is offline: " + request->device_id()));
            return;
        }

        service->submit([this, session, request, response]() {
            auto points = session->query();
            if (!points) {
                LOG_WARN("DeviceService", "QueryDevice {} failed: {}", request->device_id(),
                         core::errorKindToString(session->lastError()));
                Finish(grpc::Status(grpc::StatusCode::UNAVAILABLE,
                                    std::string("Query failed: ") +
                                    core::errorKindToString(session->lastError())));
                return;
            }

            response->set_device_id(request->device_id());
            auto* state = response->mutable_state();
            for (const auto& [id, value] : *points) {
                (*state)[id] = value;
            }
            Finish(grpc::Status::OK);
        });
    }

    void OnDone() override {
        delete this;
    }
};

grpc::ServerUnaryReactor* DeviceServiceImpl::QueryDevice(
    grpc::CallbackServerContext* context,
    const api::QueryDeviceRequest* request,
    api::QueryDeviceResponse* response) {

    return new QueryDeviceReactor(this, request, response);
}

// =============================================================================
// ControlDevice
// =============================================================================

class ControlDeviceReactor : public grpc::ServerUnaryReactor {
public:
    ControlDeviceReactor(DeviceServiceImpl* service,
                         const api::ControlDeviceRequest* request,
                         api::ControlDeviceResponse* response)
    {
        if (request->data().empty()) {
            Finish(grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "No data points given"));
            return;
        }

        auto session = service->registry().find(request->device_id());
        if (!session) {
            Finish(grpc::Status(grpc::StatusCode::NOT_FOUND,
                                "Unknown device: " + request->device_id()));
            return;
        }
        if (!session->isAvailable()) {
            Finish(grpc::Status(grpc::StatusCode::UNAVAILABLE,
                                "Device is offline: " + request->device_id()));
            return;
        }

        core::DataPoints payload;
        for (const auto& [id, value] : request->data()) {
            payload[id] = value;
        }

        LOG_DEBUG("DeviceService", "ControlDevice {}: {}", request->device_id(),
                  core::WireCodec::toJson(payload));

        service->submit([this, session, payload, request, response]() {
            if (!session->control(payload)) {
                LOG_WARN("DeviceService", "ControlDevice {} failed: {}", request->device_id(),
                         core::errorKindToString(session->lastError()));
                Finish(grpc::Status(grpc::StatusCode::UNAVAILABLE,
                                    std::string("Control failed: ") +
                                    core::errorKindToString(session->lastError())));
                return;
            }
            response->set_accepted(true);
            Finish(grpc::Status::OK);
        });
    }

    void OnDone() override {
        delete this;
    }
};

grpc::ServerUnaryReactor* DeviceServiceImpl::ControlDevice(
    grpc::CallbackServerContext* context,
    const api::ControlDeviceRequest* request,
    api::ControlDeviceResponse* response) {

    return new ControlDeviceReactor(this, request, response);
}

// =============================================================================
// Rescan
// =============================================================================

class RescanReactor : public grpc::ServerUnaryReactor {
public:
    RescanReactor(std::shared_ptr<core::DiscoveryCoordinator> coordinator,
                  api::RescanResponse* response)
    {
        bool scheduled = coordinator && coordinator->requestCycle();
        response->set_scheduled(scheduled);
        LOG_INFO("DeviceService", "Rescan requested: {}", scheduled ? "scheduled" : "discovery not running");
        Finish(grpc::Status::OK);
    }

    void OnDone() override {
        delete this;
    }
};

grpc::ServerUnaryReactor* DeviceServiceImpl::Rescan(
    grpc::CallbackServerContext* context,
    const api::RescanRequest* request,
    api::RescanResponse* response) {

    return new RescanReactor(coordinator_, response);
}

}  // namespace services
}  // namespace cozyd
