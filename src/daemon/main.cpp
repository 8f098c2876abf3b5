/**
 * @file main.cpp
 * @brief cozyd daemon entry point
 *
 * This is the thin executable that wires together all the library components:
 * - Broadcast discoverer and subnet scanner as discovery sources
 * - Discovery coordinator maintaining the device registry
 * - Device service exposing the registry over gRPC
 */

#include <cozyd/daemon/config.hpp>
#include <cozyd/utils/logger.hpp>
#include <cozyd/core/broadcast_discoverer.hpp>
#include <cozyd/core/device_registry.hpp>
#include <cozyd/core/discovery_coordinator.hpp>
#include <cozyd/core/product_catalog.hpp>
#include <cozyd/core/subnet_scanner.hpp>
#include <cozyd/net/platform.hpp>
#include <cozyd/services/device_service.hpp>

#include <grpcpp/grpcpp.h>
#include <grpcpp/server_builder.h>

#include <csignal>
#include <atomic>
#include <memory>
#include <thread>
#include <chrono>

using namespace cozyd;
using namespace cozyd::daemon;

// Global shutdown flag
static std::atomic<bool> g_shutdown{false};

// Signal handler; only touches the atomic flag
void signalHandler(int) {
    g_shutdown.store(true);
}

namespace {

/**
 * @brief Logs registry changes for operators.
 */
class EventLogger : public core::DeviceEventListener {
public:
    void onDeviceAdded(const core::DeviceIdentity& identity) override {
        LOG_INFO("Daemon", "Device added: {} type={} model={} at {}",
                 identity.device_id, identity.type_code, identity.model_name, identity.ip_address);
    }

    void onDeviceRemoved(const core::DeviceIdentity& identity) override {
        LOG_INFO("Daemon", "Device removed: {} at {}", identity.device_id, identity.ip_address);
    }

    void onAvailabilityChanged(const core::DeviceIdentity& identity, bool available) override {
        LOG_INFO("Daemon", "Device {} is now {}", identity.device_id,
                 available ? "available" : "unavailable");
    }
};

}  // namespace

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = parseArgs(argc, argv);
        if (config.help) {
            printUsage(argv[0]);
            return 0;
        }
        validateConfig(config);
    } catch (const core::ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    // Configure logging
    utils::Logger::instance().setLevel(parseLogLevel(config.log_level));

    LOG_INFO("Daemon", "cozyd starting...");
    LOG_INFO("Daemon", "Manual addresses: {}, subnets: {}, scan interval: {}s",
             config.manual_ips.size(), config.subnets.size(), config.scan_interval_s);
    LOG_INFO("Daemon", "Broadcast: {}", config.broadcast ? config.broadcast_addr : "disabled");
    LOG_INFO("Daemon", "Control ack policy: {}", config.control_ack);

    // Install signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    net::SocketInitializer sockets;

    try {
        // Optional product catalog
        std::shared_ptr<core::ProductCatalog> catalog;
        if (!config.catalog_path.empty()) {
            catalog = std::make_shared<core::ProductCatalog>();
            std::string path = resolveCatalogPath(config);
            if (!catalog->loadFromFile(path)) {
                LOG_WARN("Daemon", "Continuing without product catalog");
                catalog.reset();
            }
        }

        auto registry = std::make_shared<core::DeviceRegistry>();

        std::shared_ptr<core::BroadcastDiscoverer> broadcast;
        if (config.broadcast) {
            core::BroadcastOptions options;
            options.broadcast_address = config.broadcast_addr;
            options.window_ms = config.broadcast_window_ms;
            broadcast = std::make_shared<core::BroadcastDiscoverer>(options);
        }

        std::shared_ptr<core::SubnetScanner> scanner;
        if (!config.subnets.empty()) {
            core::ScanOptions options;
            options.probe_timeout_ms = config.probe_timeout_ms;
            options.concurrency = config.probe_concurrency;
            scanner = std::make_shared<core::SubnetScanner>(config.subnets, options);
        }

        auto coordinator = std::make_shared<core::DiscoveryCoordinator>(
            registry, toCoordinatorConfig(config), broadcast, scanner, catalog);
        coordinator->addListener(std::make_shared<EventLogger>());

        // Create device service
        auto device_service = std::make_unique<services::DeviceServiceImpl>(registry, coordinator);

        // Build and start API server
        std::string api_addr = config.api_bind + ":" + std::to_string(config.api_port);
        grpc::ServerBuilder builder;
        builder.AddListeningPort(api_addr, grpc::InsecureServerCredentials());
        builder.RegisterService(device_service.get());
        auto server = builder.BuildAndStart();

        if (!server) {
            LOG_ERROR("Daemon", "Failed to start API server on {}", api_addr);
            return 1;
        }
        LOG_INFO("Daemon", "API server listening on {}", api_addr);

        coordinator->start();
        LOG_INFO("Daemon", "cozyd is ready");

        // Main loop - wait for shutdown signal
        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        // Graceful shutdown
        LOG_INFO("Daemon", "Shutting down...");

        auto deadline = std::chrono::system_clock::now() + std::chrono::seconds(5);
        server->Shutdown(deadline);

        coordinator->stop();

        LOG_INFO("Daemon", "cozyd stopped");
        return 0;

    } catch (const core::ConfigurationError& e) {
        LOG_ERROR("Daemon", "Configuration error: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        LOG_ERROR("Daemon", "Fatal error: {}", e.what());
        return 1;
    }
}
