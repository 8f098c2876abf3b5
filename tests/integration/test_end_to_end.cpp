/**
 * @file test_end_to_end.cpp
 * @brief Integration test: discovery, onboarding and recovery against mock devices
 */

#include <gtest/gtest.h>
#include <cozyd/utils/logger.hpp>
#include <cozyd/core/device_registry.hpp>
#include <cozyd/core/discovery_coordinator.hpp>
#include <cozyd/core/subnet_scanner.hpp>

#include "mock_device.hpp"

#include <memory>
#include <set>
#include <string>
#include <vector>
#include <thread>
#include <chrono>

using namespace cozyd;
using cozyd::test::MockDevice;
using cozyd::test::MockDeviceOptions;

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::instance().setLevel(utils::LogLevel::DEBUG);
        registry_ = std::make_shared<core::DeviceRegistry>();
    }

    void TearDown() override {
        if (coordinator_) {
            coordinator_->stop();
        }
        for (const auto& session : registry_->clear()) {
            session->disconnect();
        }
        utils::Logger::instance().setLevel(utils::LogLevel::INFO);
    }

    core::CoordinatorConfig configFor(uint16_t port) const {
        core::CoordinatorConfig config;
        config.session.port = port;
        config.session.connect_timeout_ms = 1000;
        config.session.read_timeout_ms = 500;
        return config;
    }

    std::shared_ptr<core::DeviceRegistry> registry_;
    std::unique_ptr<core::DiscoveryCoordinator> coordinator_;
};

TEST_F(EndToEndTest, ManualDeviceIsRegistered) {
    MockDevice device;
    ASSERT_TRUE(device.start());

    core::CoordinatorConfig config = configFor(device.port());
    config.manual_addresses = {"127.0.0.1"};
    coordinator_ = std::make_unique<core::DiscoveryCoordinator>(registry_, config, nullptr, nullptr);

    coordinator_->runCycle();

    ASSERT_EQ(registry_->size(), 1u);
    auto session = registry_->find("X");
    ASSERT_TRUE(session);
    EXPECT_TRUE(session->isAvailable());
    EXPECT_EQ(session->identity().type_code, 1);
    EXPECT_EQ(registry_->findByType(1).size(), 1u);

    // The registered session is usable by the host.
    auto state = session->query();
    ASSERT_TRUE(state.has_value());
    EXPECT_TRUE((*state)[1].bool_value());

    core::DataPoints payload;
    payload[1].set_bool_value(false);
    EXPECT_TRUE(session->control(payload));
    EXPECT_FALSE(session->lastState()[1].bool_value());
}

TEST_F(EndToEndTest, DropAfterHandshakeIsRepairedByNextSweep) {
    MockDevice device;
    ASSERT_TRUE(device.start());
    device.dropAfterNextQuery();

    core::CoordinatorConfig config = configFor(device.port());
    config.manual_addresses = {"127.0.0.1"};
    coordinator_ = std::make_unique<core::DiscoveryCoordinator>(registry_, config, nullptr, nullptr);

    coordinator_->runCycle();
    auto session = registry_->find("X");
    ASSERT_TRUE(session);

    // The device hung up right after answering the handshake.
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    core::CycleReport report = coordinator_->runCycle();
    EXPECT_EQ(report.restored, (std::vector<std::string>{"X"}));
    EXPECT_TRUE(session->isAvailable());
    EXPECT_EQ(registry_->find("X"), session);
    EXPECT_TRUE(session->query().has_value());
}

TEST_F(EndToEndTest, SubnetScanOnboardsOnlyListeningHost) {
    MockDeviceOptions options;
    options.ip = "127.0.0.2";
    options.device_id = "scanned";
    MockDevice device(options);
    ASSERT_TRUE(device.start());

    core::ScanOptions scanOptions;
    scanOptions.port = device.port();
    scanOptions.probe_timeout_ms = 300;
    auto scanner = std::make_shared<core::SubnetScanner>(
        std::vector<std::string>{"127.0.0.1-127.0.0.4"}, scanOptions);

    coordinator_ = std::make_unique<core::DiscoveryCoordinator>(
        registry_, configFor(device.port()), nullptr, scanner);

    core::CycleReport report = coordinator_->runCycle(true);
    EXPECT_EQ(report.snapshot, (std::set<std::string>{"127.0.0.2"}));
    EXPECT_EQ(registry_->size(), 1u);
    EXPECT_EQ(registry_->deviceIdForAddress("127.0.0.2"), "scanned");

    // Leaving subnets out of a cycle makes the scanned address disappear.
    report = coordinator_->runCycle(false);
    EXPECT_EQ(report.removed, (std::vector<std::string>{"scanned"}));
    EXPECT_EQ(registry_->size(), 0u);
}

TEST_F(EndToEndTest, BackgroundLoopKeepsRegistryCurrent) {
    MockDevice device;
    ASSERT_TRUE(device.start());

    core::CoordinatorConfig config = configFor(device.port());
    config.manual_addresses = {"127.0.0.1"};
    coordinator_ = std::make_unique<core::DiscoveryCoordinator>(registry_, config, nullptr, nullptr);
    coordinator_->start();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (registry_->size() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    ASSERT_EQ(registry_->size(), 1u);

    coordinator_->stop();
    EXPECT_FALSE(registry_->find("X")->isAvailable());
}
