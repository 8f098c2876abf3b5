/**
 * @file test_discovery_coordinator.cpp
 * @brief Unit tests for the discovery cycle and device lifecycle
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cozyd/core/discovery_coordinator.hpp>

#include "mock_device.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace cozyd::core;
using cozyd::test::MockDevice;
using cozyd::test::MockDeviceOptions;
using ::testing::_;
using ::testing::Field;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StrictMock;
using ::testing::Throw;
using ::testing::UnorderedElementsAre;

namespace {

class MockCandidateSource : public CandidateSource {
public:
    MOCK_METHOD(std::set<std::string>, collect, (), (override));
    MOCK_METHOD(std::string, name, (), (const, override));
};

class MockListener : public DeviceEventListener {
public:
    MOCK_METHOD(void, onDeviceAdded, (const DeviceIdentity&), (override));
    MOCK_METHOD(void, onDeviceRemoved, (const DeviceIdentity&), (override));
    MOCK_METHOD(void, onAvailabilityChanged, (const DeviceIdentity&, bool), (override));
};

auto hasId(const std::string& id) {
    return Field(&DeviceIdentity::device_id, id);
}

bool waitFor(const std::function<bool()>& condition, int timeoutMs = 3000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return condition();
}

}  // namespace

class DiscoveryCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = std::make_shared<DeviceRegistry>();
        broadcast_ = std::make_shared<NiceMock<MockCandidateSource>>();
        subnets_ = std::make_shared<NiceMock<MockCandidateSource>>();
        listener_ = std::make_shared<NiceMock<MockListener>>();
        ON_CALL(*broadcast_, name()).WillByDefault(Return("broadcast"));
        ON_CALL(*subnets_, name()).WillByDefault(Return("subnet-scan"));

        // All mock devices share one port on different loopback addresses.
        startDevice("127.0.0.1", "a");
    }

    void TearDown() override {
        if (coordinator_) {
            coordinator_->stop();
        }
        for (const auto& session : registry_->clear()) {
            session->disconnect();
        }
        for (auto& device : devices_) {
            device->stop();
        }
    }

    MockDevice& startDevice(const std::string& ip, const std::string& id) {
        MockDeviceOptions options;
        options.ip = ip;
        options.port = port_;
        options.device_id = id;
        devices_.push_back(std::make_unique<MockDevice>(options));
        EXPECT_TRUE(devices_.back()->start()) << "mock device on " << ip;
        port_ = devices_.back()->port();
        return *devices_.back();
    }

    CoordinatorConfig fastConfig() const {
        CoordinatorConfig config;
        config.session.port = port_;
        config.session.connect_timeout_ms = 500;
        config.session.read_timeout_ms = 200;
        config.onboarding_concurrency = 4;
        return config;
    }

    void makeCoordinator(CoordinatorConfig config) {
        coordinator_ = std::make_unique<DiscoveryCoordinator>(registry_, config, broadcast_, subnets_);
        coordinator_->addListener(listener_);
    }

    void makeCoordinator() { makeCoordinator(fastConfig()); }

    void makeUnavailable(const std::string& id) {
        auto session = registry_->find(id);
        ASSERT_TRUE(session);
        for (auto& device : devices_) {
            if (device->ip() == session->ip()) {
                device->dropConnection();
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        EXPECT_FALSE(session->query().has_value());
        EXPECT_FALSE(session->isAvailable());
    }

    uint16_t port_ = 0;
    std::vector<std::unique_ptr<MockDevice>> devices_;
    std::shared_ptr<DeviceRegistry> registry_;
    std::shared_ptr<NiceMock<MockCandidateSource>> broadcast_;
    std::shared_ptr<NiceMock<MockCandidateSource>> subnets_;
    std::shared_ptr<NiceMock<MockListener>> listener_;
    std::unique_ptr<DiscoveryCoordinator> coordinator_;
};

// =============================================================================
// Snapshot diff
// =============================================================================

TEST(SnapshotDiffTest, AppearedAndDisappeared) {
    SnapshotDiff diff = diffSnapshots({"A", "B", "C"}, {"B", "C", "D"});
    EXPECT_EQ(diff.appeared, (std::set<std::string>{"D"}));
    EXPECT_EQ(diff.disappeared, (std::set<std::string>{"A"}));
}

TEST(SnapshotDiffTest, IdenticalSnapshots) {
    SnapshotDiff diff = diffSnapshots({"A", "B"}, {"A", "B"});
    EXPECT_TRUE(diff.appeared.empty());
    EXPECT_TRUE(diff.disappeared.empty());
}

// =============================================================================
// Construction
// =============================================================================

TEST_F(DiscoveryCoordinatorTest, RejectsShortInterval) {
    CoordinatorConfig config = fastConfig();
    config.scan_interval = std::chrono::seconds(59);
    EXPECT_THROW(DiscoveryCoordinator(registry_, config, broadcast_, subnets_), ConfigurationError);

    config.scan_interval = MIN_SCAN_INTERVAL;
    EXPECT_NO_THROW(DiscoveryCoordinator(registry_, config, broadcast_, subnets_));
}

TEST_F(DiscoveryCoordinatorTest, RejectsInvalidManualAddress) {
    CoordinatorConfig config = fastConfig();
    config.manual_addresses = {"192.168.1.256"};
    EXPECT_THROW(DiscoveryCoordinator(registry_, config, broadcast_, subnets_), ConfigurationError);
}

TEST_F(DiscoveryCoordinatorTest, RequiresRegistry) {
    EXPECT_THROW(DiscoveryCoordinator(nullptr, fastConfig(), broadcast_, subnets_),
                 std::invalid_argument);
}

// =============================================================================
// Cycles
// =============================================================================

TEST_F(DiscoveryCoordinatorTest, OnboardsDiscoveredDevices) {
    startDevice("127.0.0.2", "b");
    makeCoordinator();

    ON_CALL(*broadcast_, collect())
        .WillByDefault(Return(std::set<std::string>{"127.0.0.1", "127.0.0.2"}));
    EXPECT_CALL(*listener_, onDeviceAdded(hasId("a")));
    EXPECT_CALL(*listener_, onDeviceAdded(hasId("b")));

    CycleReport report = coordinator_->runCycle();

    EXPECT_THAT(report.added, UnorderedElementsAre("a", "b"));
    EXPECT_EQ(registry_->size(), 2u);
    EXPECT_TRUE(registry_->find("a")->isAvailable());
    EXPECT_EQ(coordinator_->snapshot(), (std::set<std::string>{"127.0.0.1", "127.0.0.2"}));
    EXPECT_EQ(coordinator_->cycleCount(), 1u);
}

TEST_F(DiscoveryCoordinatorTest, UnchangedSnapshotIsIdempotent) {
    makeCoordinator();
    ON_CALL(*broadcast_, collect()).WillByDefault(Return(std::set<std::string>{"127.0.0.1"}));
    EXPECT_CALL(*listener_, onDeviceAdded(_)).Times(1);
    EXPECT_CALL(*listener_, onDeviceRemoved(_)).Times(0);

    coordinator_->runCycle();
    auto session = registry_->find("a");

    CycleReport second = coordinator_->runCycle();
    EXPECT_TRUE(second.added.empty());
    EXPECT_TRUE(second.removed.empty());
    EXPECT_TRUE(second.diff.appeared.empty());
    EXPECT_EQ(registry_->find("a"), session);
    EXPECT_EQ(devices_[0]->connections(), 1);
}

TEST_F(DiscoveryCoordinatorTest, RetiresDisappearedAddress) {
    startDevice("127.0.0.2", "b");
    makeCoordinator();

    EXPECT_CALL(*broadcast_, collect())
        .WillOnce(Return(std::set<std::string>{"127.0.0.1", "127.0.0.2"}))
        .WillOnce(Return(std::set<std::string>{"127.0.0.1"}));
    EXPECT_CALL(*listener_, onDeviceRemoved(hasId("b")));

    coordinator_->runCycle();
    auto b = registry_->find("b");
    ASSERT_TRUE(b);

    CycleReport report = coordinator_->runCycle();
    EXPECT_EQ(report.removed, (std::vector<std::string>{"b"}));
    EXPECT_EQ(report.diff.disappeared, (std::set<std::string>{"127.0.0.2"}));
    EXPECT_EQ(registry_->find("b"), nullptr);
    EXPECT_FALSE(b->isAvailable());
    EXPECT_EQ(registry_->size(), 1u);
}

TEST_F(DiscoveryCoordinatorTest, ManualAddressesAlwaysIncluded) {
    CoordinatorConfig config = fastConfig();
    config.manual_addresses = {"127.0.0.1"};
    coordinator_ = std::make_unique<DiscoveryCoordinator>(registry_, config, nullptr, nullptr);

    CycleReport report = coordinator_->runCycle();
    EXPECT_EQ(report.snapshot, (std::set<std::string>{"127.0.0.1"}));
    EXPECT_EQ(report.added, (std::vector<std::string>{"a"}));
}

TEST_F(DiscoveryCoordinatorTest, FailingSourceIsSkipped) {
    makeCoordinator();
    EXPECT_CALL(*broadcast_, collect()).WillOnce(Throw(std::runtime_error("no network")));
    EXPECT_CALL(*subnets_, collect()).WillOnce(Return(std::set<std::string>{"127.0.0.1"}));

    CycleReport report = coordinator_->runCycle();
    EXPECT_EQ(report.failed_sources, (std::vector<std::string>{"broadcast"}));
    EXPECT_EQ(report.added, (std::vector<std::string>{"a"}));
}

TEST_F(DiscoveryCoordinatorTest, FailingSourceKeepsItsDevices) {
    makeCoordinator();
    EXPECT_CALL(*broadcast_, collect())
        .WillOnce(Return(std::set<std::string>{"127.0.0.1"}))
        .WillOnce(Throw(std::runtime_error("interface down")))
        .WillOnce(Return(std::set<std::string>{}));
    EXPECT_CALL(*listener_, onDeviceAdded(hasId("a"))).Times(1);
    EXPECT_CALL(*listener_, onDeviceRemoved(hasId("a"))).Times(1);

    coordinator_->runCycle(false);
    ASSERT_TRUE(registry_->find("a"));

    CycleReport failed = coordinator_->runCycle(false);
    EXPECT_EQ(failed.failed_sources, (std::vector<std::string>{"broadcast"}));
    EXPECT_EQ(failed.snapshot, (std::set<std::string>{"127.0.0.1"}));
    EXPECT_TRUE(failed.diff.disappeared.empty());
    EXPECT_TRUE(failed.removed.empty());
    EXPECT_TRUE(registry_->find("a"));

    // A successful empty answer does confirm the device is gone.
    CycleReport gone = coordinator_->runCycle(false);
    EXPECT_EQ(gone.removed, (std::vector<std::string>{"a"}));
    EXPECT_EQ(registry_->size(), 0u);
}

TEST_F(DiscoveryCoordinatorTest, SubnetsCanBeLeftOut) {
    makeCoordinator();
    EXPECT_CALL(*broadcast_, collect()).WillOnce(Return(std::set<std::string>{}));
    EXPECT_CALL(*subnets_, collect()).Times(0);

    CycleReport report = coordinator_->runCycle(false);
    EXPECT_TRUE(report.snapshot.empty());
}

TEST_F(DiscoveryCoordinatorTest, FailedOnboardingIsRetried) {
    makeCoordinator();
    ON_CALL(*broadcast_, collect()).WillByDefault(Return(std::set<std::string>{"127.0.0.3"}));

    CycleReport first = coordinator_->runCycle();
    EXPECT_EQ(first.failed_addresses, (std::vector<std::string>{"127.0.0.3"}));
    EXPECT_EQ(coordinator_->pendingAddresses(), (std::set<std::string>{"127.0.0.3"}));
    EXPECT_EQ(registry_->size(), 0u);

    startDevice("127.0.0.3", "c");
    CycleReport second = coordinator_->runCycle();
    EXPECT_EQ(second.added, (std::vector<std::string>{"c"}));
    EXPECT_TRUE(coordinator_->pendingAddresses().empty());
}

TEST_F(DiscoveryCoordinatorTest, PendingAddressDroppedWhenGone) {
    makeCoordinator();
    EXPECT_CALL(*broadcast_, collect())
        .WillOnce(Return(std::set<std::string>{"127.0.0.3"}))
        .WillOnce(Return(std::set<std::string>{}));

    coordinator_->runCycle();
    EXPECT_EQ(coordinator_->pendingAddresses().size(), 1u);

    coordinator_->runCycle();
    EXPECT_TRUE(coordinator_->pendingAddresses().empty());
}

TEST_F(DiscoveryCoordinatorTest, DuplicateIdentityRejected) {
    startDevice("127.0.0.2", "a");
    makeCoordinator();
    ON_CALL(*broadcast_, collect())
        .WillByDefault(Return(std::set<std::string>{"127.0.0.1", "127.0.0.2"}));
    EXPECT_CALL(*listener_, onDeviceAdded(hasId("a"))).Times(1);

    CycleReport report = coordinator_->runCycle();
    EXPECT_EQ(report.added.size(), 1u);
    EXPECT_EQ(report.failed_addresses.size(), 1u);
    EXPECT_EQ(registry_->size(), 1u);
}

// =============================================================================
// Health sweep
// =============================================================================

TEST_F(DiscoveryCoordinatorTest, HealthSweepRestoresAvailability) {
    makeCoordinator();
    ON_CALL(*broadcast_, collect()).WillByDefault(Return(std::set<std::string>{"127.0.0.1"}));

    coordinator_->runCycle();
    makeUnavailable("a");

    EXPECT_CALL(*listener_, onAvailabilityChanged(hasId("a"), true));
    CycleReport report = coordinator_->runCycle();

    EXPECT_EQ(report.restored, (std::vector<std::string>{"a"}));
    EXPECT_TRUE(registry_->find("a")->isAvailable());
}

TEST_F(DiscoveryCoordinatorTest, HealthSweepNoticesIdleDrop) {
    makeCoordinator();
    ON_CALL(*broadcast_, collect()).WillByDefault(Return(std::set<std::string>{"127.0.0.1"}));

    devices_[0]->dropAfterNextQuery();
    coordinator_->runCycle();
    ASSERT_TRUE(registry_->find("a"));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    CycleReport report = coordinator_->runCycle();
    EXPECT_EQ(report.restored, (std::vector<std::string>{"a"}));
    EXPECT_TRUE(registry_->find("a")->isAvailable());
    EXPECT_EQ(devices_[0]->connections(), 2);
}

TEST_F(DiscoveryCoordinatorTest, OfflineReportedOnce) {
    makeCoordinator();
    ON_CALL(*broadcast_, collect()).WillByDefault(Return(std::set<std::string>{"127.0.0.1"}));

    coordinator_->runCycle();
    devices_[0]->stop();
    makeUnavailable("a");

    {
        ::testing::InSequence sequence;
        EXPECT_CALL(*listener_, onAvailabilityChanged(hasId("a"), false)).Times(1);
        EXPECT_CALL(*listener_, onAvailabilityChanged(hasId("a"), true)).Times(1);
    }

    coordinator_->runCycle();
    coordinator_->runCycle();
    EXPECT_EQ(registry_->size(), 1u);

    startDevice("127.0.0.1", "a");
    CycleReport report = coordinator_->runCycle();
    EXPECT_EQ(report.restored, (std::vector<std::string>{"a"}));
}

TEST_F(DiscoveryCoordinatorTest, ReconnectWithDifferentIdentity) {
    makeCoordinator();
    ON_CALL(*broadcast_, collect()).WillByDefault(Return(std::set<std::string>{"127.0.0.1"}));

    coordinator_->runCycle();
    makeUnavailable("a");
    devices_[0]->setDeviceId("z");

    EXPECT_CALL(*listener_, onDeviceRemoved(hasId("a")));
    CycleReport swept = coordinator_->runCycle();
    EXPECT_EQ(swept.removed, (std::vector<std::string>{"a"}));
    EXPECT_EQ(registry_->find("a"), nullptr);
    EXPECT_EQ(coordinator_->pendingAddresses(), (std::set<std::string>{"127.0.0.1"}));

    EXPECT_CALL(*listener_, onDeviceAdded(hasId("z")));
    CycleReport onboarded = coordinator_->runCycle();
    EXPECT_EQ(onboarded.added, (std::vector<std::string>{"z"}));
    EXPECT_TRUE(registry_->find("z")->isAvailable());
}

// =============================================================================
// Background loop
// =============================================================================

TEST_F(DiscoveryCoordinatorTest, StartRequestCycleStop) {
    makeCoordinator();
    ON_CALL(*broadcast_, collect()).WillByDefault(Return(std::set<std::string>{"127.0.0.1"}));

    EXPECT_FALSE(coordinator_->requestCycle());

    coordinator_->start();
    EXPECT_TRUE(coordinator_->isRunning());
    ASSERT_TRUE(waitFor([this] { return coordinator_->cycleCount() >= 1; }));
    EXPECT_TRUE(registry_->find("a") != nullptr);

    EXPECT_TRUE(coordinator_->requestCycle());
    ASSERT_TRUE(waitFor([this] { return coordinator_->cycleCount() >= 2; }));

    auto session = registry_->find("a");
    coordinator_->stop();
    EXPECT_FALSE(coordinator_->isRunning());
    EXPECT_FALSE(coordinator_->requestCycle());
    EXPECT_FALSE(session->isAvailable());
}

TEST_F(DiscoveryCoordinatorTest, StopWithoutStartDisconnectsSessions) {
    makeCoordinator();
    ON_CALL(*broadcast_, collect()).WillByDefault(Return(std::set<std::string>{"127.0.0.1"}));

    coordinator_->runCycle(false);
    auto session = registry_->find("a");
    ASSERT_TRUE(session);
    ASSERT_TRUE(session->isAvailable());

    coordinator_->stop();
    EXPECT_FALSE(session->isAvailable());
    EXPECT_FALSE(coordinator_->requestCycle());
}

TEST_F(DiscoveryCoordinatorTest, InitialCycleSkipsSubnetsByDefault) {
    makeCoordinator();
    ON_CALL(*broadcast_, collect()).WillByDefault(Return(std::set<std::string>{}));
    EXPECT_CALL(*subnets_, collect()).Times(0);

    coordinator_->start();
    ASSERT_TRUE(waitFor([this] { return coordinator_->cycleCount() >= 1; }));
    coordinator_->stop();
}
