/**
 * @file test_discovery_coordinator.cpp
 * @brief Unit tests for the discovery coordinator lifecycle and notifications
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <proxid/core/discovery_coordinator.hpp>
#include <proxid/core/identity_codec.hpp>

#include "fakes/fake_radio.hpp"
#include "fakes/manual_clock.hpp"
#include "fakes/recording_listener.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>

using namespace proxid::core;
using proxid::test::FakeRadio;
using proxid::test::ManualClock;
using proxid::test::RecordingListener;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::UnorderedElementsAre;

using Event = RecordingListener::Event;

namespace {

// Long enough that the background sweep never fires during a test;
// sweeps are driven with sweepNow() against the manual clock.
constexpr int64_t kStalenessMs = 5 * 60 * 1000;
constexpr int64_t kSweepMs = 4 * 60 * 1000;

}  // namespace

class DiscoveryCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        radio = std::make_shared<FakeRadio>();
        radioExecutor = std::make_shared<SerialExecutor>("radio");
        deliveryExecutor = std::make_shared<SerialExecutor>("delivery");
        listener = std::make_shared<RecordingListener>();

        config.staleness_threshold_ms = kStalenessMs;
        config.sweep_interval_ms = kSweepMs;

        coordinator = std::make_unique<DiscoveryCoordinator>(
            config, radio, radio, radioExecutor, deliveryExecutor, clock.fn());
        coordinator->setListener(listener);

        onRadio([this]() { radio->setState(RadioState::POWERED_ON); });
    }

    void TearDown() override {
        coordinator.reset();
        radioExecutor->shutdown();
        deliveryExecutor->shutdown();
    }

    /// Run fn on the radio executor and wait for it.
    void onRadio(std::function<void()> fn) {
        ASSERT_TRUE(radioExecutor->runSync(std::move(fn)));
    }

    /// Wait until everything queued on both executors has run.
    void drain() {
        ASSERT_TRUE(radioExecutor->runSync([]() {}));
        ASSERT_TRUE(deliveryExecutor->runSync([]() {}));
    }

    void sightEmbedded(const std::string& address, const std::string& peerId) {
        onRadio([this, address, peerId]() { radio->deliver(address, &peerId); });
        drain();
    }

    void start(const PeerId& peerId = "self") {
        ASSERT_TRUE(coordinator->startDiscovery(peerId));
        drain();
    }

    void advance(std::chrono::milliseconds delta) { clock.advance(delta); }

    ManualClock clock;
    DiscoveryConfig config;
    std::shared_ptr<FakeRadio> radio;
    std::shared_ptr<SerialExecutor> radioExecutor;
    std::shared_ptr<SerialExecutor> deliveryExecutor;
    std::shared_ptr<RecordingListener> listener;
    std::unique_ptr<DiscoveryCoordinator> coordinator;
};

// =============================================================================
// Start / Stop
// =============================================================================

TEST_F(DiscoveryCoordinatorTest, StartAdvertisesAndScans) {
    start("alice");

    EXPECT_TRUE(coordinator->isRunning());
    EXPECT_EQ(coordinator->localPeerId(), "alice");
    EXPECT_TRUE(radio->advertising);
    EXPECT_TRUE(radio->scanning);
    EXPECT_EQ(radio->lastAdvertisement.serviceDataFor(kServiceUuid),
              std::optional<std::string>("alice"));
}

TEST_F(DiscoveryCoordinatorTest, RejectsInvalidPeerId) {
    EXPECT_FALSE(coordinator->startDiscovery(""));
    EXPECT_FALSE(coordinator->startDiscovery(std::string("a\0b", 3)));
    EXPECT_FALSE(coordinator->startDiscovery(std::string(kMaxPeerIdBytes + 1, 'x')));
    drain();

    EXPECT_FALSE(coordinator->isRunning());
    EXPECT_FALSE(radio->advertising);
    EXPECT_FALSE(radio->scanning);
}

TEST_F(DiscoveryCoordinatorTest, RejectsInvalidConfig) {
    DiscoveryConfig bad;
    bad.staleness_threshold_ms = 1000;
    bad.sweep_interval_ms = 1000;
    DiscoveryCoordinator other(bad, radio, radio, radioExecutor, deliveryExecutor, clock.fn());

    EXPECT_FALSE(other.startDiscovery("alice"));
    EXPECT_FALSE(other.isRunning());
}

TEST_F(DiscoveryCoordinatorTest, StopIsIdempotent) {
    coordinator->stopDiscovery();
    start();
    coordinator->stopDiscovery();
    coordinator->stopDiscovery();
    drain();

    EXPECT_FALSE(coordinator->isRunning());
    EXPECT_TRUE(coordinator->localPeerId().empty());
    EXPECT_FALSE(radio->advertising);
    EXPECT_FALSE(radio->scanning);
}

TEST_F(DiscoveryCoordinatorTest, StopReportsEveryVisiblePeerLost) {
    start();
    sightEmbedded("addr-1", "alice");
    sightEmbedded("addr-2", "bob");
    ASSERT_THAT(coordinator->getDiscoveredPeers(), UnorderedElementsAre("alice", "bob"));

    coordinator->stopDiscovery();
    EXPECT_THAT(coordinator->getDiscoveredPeers(), IsEmpty());
    drain();

    EXPECT_EQ(listener->lostCount("alice"), 1u);
    EXPECT_EQ(listener->lostCount("bob"), 1u);
}

TEST_F(DiscoveryCoordinatorTest, RestartAfterStopStartsFresh) {
    start();
    sightEmbedded("addr-1", "alice");
    coordinator->stopDiscovery();
    drain();

    start();
    sightEmbedded("addr-1", "alice");

    EXPECT_THAT(listener->events(), ElementsAre(Event{true, "alice"}, Event{false, "alice"},
                                                Event{true, "alice"}));
}

TEST_F(DiscoveryCoordinatorTest, SwitchesIdentityWhileRunning) {
    start("alice");
    sightEmbedded("addr-1", "bob");

    ASSERT_TRUE(coordinator->startDiscovery("carol"));
    drain();

    EXPECT_EQ(coordinator->localPeerId(), "carol");
    EXPECT_EQ(radio->lastAdvertisement.serviceDataFor(kServiceUuid),
              std::optional<std::string>("carol"));
    EXPECT_THAT(coordinator->getDiscoveredPeers(), ElementsAre("bob"));
}

TEST_F(DiscoveryCoordinatorTest, IgnoresSightingsBeforeStart) {
    sightEmbedded("addr-1", "alice");
    EXPECT_THAT(coordinator->getDiscoveredPeers(), IsEmpty());
    EXPECT_THAT(listener->events(), IsEmpty());
}

// =============================================================================
// Discovery and Loss
// =============================================================================

TEST_F(DiscoveryCoordinatorTest, DiscoveredOncePerEpisode) {
    start();
    for (int i = 0; i < 10; ++i) {
        sightEmbedded("addr-1", "alice");
        advance(std::chrono::seconds(1));
    }

    EXPECT_EQ(listener->discoveredCount("alice"), 1u);
    EXPECT_EQ(listener->lostCount("alice"), 0u);
}

TEST_F(DiscoveryCoordinatorTest, TwoPeerTimeline) {
    // P1 refreshes, P2 goes quiet
    start();
    sightEmbedded("addr-1", "p1");
    sightEmbedded("addr-2", "p2");

    advance(std::chrono::minutes(3));
    sightEmbedded("addr-1", "p1");
    EXPECT_THAT(coordinator->sweepNow(), IsEmpty());

    advance(std::chrono::minutes(2));
    EXPECT_THAT(coordinator->sweepNow(), ElementsAre("p2"));
    drain();

    EXPECT_THAT(coordinator->getDiscoveredPeers(), ElementsAre("p1"));
    EXPECT_THAT(listener->events(), ElementsAre(Event{true, "p1"}, Event{true, "p2"},
                                                Event{false, "p2"}));

    advance(std::chrono::minutes(3));
    EXPECT_THAT(coordinator->sweepNow(), ElementsAre("p1"));
    EXPECT_THAT(coordinator->getDiscoveredPeers(), IsEmpty());
}

TEST_F(DiscoveryCoordinatorTest, PeerJustUnderThresholdIsKept) {
    start();
    sightEmbedded("addr-1", "alice");

    advance(std::chrono::milliseconds(kStalenessMs - 1));
    EXPECT_THAT(coordinator->sweepNow(), IsEmpty());

    advance(std::chrono::milliseconds(1));
    EXPECT_THAT(coordinator->sweepNow(), ElementsAre("alice"));
}

TEST_F(DiscoveryCoordinatorTest, ReappearingPeerIsDiscoveredAgain) {
    start();
    sightEmbedded("addr-1", "alice");
    advance(std::chrono::milliseconds(kStalenessMs));
    coordinator->sweepNow();

    sightEmbedded("addr-1", "alice");
    drain();

    EXPECT_EQ(listener->discoveredCount("alice"), 2u);
    EXPECT_EQ(listener->lostCount("alice"), 1u);
}

TEST_F(DiscoveryCoordinatorTest, ResolvesThroughExchange) {
    start();

    onRadio([this]() { radio->deliver("addr-1", nullptr); });
    EXPECT_THAT(radio->connectCalls, ElementsAre("addr-1"));

    onRadio([this]() { radio->completeExchange("addr-1", "alice"); });
    drain();

    EXPECT_THAT(coordinator->getDiscoveredPeers(), ElementsAre("alice"));
    EXPECT_EQ(listener->discoveredCount("alice"), 1u);

    // Later sightings of the same address reuse the cached identity
    advance(std::chrono::minutes(1));
    onRadio([this]() { radio->deliver("addr-1", nullptr); });
    drain();
    EXPECT_EQ(radio->connectCalls.size(), 1u);
    EXPECT_EQ(coordinator->getDiscoveredPeers().size(), 1u);
    EXPECT_EQ(coordinator->resolverStats().cached, 1u);
}

TEST_F(DiscoveryCoordinatorTest, ExchangeFinishingAfterStopIsDropped) {
    start();
    onRadio([this]() {
        radio->deliver("addr-1", nullptr);
        radio->completeConnect("addr-1", RadioStatus::success());
        radio->completeDiscoverServices("addr-1", RadioStatus::success(), {kServiceUuid});
        radio->completeDiscoverCharacteristics("addr-1", RadioStatus::success(),
                                               {kPeerIdCharacteristicUuid});
    });
    ASSERT_TRUE(radio->hasPendingRead("addr-1"));

    // Hold the radio executor so the read lands between stop and the reset
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    radioExecutor->post([this, released]() {
        released.wait();
        radio->completeRead("addr-1", RadioStatus::success(), "alice");
    });

    coordinator->stopDiscovery();
    release.set_value();
    drain();

    EXPECT_THAT(coordinator->getDiscoveredPeers(), IsEmpty());
    EXPECT_EQ(listener->discoveredCount("alice"), 0u);
}

TEST_F(DiscoveryCoordinatorTest, RadioLossKeepsPeersUntilStale) {
    start();
    sightEmbedded("addr-1", "alice");

    onRadio([this]() { radio->setState(RadioState::POWERED_OFF); });
    drain();

    EXPECT_THAT(coordinator->getDiscoveredPeers(), ElementsAre("alice"));
    EXPECT_EQ(coordinator->registry()->addressCount(), 0u);

    advance(std::chrono::milliseconds(kStalenessMs));
    EXPECT_THAT(coordinator->sweepNow(), ElementsAre("alice"));

    // Scanning and advertising come back with the radio
    onRadio([this]() { radio->setState(RadioState::POWERED_ON); });
    drain();
    EXPECT_TRUE(radio->scanning);
    EXPECT_TRUE(radio->advertising);
}

// =============================================================================
// Listener
// =============================================================================

TEST_F(DiscoveryCoordinatorTest, ListenerIsHeldWeakly) {
    start();
    std::weak_ptr<RecordingListener> weak = listener;
    listener.reset();
    EXPECT_TRUE(weak.expired());

    sightEmbedded("addr-1", "alice");
    EXPECT_THAT(coordinator->getDiscoveredPeers(), ElementsAre("alice"));
}

TEST_F(DiscoveryCoordinatorTest, ListenerCanBeReplaced) {
    auto second = std::make_shared<RecordingListener>();
    coordinator->setListener(second);
    start();
    sightEmbedded("addr-1", "alice");

    EXPECT_THAT(listener->events(), IsEmpty());
    EXPECT_EQ(second->discoveredCount("alice"), 1u);
}

TEST_F(DiscoveryCoordinatorTest, DestructionDetachesFromRadio) {
    start();
    coordinator.reset();

    EXPECT_FALSE(radio->hasPeripheralHandler());
    EXPECT_FALSE(radio->hasCentralHandler());
    EXPECT_FALSE(radio->advertising);
    EXPECT_FALSE(radio->scanning);
}

// =============================================================================
// Sweep Timer
// =============================================================================

/// Same wiring on the steady clock with a sweep short enough to observe.
class DiscoverySweepTimerTest : public DiscoveryCoordinatorTest {
protected:
    void SetUp() override {
        radio = std::make_shared<FakeRadio>();
        radioExecutor = std::make_shared<SerialExecutor>("radio");
        deliveryExecutor = std::make_shared<SerialExecutor>("delivery");
        listener = std::make_shared<RecordingListener>();

        config.staleness_threshold_ms = 500;
        config.sweep_interval_ms = 200;

        coordinator = std::make_unique<DiscoveryCoordinator>(
            config, radio, radio, radioExecutor, deliveryExecutor);
        coordinator->setListener(listener);

        onRadio([this]() { radio->setState(RadioState::POWERED_ON); });
    }
};

TEST_F(DiscoverySweepTimerTest, SilentPeerLostWhileSteadyPeerStays) {
    start();
    sightEmbedded("addr-2", "P2");

    // P1 every 100ms until P2 has been swept, bounded well past the threshold
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (listener->lostCount("P2") == 0 && std::chrono::steady_clock::now() < deadline) {
        sightEmbedded("addr-1", "P1");
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    // A few more sweeps with P1 still refreshed
    for (int i = 0; i < 8; ++i) {
        sightEmbedded("addr-1", "P1");
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    drain();

    EXPECT_EQ(listener->discoveredCount("P1"), 1u);
    EXPECT_EQ(listener->discoveredCount("P2"), 1u);
    EXPECT_EQ(listener->lostCount("P2"), 1u);
    EXPECT_EQ(listener->lostCount("P1"), 0u);
    EXPECT_THAT(coordinator->getDiscoveredPeers(), ElementsAre("P1"));

    coordinator->stopDiscovery();
    drain();

    EXPECT_EQ(listener->lostCount("P1"), 1u);
    EXPECT_EQ(listener->lostCount("P2"), 1u);
    EXPECT_THAT(coordinator->getDiscoveredPeers(), IsEmpty());
}
