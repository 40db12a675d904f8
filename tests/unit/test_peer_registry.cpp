/**
 * @file test_peer_registry.cpp
 * @brief Unit tests for peer registry
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <proxid/core/peer_registry.hpp>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace proxid::core;
using ::testing::UnorderedElementsAre;
using ::testing::Contains;
using ::testing::IsEmpty;
using std::chrono::milliseconds;
using std::chrono::seconds;

class PeerRegistryTest : public ::testing::Test {
protected:
    PeerRegistry registry;
    TimePoint t0 = TimePoint() + std::chrono::hours(1);
};

// =============================================================================
// Upsert
// =============================================================================

TEST_F(PeerRegistryTest, UpsertReportsNewPeerOnce) {
    EXPECT_TRUE(registry.upsert("alice", t0));
    EXPECT_FALSE(registry.upsert("alice", t0 + seconds(1)));
    EXPECT_FALSE(registry.upsert("alice", t0 + seconds(2)));

    auto record = registry.getPeer("alice");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->first_seen, t0);
    EXPECT_EQ(record->last_seen, t0 + seconds(2));
    EXPECT_EQ(record->sightings, 3u);
}

TEST_F(PeerRegistryTest, GetNonExistentPeer) {
    EXPECT_FALSE(registry.getPeer("nobody").has_value());
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(PeerRegistryTest, OlderTimestampDoesNotRewindLastSeen) {
    registry.upsert("alice", t0 + seconds(4));
    registry.upsert("alice", t0 + seconds(1));

    auto record = registry.getPeer("alice");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->last_seen, t0 + seconds(4));
    EXPECT_EQ(record->sightings, 2u);
}

TEST_F(PeerRegistryTest, ListPeersIsSnapshot) {
    registry.upsert("alice", t0);
    registry.upsert("bob", t0);

    auto peers = registry.listPeers();
    registry.clear();

    EXPECT_THAT(peers, UnorderedElementsAre("alice", "bob"));
    EXPECT_THAT(registry.listPeers(), IsEmpty());
}

// =============================================================================
// Sweep
// =============================================================================

TEST_F(PeerRegistryTest, SweepRemovesAtThreshold) {
    registry.upsert("alice", t0);

    EXPECT_THAT(registry.sweep(t0 + milliseconds(4999), seconds(5)), IsEmpty());
    EXPECT_THAT(registry.sweep(t0 + seconds(5), seconds(5)), UnorderedElementsAre("alice"));
    EXPECT_FALSE(registry.getPeer("alice").has_value());
}

TEST_F(PeerRegistryTest, SweepKeepsRefreshedPeers) {
    registry.upsert("fresh", t0);
    registry.upsert("stale", t0);
    registry.upsert("fresh", t0 + seconds(3));

    auto removed = registry.sweep(t0 + seconds(6), seconds(5));

    EXPECT_THAT(removed, UnorderedElementsAre("stale"));
    EXPECT_THAT(registry.listPeers(), UnorderedElementsAre("fresh"));
}

TEST_F(PeerRegistryTest, SteadyPeerOutlivesSilentPeer) {
    // P1 seen every second, P2 only at t=0; sweep every 2s against 5s
    std::map<int, std::vector<PeerId>> lostAt;
    for (int t = 0; t <= 10; ++t) {
        registry.upsert("P1", t0 + seconds(t));
        if (t == 0) {
            registry.upsert("P2", t0);
        }
        if (t > 0 && t % 2 == 0) {
            auto lost = registry.sweep(t0 + seconds(t), seconds(5));
            if (!lost.empty()) {
                lostAt[t] = lost;
            }
        }
    }

    ASSERT_EQ(lostAt.size(), 1u);
    EXPECT_EQ(lostAt.begin()->first, 6);
    EXPECT_THAT(lostAt.begin()->second, UnorderedElementsAre("P2"));
    EXPECT_THAT(registry.listPeers(), UnorderedElementsAre("P1"));
}

TEST_F(PeerRegistryTest, PeerReturnsAfterSweepAsNewEpisode) {
    registry.upsert("alice", t0);
    registry.sweep(t0 + seconds(10), seconds(5));

    EXPECT_TRUE(registry.upsert("alice", t0 + seconds(11)));
    auto record = registry.getPeer("alice");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->first_seen, t0 + seconds(11));
    EXPECT_EQ(record->sightings, 1u);
}

TEST_F(PeerRegistryTest, ListMatchesLatestTimestampsAtEveryCheck) {
    // Sightings as (id, offset seconds); check listPeers against the rule
    // "present iff now - last upsert < threshold" after sweeping at each step.
    const std::vector<std::pair<std::string, int>> sightings = {
        {"a", 0}, {"b", 0}, {"a", 2}, {"c", 3}, {"b", 4}, {"a", 7}, {"c", 9}, {"b", 12}};
    std::map<std::string, int> latest;

    size_t next = 0;
    for (int now = 0; now <= 16; ++now) {
        while (next < sightings.size() && sightings[next].second == now) {
            registry.upsert(sightings[next].first, t0 + seconds(now));
            latest[sightings[next].first] = now;
            ++next;
        }
        registry.sweep(t0 + seconds(now), seconds(5));

        std::set<std::string> expected;
        for (const auto& [id, at] : latest) {
            if (now - at < 5) {
                expected.insert(id);
            }
        }
        auto listed = registry.listPeers();
        EXPECT_EQ(std::set<std::string>(listed.begin(), listed.end()), expected) << "at t=" << now;
    }
}

// =============================================================================
// Clear and Session Gate
// =============================================================================

TEST_F(PeerRegistryTest, ClearReturnsRemoved) {
    registry.upsert("alice", t0);
    registry.upsert("bob", t0);

    EXPECT_THAT(registry.clear(), UnorderedElementsAre("alice", "bob"));
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_THAT(registry.clear(), IsEmpty());
}

TEST_F(PeerRegistryTest, ClosedRegistryRejectsUpserts) {
    registry.upsert("alice", t0);

    EXPECT_THAT(registry.close(), UnorderedElementsAre("alice"));
    EXPECT_FALSE(registry.isOpen());
    EXPECT_FALSE(registry.upsert("bob", t0));
    EXPECT_THAT(registry.listPeers(), IsEmpty());

    registry.open();
    EXPECT_TRUE(registry.upsert("bob", t0));
}

// =============================================================================
// Address Cache
// =============================================================================

TEST_F(PeerRegistryTest, AddressCache) {
    EXPECT_FALSE(registry.lookupAddress("addr-1").has_value());

    registry.rememberAddress("addr-1", "alice");
    registry.rememberAddress("addr-2", "bob");
    registry.rememberAddress("addr-1", "carol");

    EXPECT_EQ(registry.lookupAddress("addr-1"), std::optional<PeerId>("carol"));
    EXPECT_EQ(registry.addressCount(), 2u);

    EXPECT_EQ(registry.forgetAddresses(), 2u);
    EXPECT_FALSE(registry.lookupAddress("addr-2").has_value());
}

TEST_F(PeerRegistryTest, AddressCacheSurvivesClear) {
    registry.rememberAddress("addr-1", "alice");
    registry.upsert("alice", t0);
    registry.close();

    EXPECT_EQ(registry.lookupAddress("addr-1"), std::optional<PeerId>("alice"));
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_F(PeerRegistryTest, ThreadSafety) {
    std::vector<std::thread> threads;
    const int num_threads = 8;
    const int ops_per_thread = 500;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([this, i, ops_per_thread]() {
            for (int j = 0; j < ops_per_thread; ++j) {
                std::string peer = "peer-" + std::to_string((i + j) % 16);
                registry.upsert(peer, t0 + milliseconds(j));
                registry.rememberAddress("addr-" + std::to_string(j % 32), peer);
                registry.listPeers();
                if (j % 50 == 0) {
                    registry.sweep(t0 + milliseconds(j), milliseconds(100));
                }
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_LE(registry.size(), 16u);
}
