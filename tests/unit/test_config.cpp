/**
 * @file test_config.cpp
 * @brief Unit tests for daemon configuration and CLI parsing
 *
 * Tests cover:
 * - Default configuration values
 * - CLI argument parsing
 * - Conversion to engine and radio configuration
 * - Error handling
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <proxid/daemon/config.hpp>

#include <vector>
#include <string>
#include <cstring>

using namespace proxid::daemon;

class ConfigTest : public ::testing::Test {
protected:
    // Helper to create argc/argv from vector of strings
    std::pair<int, std::vector<char*>> makeArgs(const std::vector<std::string>& args) {
        argv_storage_.clear();
        argv_storage_.reserve(args.size());

        for (const auto& arg : args) {
            argv_storage_.push_back(std::vector<char>(arg.begin(), arg.end()));
            argv_storage_.back().push_back('\0');
        }

        argv_ptrs_.clear();
        for (auto& storage : argv_storage_) {
            argv_ptrs_.push_back(storage.data());
        }

        return {static_cast<int>(argv_ptrs_.size()), argv_ptrs_};
    }

    Config parse(const std::vector<std::string>& args) {
        auto [argc, argv] = makeArgs(args);
        return parseArgs(argc, argv.data());
    }

private:
    std::vector<std::vector<char>> argv_storage_;
    std::vector<char*> argv_ptrs_;
};

// =============================================================================
// Default Values
// =============================================================================

TEST_F(ConfigTest, DefaultValues) {
    Config config;

    EXPECT_TRUE(config.peer_id.empty());
    EXPECT_EQ(config.mcast_addr, "239.255.77.7");
    EXPECT_EQ(config.mcast_port, 5770);
    EXPECT_TRUE(config.mcast_iface.empty());
    EXPECT_EQ(config.gatt_port, 0);
    EXPECT_EQ(config.bind_addr, "0.0.0.0");
    EXPECT_EQ(config.local_name, "proxid");
    EXPECT_EQ(config.log_level, "INFO");
    EXPECT_FALSE(config.help);
    EXPECT_FALSE(config.error);

    EXPECT_EQ(config.advertise_interval_ms, 500);
    EXPECT_EQ(config.service_data_limit, 20u);
    EXPECT_TRUE(config.embed_identity);

    EXPECT_EQ(config.staleness_ms, 5000);
    EXPECT_EQ(config.sweep_ms, 2000);
    EXPECT_EQ(config.rpc_deadline_ms, 5000);
}

// =============================================================================
// Basic CLI Parsing
// =============================================================================

TEST_F(ConfigTest, PeerIdOnly) {
    auto config = parse({"proxid", "--peer-id", "alice"});

    EXPECT_EQ(config.peer_id, "alice");
    EXPECT_FALSE(config.help);
    EXPECT_FALSE(config.error);
}

TEST_F(ConfigTest, MissingPeerIdIsError) {
    auto config = parse({"proxid"});

    EXPECT_TRUE(config.help);
    EXPECT_TRUE(config.error);
}

TEST_F(ConfigTest, HelpFlag) {
    auto config = parse({"proxid", "--help"});
    EXPECT_TRUE(config.help);
    EXPECT_FALSE(config.error);

    config = parse({"proxid", "-h"});
    EXPECT_TRUE(config.help);
    EXPECT_FALSE(config.error);
}

TEST_F(ConfigTest, AllNetworkOptions) {
    auto config = parse({"proxid", "--peer-id", "bob",
                         "--mcast-addr", "239.1.2.3",
                         "--mcast-port", "6000",
                         "--gatt-port", "6001",
                         "--bind", "127.0.0.1",
                         "--local-name", "kitchen"});

    EXPECT_FALSE(config.error);
    EXPECT_EQ(config.mcast_addr, "239.1.2.3");
    EXPECT_EQ(config.mcast_port, 6000);
    EXPECT_EQ(config.gatt_port, 6001);
    EXPECT_EQ(config.bind_addr, "127.0.0.1");
    EXPECT_EQ(config.local_name, "kitchen");
}

TEST_F(ConfigTest, AdvertisingOptions) {
    auto config = parse({"proxid", "--peer-id", "bob",
                         "--advertise-interval", "250",
                         "--service-data-limit", "64",
                         "--no-service-data"});

    EXPECT_FALSE(config.error);
    EXPECT_EQ(config.advertise_interval_ms, 250);
    EXPECT_EQ(config.service_data_limit, 64u);
    EXPECT_FALSE(config.embed_identity);
}

TEST_F(ConfigTest, StalenessOptions) {
    auto config = parse({"proxid", "--peer-id", "bob",
                         "--staleness-ms", "10000",
                         "--sweep-ms", "3000",
                         "--rpc-deadline-ms", "1500"});

    EXPECT_FALSE(config.error);
    EXPECT_EQ(config.staleness_ms, 10000);
    EXPECT_EQ(config.sweep_ms, 3000);
    EXPECT_EQ(config.rpc_deadline_ms, 1500);
}

TEST_F(ConfigTest, LogLevel) {
    auto config = parse({"proxid", "--peer-id", "bob", "--log-level", "DEBUG"});
    EXPECT_EQ(config.log_level, "DEBUG");
}

// =============================================================================
// Error Handling
// =============================================================================

TEST_F(ConfigTest, UnknownOption) {
    auto config = parse({"proxid", "--peer-id", "bob", "--frobnicate", "1"});
    EXPECT_TRUE(config.help);
    EXPECT_TRUE(config.error);
}

TEST_F(ConfigTest, MissingValue) {
    auto config = parse({"proxid", "--peer-id"});
    EXPECT_TRUE(config.help);
    EXPECT_TRUE(config.error);
}

TEST_F(ConfigTest, NonNumericValue) {
    auto config = parse({"proxid", "--peer-id", "bob", "--mcast-port", "abc"});
    EXPECT_TRUE(config.help);
    EXPECT_TRUE(config.error);
}

// =============================================================================
// Derived Configuration
// =============================================================================

TEST_F(ConfigTest, DiscoveryConfigFromFlags) {
    auto config = parse({"proxid", "--peer-id", "bob", "--no-service-data",
                         "--staleness-ms", "8000", "--sweep-ms", "1000",
                         "--local-name", "hall"});

    auto discovery = config.discoveryConfig();
    EXPECT_FALSE(discovery.embed_identity);
    EXPECT_EQ(discovery.staleness_threshold_ms, 8000);
    EXPECT_EQ(discovery.sweep_interval_ms, 1000);
    EXPECT_EQ(discovery.local_name, "hall");
    EXPECT_TRUE(discovery.validate(nullptr));
}

TEST_F(ConfigTest, SweepNotBelowStalenessIsRejected) {
    auto config = parse({"proxid", "--peer-id", "bob",
                         "--staleness-ms", "2000", "--sweep-ms", "2000"});
    ASSERT_FALSE(config.error);

    std::string error;
    EXPECT_FALSE(config.discoveryConfig().validate(&error));
    EXPECT_THAT(error, ::testing::HasSubstr("sweep interval"));
}

TEST_F(ConfigTest, RadioConfigFromFlags) {
    auto config = parse({"proxid", "--peer-id", "bob",
                         "--mcast-addr", "239.9.9.9", "--mcast-port", "7000",
                         "--gatt-port", "7001", "--bind", "127.0.0.1",
                         "--advertise-interval", "100", "--service-data-limit", "8",
                         "--rpc-deadline-ms", "900"});

    auto radio = config.radioConfig();
    EXPECT_EQ(radio.mcast_addr, "239.9.9.9");
    EXPECT_EQ(radio.mcast_port, 7000);
    EXPECT_EQ(radio.gatt_port, 7001);
    EXPECT_EQ(radio.bind_addr, "127.0.0.1");
    EXPECT_EQ(radio.advertise_interval_ms, 100);
    EXPECT_EQ(radio.service_data_limit, 8u);
    EXPECT_EQ(radio.rpc_deadline_ms, 900);
    EXPECT_TRUE(radio.mcast_iface.empty());
    EXPECT_TRUE(radio.validate(nullptr));
}

TEST_F(ConfigTest, MulticastInterfaceReachesRadio) {
    auto config = parse({"proxid", "--peer-id", "bob", "--mcast-iface", "127.0.0.1"});
    ASSERT_FALSE(config.error);

    auto radio = config.radioConfig();
    EXPECT_EQ(radio.mcast_iface, "127.0.0.1");
    EXPECT_TRUE(radio.validate(nullptr));
}

// =============================================================================
// Radio Validation
// =============================================================================

TEST_F(ConfigTest, PortAboveRangeIsError) {
    auto config = parse({"proxid", "--peer-id", "bob", "--mcast-port", "70000"});
    EXPECT_TRUE(config.error);

    config = parse({"proxid", "--peer-id", "bob", "--gatt-port", "70000"});
    EXPECT_TRUE(config.error);

    config = parse({"proxid", "--peer-id", "bob", "--gatt-port", "-1"});
    EXPECT_TRUE(config.error);
}

TEST_F(ConfigTest, ZeroMulticastPortIsRejected) {
    auto config = parse({"proxid", "--peer-id", "bob", "--mcast-port", "0"});
    ASSERT_FALSE(config.error);

    std::string error;
    EXPECT_FALSE(config.radioConfig().validate(&error));
    EXPECT_THAT(error, ::testing::HasSubstr("multicast port"));
}

TEST_F(ConfigTest, EphemeralGattPortIsAccepted) {
    auto config = parse({"proxid", "--peer-id", "bob", "--gatt-port", "0"});
    ASSERT_FALSE(config.error);
    EXPECT_TRUE(config.radioConfig().validate(nullptr));
}

TEST_F(ConfigTest, NonPositiveAdvertiseIntervalIsRejected) {
    for (const char* interval : {"0", "-5"}) {
        auto config = parse({"proxid", "--peer-id", "bob", "--advertise-interval", interval});
        ASSERT_FALSE(config.error);

        std::string error;
        EXPECT_FALSE(config.radioConfig().validate(&error)) << interval;
        EXPECT_THAT(error, ::testing::HasSubstr("advertise interval"));
    }
}

TEST_F(ConfigTest, NonPositiveRpcDeadlineIsRejected) {
    for (const char* deadline : {"0", "-100"}) {
        auto config = parse({"proxid", "--peer-id", "bob", "--rpc-deadline-ms", deadline});
        ASSERT_FALSE(config.error);

        std::string error;
        EXPECT_FALSE(config.radioConfig().validate(&error)) << deadline;
        EXPECT_THAT(error, ::testing::HasSubstr("rpc deadline"));
    }
}

TEST_F(ConfigTest, NonMulticastGroupIsRejected) {
    auto config = parse({"proxid", "--peer-id", "bob", "--mcast-addr", "10.0.0.1"});
    ASSERT_FALSE(config.error);

    std::string error;
    EXPECT_FALSE(config.radioConfig().validate(&error));
    EXPECT_THAT(error, ::testing::HasSubstr("multicast group"));
}

TEST_F(ConfigTest, MalformedInterfaceIsRejected) {
    auto config = parse({"proxid", "--peer-id", "bob", "--mcast-iface", "eth0"});
    ASSERT_FALSE(config.error);

    std::string error;
    EXPECT_FALSE(config.radioConfig().validate(&error));
    EXPECT_THAT(error, ::testing::HasSubstr("interface"));
}
