/**
 * @file test_uuid.cpp
 * @brief Unit tests for UUID generation and comparison
 */

#include <gtest/gtest.h>
#include <proxid/utils/uuid.hpp>

#include <cctype>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace proxid::utils;

TEST(UUIDTest, GeneratesValidFormat) {
    std::string uuid = generateUUID();

    // UUID format: xxxxxxxx-xxxx-4xxx-[89ab]xxx-xxxxxxxxxxxx (36 chars)
    EXPECT_EQ(uuid.length(), 36u);
    EXPECT_TRUE(isValidUUID(uuid));

    EXPECT_EQ(uuid[14], '4');
    EXPECT_NE(std::string("89ab").find(uuid[19]), std::string::npos);
}

TEST(UUIDTest, GeneratesUniqueValues) {
    std::set<std::string> uuids;
    const int num_uuids = 1000;

    for (int i = 0; i < num_uuids; ++i) {
        uuids.insert(generateUUID());
    }

    EXPECT_EQ(uuids.size(), static_cast<size_t>(num_uuids));
}

TEST(UUIDTest, ThreadSafeGeneration) {
    std::set<std::string> uuids;
    std::mutex mtx;
    std::vector<std::thread> threads;
    const int num_threads = 10;
    const int uuids_per_thread = 100;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&uuids, &mtx, uuids_per_thread]() {
            for (int j = 0; j < uuids_per_thread; ++j) {
                std::string uuid = generateUUID();
                std::lock_guard<std::mutex> lock(mtx);
                uuids.insert(uuid);
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(uuids.size(), static_cast<size_t>(num_threads * uuids_per_thread));
}

TEST(UUIDTest, ValidatesShape) {
    EXPECT_TRUE(isValidUUID("A7CE1234-1234-1234-1234-123456789ABC"));
    EXPECT_TRUE(isValidUUID("a7ce1234-1234-1234-1234-123456789abc"));

    EXPECT_FALSE(isValidUUID(""));
    EXPECT_FALSE(isValidUUID("A7CE1234123412341234123456789ABC"));
    EXPECT_FALSE(isValidUUID("A7CE1234-1234-1234-1234-123456789AB"));
    EXPECT_FALSE(isValidUUID("G7CE1234-1234-1234-1234-123456789ABC"));
    EXPECT_FALSE(isValidUUID("A7CE1234_1234-1234-1234-123456789ABC"));
}

TEST(UUIDTest, ComparesCaseInsensitively) {
    EXPECT_TRUE(uuidEquals("A7CE1234-1234-1234-1234-123456789ABC",
                           "a7ce1234-1234-1234-1234-123456789abc"));
    EXPECT_FALSE(uuidEquals("A7CE1234-1234-1234-1234-123456789ABC",
                            "A7CE1234-1234-1234-1234-123456789ABD"));
    EXPECT_FALSE(uuidEquals("A7CE1234", "A7CE1234-1234-1234-1234-123456789ABC"));
}
