/**
 * @file test_identity_codec.cpp
 * @brief Unit tests for PeerId validation and decoding
 */

#include <gtest/gtest.h>
#include <proxid/core/identity_codec.hpp>

#include <string>

using namespace proxid::core;

TEST(IdentityCodecTest, AcceptsAsciiAndUtf8) {
    EXPECT_TRUE(isValidPeerId("alice"));
    EXPECT_TRUE(isValidPeerId("P1"));
    EXPECT_TRUE(isValidPeerId("J\xC3\xBCrgen"));            // 2-byte sequence
    EXPECT_TRUE(isValidPeerId("\xE2\x82\xAC" "42"));         // 3-byte sequence
    EXPECT_TRUE(isValidPeerId("\xF0\x9F\x93\xA1 radio"));    // 4-byte sequence
}

TEST(IdentityCodecTest, RejectsEmpty) {
    EXPECT_FALSE(isValidPeerId(""));
    EXPECT_FALSE(decodePeerId("").has_value());
}

TEST(IdentityCodecTest, RejectsInvalidUtf8) {
    EXPECT_FALSE(isValidPeerId("\xFF"));
    EXPECT_FALSE(isValidPeerId("abc\xC3"));                // truncated
    EXPECT_FALSE(isValidPeerId("\xC0\xAF"));                // overlong
    EXPECT_FALSE(isValidPeerId("\xED\xA0\x80"));            // surrogate
    EXPECT_FALSE(isValidPeerId("\xF4\x90\x80\x80"));        // above U+10FFFF
    EXPECT_FALSE(isValidPeerId("\x80" "abc"));              // stray continuation
}

TEST(IdentityCodecTest, RejectsEmbeddedNul) {
    EXPECT_FALSE(isValidPeerId(std::string("ab\0cd", 5)));
}

TEST(IdentityCodecTest, EnforcesMaximumLength) {
    EXPECT_TRUE(isValidPeerId(std::string(kMaxPeerIdBytes, 'x')));
    EXPECT_FALSE(isValidPeerId(std::string(kMaxPeerIdBytes + 1, 'x')));
}

TEST(IdentityCodecTest, DecodeReturnsTheIdentifier) {
    auto decoded = decodePeerId(encodePeerId("bob"));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, "bob");
    EXPECT_FALSE(decodePeerId("\xFE\xFE").has_value());
}
