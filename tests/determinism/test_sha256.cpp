/**
 * @file test_sha256.cpp
 * @brief Built-in SHA-256 known-answer tests
 */

#include "canonhash/common.hpp"

#include <string>

#include <gtest/gtest.h>

using namespace canonhash::common;

TEST(SHA256, EmptyString)
{
    // SHA-256 of empty string is well-known
    EXPECT_EQ(sha256(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256, Abc)
{
    EXPECT_EQ(sha256("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256, TwoBlockMessage)
{
    EXPECT_EQ(sha256("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256, HelloWorld)
{
    EXPECT_EQ(sha256("Hello, World!"),
              "dffd6021bb2bd5b0af676290809ec3a53191dd81c7f70a4b28688a362182986f");
}

TEST(SHA256, OneMillionA)
{
    EXPECT_EQ(sha256(std::string(1'000'000, 'a')),
              "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST(SHA256, PaddingBoundaries)
{
    // Lengths around the 56-byte length-field boundary and the 64-byte block
    EXPECT_EQ(sha256(std::string(55, 'x')),
              "d5e285683cd4efc02d021a5c62014694958901005d6f71e89e0989fac77e4072");
    EXPECT_EQ(sha256(std::string(56, 'x')),
              "04c26261370ee7541549d16dee320c723e3fd14671e66a099afe0a377c16888e");
    EXPECT_EQ(sha256(std::string(63, 'x')),
              "75220b47218278e656f2013bb8f0c455a25eaf01e86c64924e9d48d89776d6f2");
    EXPECT_EQ(sha256(std::string(64, 'x')),
              "7ce100971f64e7001e8fe5a51973ecdfe1ced42befe7ee8d5fd6219506b5393c");
    EXPECT_EQ(sha256(std::string(65, 'x')),
              "9537c5fdf120482f7d58d25e9ed583f52c02b4e304ea814db1633ad565aed7e9");
    EXPECT_EQ(sha256(std::string(119, 'x')),
              "000b48d4edf0fa7bee3c6236ecd2785baa5db4eeb8bb54341b029e0d9fa5fb0c");
    EXPECT_EQ(sha256(std::string(128, 'x')),
              "24da1b81d0b16df6428eee73c69fcb2a93c76bc6df706f0c6670fe6bfe800464");
}

TEST(SHA256, RawDigestMatchesHex)
{
    auto digest = sha256_digest(as_bytes("abc"));
    EXPECT_EQ(digest.size(), kSha256DigestSize);
    EXPECT_EQ(to_hex(digest), sha256("abc"));
}

TEST(SHA256, Determinism)
{
    // Same input must always produce same output
    std::string input = "test input for determinism";
    std::string hash1 = sha256(input);
    std::string hash2 = sha256(input);
    std::string hash3 = sha256(input);

    EXPECT_EQ(hash1, hash2);
    EXPECT_EQ(hash2, hash3);
}

TEST(SHA256, DifferentInputs)
{
    EXPECT_NE(sha256("a"), sha256("b"));
    EXPECT_NE(sha256("abc"), sha256("ABC"));
}
