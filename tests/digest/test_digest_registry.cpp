/**
 * @file test_digest_registry.cpp
 * @brief Digest functions and algorithm registry
 */

#include "canonhash/common.hpp"
#include "canonhash/digest.hpp"

#include <memory>
#include <set>
#include <string>

#include <gtest/gtest.h>

namespace canonhash::digest::test {

namespace {

std::string hex_digest(const DigestRegistry& registry, std::string_view algorithm,
                       std::string_view input)
{
    auto function = registry.find(algorithm);
    EXPECT_TRUE(function) << algorithm;
    if (!function) {
        return {};
    }
    auto bytes = (*function)->digest(common::as_bytes(input));
    EXPECT_TRUE(bytes);
    return bytes ? common::to_hex(*bytes) : std::string{};
}

/// Fixed-output digest for registry tests
class ConstantDigest final : public DigestFunction
{
public:
    explicit ConstantDigest(std::string name)
        : m_name(std::move(name))
    {}

    [[nodiscard]] std::string_view name() const noexcept override { return m_name; }
    [[nodiscard]] std::size_t digest_size() const noexcept override { return 1; }

    [[nodiscard]] canonhash::Result<Bytes> digest(std::span<const std::uint8_t>) const override
    {
        return Bytes{0x2a};
    }

private:
    std::string m_name;
};

}  // namespace

TEST(DigestRegistryTest, DefaultRegistryHasSha256)
{
    const auto& registry = default_registry();
    EXPECT_TRUE(registry.contains(kDefaultAlgorithm));
    EXPECT_FALSE(registry.algorithms().empty());
    EXPECT_EQ(hex_digest(registry, "SHA-256", "abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(DigestRegistryTest, OpenSslKnownAnswers)
{
    const auto& registry = default_registry();
    EXPECT_EQ(hex_digest(registry, "SHA-1", "abc"), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(hex_digest(registry, "SHA-384", "abc"),
              "cb00753f45a35e8bb5a03d699ac65007272c32ab0eded1631a8b605a43ff5bed"
              "8086072ba1e7cc2358baeca134c825a7");
    EXPECT_EQ(hex_digest(registry, "SHA-512", "abc"),
              "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
              "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");
    if (registry.contains("MD5")) {
        EXPECT_EQ(hex_digest(registry, "MD5", "abc"), "900150983cd24fb0d6963f7d28e17f72");
    }
}

TEST(DigestRegistryTest, DigestSizesMatchOutput)
{
    const auto& registry = default_registry();
    for (const auto& name : registry.algorithms()) {
        SCOPED_TRACE(name);
        auto function = registry.find(name);
        ASSERT_TRUE(function);
        auto bytes = (*function)->digest(common::as_bytes("payload"));
        ASSERT_TRUE(bytes);
        EXPECT_EQ(bytes->size(), (*function)->digest_size());
    }
}

TEST(DigestRegistryTest, BuiltinSha256AgreesWithOpenSsl)
{
    auto openssl = make_openssl_digest("SHA-256", "SHA256");
    ASSERT_TRUE(openssl);
    auto builtin = make_sha256();

    const std::string input(1'000, 'q');
    auto lhs = builtin->digest(common::as_bytes(input));
    auto rhs = (*openssl)->digest(common::as_bytes(input));
    ASSERT_TRUE(lhs);
    ASSERT_TRUE(rhs);
    EXPECT_EQ(*lhs, *rhs);
}

TEST(DigestRegistryTest, LookupIsCaseInsensitive)
{
    const auto& registry = default_registry();
    auto lower = registry.find("sha-256");
    ASSERT_TRUE(lower);
    EXPECT_EQ((*lower)->name(), "SHA-256");
    EXPECT_TRUE(registry.contains("Sha-512"));
}

TEST(DigestRegistryTest, UnknownAlgorithmIsUnsupported)
{
    auto function = default_registry().find("MD9");
    ASSERT_FALSE(function);
    EXPECT_TRUE(function.error().is(error_code::kUnsupportedAlgorithm));
    EXPECT_EQ(function.error().message, "Unsupported digest algorithm: MD9");
    EXPECT_FALSE(default_registry().contains("SHA256"));
}

TEST(DigestRegistryTest, OpenSslRejectsUnknownName)
{
    auto function = make_openssl_digest("MD9", "MD9");
    ASSERT_FALSE(function);
    EXPECT_TRUE(function.error().is(error_code::kUnsupportedAlgorithm));
}

TEST(DigestRegistryTest, RegisteredOpenSslDigestsAreUsable)
{
    const auto& registry = default_registry();
    for (std::string_view name : {"SHA-1", "SHA-384", "SHA-512", "MD5"}) {
        SCOPED_TRACE(name);
        if (!registry.contains(name)) {
            continue;
        }
        auto function = registry.find(name);
        ASSERT_TRUE(function);
        auto bytes = (*function)->digest(common::as_bytes(""));
        ASSERT_TRUE(bytes) << bytes.error().message;
        EXPECT_EQ(bytes->size(), (*function)->digest_size());
    }

    auto fetched = make_openssl_digest("SHA-512", "SHA512");
    ASSERT_TRUE(fetched);
    EXPECT_EQ((*fetched)->digest_size(), 64U);
    EXPECT_EQ(hex_digest(registry, "SHA-512", ""),
              "cf83e1357eefb8bdf1542850d66d8007d620e4050b5715dc83f4a921d36ce9ce"
              "47d0d13c5d85f2b0ff8318d2877eec2f63b931bd47417a81a538327af927da3e");
}

TEST(DigestRegistryTest, DuplicateRegistrationFails)
{
    DigestRegistry registry;
    ASSERT_TRUE(registry.add(std::make_unique<ConstantDigest>("Const")));

    auto duplicate = registry.add(std::make_unique<ConstantDigest>("CONST"));
    ASSERT_FALSE(duplicate);
    EXPECT_TRUE(duplicate.error().is(error_code::kDuplicateAlgorithm));

    auto null_function = registry.add(nullptr);
    ASSERT_FALSE(null_function);
    EXPECT_TRUE(null_function.error().is(error_code::kInvalidArgument));

    EXPECT_EQ(registry.algorithms(), (std::set<std::string>{"Const"}));
}

TEST(DigestRegistryTest, CustomRegistryIsIndependent)
{
    DigestRegistry registry;
    ASSERT_TRUE(registry.add(std::make_unique<ConstantDigest>("Const")));
    EXPECT_FALSE(registry.contains("SHA-256"));
    EXPECT_FALSE(default_registry().contains("Const"));
    EXPECT_EQ(hex_digest(registry, "const", "anything"), "2a");
}

}  // namespace canonhash::digest::test
