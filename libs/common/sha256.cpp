/**
 * @file sha256.cpp
 * @brief SHA-256 implementation (standalone, no external dependency)
 *
 * Backs the built-in "SHA-256" entry of the digest registry, so the default
 * algorithm never depends on a crypto library at runtime.
 */

#include "canonhash/common.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <cstring>
#include <ranges>
#include <span>

namespace canonhash::common {

namespace {

constexpr std::size_t kBlockSize = 64;

// Round constants: first 32 bits of the fractional parts of the cube roots
// of the first 64 primes.
constexpr std::array<std::uint32_t, 64> kRound = {{
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
}};

constexpr std::array<std::uint32_t, 8> kInitialState = {{
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a, 0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
}};

[[nodiscard]] constexpr std::uint32_t ch(std::uint32_t x, std::uint32_t y, std::uint32_t z) noexcept
{
    return (x & y) ^ (~x & z);
}

[[nodiscard]] constexpr std::uint32_t maj(std::uint32_t x, std::uint32_t y, std::uint32_t z) noexcept
{
    return (x & y) ^ (x & z) ^ (y & z);
}

[[nodiscard]] constexpr std::uint32_t big_sigma0(std::uint32_t x) noexcept
{
    return std::rotr(x, 2) ^ std::rotr(x, 13) ^ std::rotr(x, 22);
}

[[nodiscard]] constexpr std::uint32_t big_sigma1(std::uint32_t x) noexcept
{
    return std::rotr(x, 6) ^ std::rotr(x, 11) ^ std::rotr(x, 25);
}

[[nodiscard]] constexpr std::uint32_t small_sigma0(std::uint32_t x) noexcept
{
    return std::rotr(x, 7) ^ std::rotr(x, 18) ^ (x >> 3U);
}

[[nodiscard]] constexpr std::uint32_t small_sigma1(std::uint32_t x) noexcept
{
    return std::rotr(x, 17) ^ std::rotr(x, 19) ^ (x >> 10U);
}

[[nodiscard]] std::uint32_t load_be32(const std::uint8_t* src) noexcept
{
    std::uint32_t value{};
    std::memcpy(&value, src, sizeof(value));
    if constexpr (std::endian::native == std::endian::little) {
        return std::byteswap(value);
    } else {
        return value;
    }
}

class Sha256
{
public:
    void update(std::span<const std::uint8_t> data)
    {
        m_total_bytes += data.size();

        if (m_pending > 0) {
            const std::size_t take = std::min(kBlockSize - m_pending, data.size());
            std::memcpy(m_block.data() + m_pending, data.data(), take);
            m_pending += take;
            data = data.subspan(take);
            if (m_pending < kBlockSize) {
                return;
            }
            compress(m_block.data());
            m_pending = 0;
        }

        while (data.size() >= kBlockSize) {
            compress(data.data());
            data = data.subspan(kBlockSize);
        }

        if (!data.empty()) {
            std::memcpy(m_block.data(), data.data(), data.size());
            m_pending = data.size();
        }
    }

    [[nodiscard]] std::array<std::uint8_t, kSha256DigestSize> finalize()
    {
        const std::uint64_t total_bits = static_cast<std::uint64_t>(m_total_bytes) * 8U;

        m_block[m_pending++] = 0x80;
        if (m_pending > kBlockSize - 8) {
            std::fill(m_block.begin() + static_cast<std::ptrdiff_t>(m_pending), m_block.end(), 0);
            compress(m_block.data());
            m_pending = 0;
        }
        std::fill(m_block.begin() + static_cast<std::ptrdiff_t>(m_pending),
                  m_block.begin() + static_cast<std::ptrdiff_t>(kBlockSize - 8),
                  0);

        // Message length in bits, big-endian
        for (auto i : std::views::iota(0uz, 8uz)) {
            m_block[kBlockSize - 1 - i] = static_cast<std::uint8_t>(total_bits >> (i * 8U));
        }
        compress(m_block.data());

        std::array<std::uint8_t, kSha256DigestSize> digest{};
        for (auto [i, word] : std::views::enumerate(m_state)) {
            const auto idx = static_cast<std::size_t>(i) * 4uz;
            digest[idx + 0uz] = static_cast<std::uint8_t>(word >> 24);
            digest[idx + 1uz] = static_cast<std::uint8_t>(word >> 16);
            digest[idx + 2uz] = static_cast<std::uint8_t>(word >> 8);
            digest[idx + 3uz] = static_cast<std::uint8_t>(word);
        }
        return digest;
    }

private:
    void compress(const std::uint8_t* block)
    {
        std::array<std::uint32_t, 64> schedule{};
        for (auto i : std::views::iota(0uz, 16uz)) {
            schedule[i] = load_be32(block + i * 4uz);
        }
        for (auto i : std::views::iota(16uz, 64uz)) {
            schedule[i] = small_sigma1(schedule[i - 2]) + schedule[i - 7]
                          + small_sigma0(schedule[i - 15]) + schedule[i - 16];
        }

        auto [a, b, c, d, e, f, g, h] = m_state;
        for (auto i : std::views::iota(0uz, 64uz)) {
            const std::uint32_t t1 = h + big_sigma1(e) + ch(e, f, g) + kRound[i] + schedule[i];
            const std::uint32_t t2 = big_sigma0(a) + maj(a, b, c);
            h = g;
            g = f;
            f = e;
            e = d + t1;
            d = c;
            c = b;
            b = a;
            a = t1 + t2;
        }

        m_state[0] += a;
        m_state[1] += b;
        m_state[2] += c;
        m_state[3] += d;
        m_state[4] += e;
        m_state[5] += f;
        m_state[6] += g;
        m_state[7] += h;
    }

    std::array<std::uint32_t, 8> m_state = kInitialState;
    std::array<std::uint8_t, kBlockSize> m_block{};
    std::size_t m_pending = 0;
    std::size_t m_total_bytes = 0;
};

}  // namespace

std::array<std::uint8_t, kSha256DigestSize> sha256_digest(std::span<const std::uint8_t> data)
{
    Sha256 hasher;
    hasher.update(data);
    return hasher.finalize();
}

std::string sha256(std::string_view data)
{
    return to_hex(sha256_digest(as_bytes(data)));
}

}  // namespace canonhash::common
