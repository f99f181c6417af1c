/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "bcx/crypto/sha256.hpp"
#include "bcx/errors.hpp"
#include "bcx/util/endian.hpp"
#include "bcx/util/hex.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace bcx {
namespace crypto {

namespace {

// First 32 bits of the fractional parts of the square roots of the first 8 primes.
constexpr std::array<std::uint32_t, 8> kInitialState = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
    0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19,
};

// First 32 bits of the fractional parts of the cube roots of the first 64 primes.
constexpr std::array<std::uint32_t, 64> kRoundConstants = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2,
};

// 0x80 marker plus the 64-bit length field.
constexpr std::size_t kMinPadding = 9;

inline std::uint32_t rotr(std::uint32_t x, unsigned n) {
    return (x >> n) | (x << (32 - n));
}

inline std::uint32_t small_sigma0(std::uint32_t x) { return rotr(x, 7) ^ rotr(x, 18) ^ (x >> 3); }
inline std::uint32_t small_sigma1(std::uint32_t x) { return rotr(x, 17) ^ rotr(x, 19) ^ (x >> 10); }
inline std::uint32_t big_sigma0(std::uint32_t x) { return rotr(x, 2) ^ rotr(x, 13) ^ rotr(x, 22); }
inline std::uint32_t big_sigma1(std::uint32_t x) { return rotr(x, 6) ^ rotr(x, 11) ^ rotr(x, 25); }

} // namespace

namespace detail {

std::size_t padded_blocks(std::size_t len) {
    std::size_t room = kBlockSize - (len % kBlockSize);
    std::size_t tail_blocks = room < kMinPadding ? 2 : 1;
    return len / kBlockSize + tail_blocks;
}

std::vector<std::uint8_t> pad_tail(const std::uint8_t* tail, std::size_t tail_len,
                                   std::uint64_t message_len) {
    std::size_t pad = kBlockSize - tail_len;
    if (pad < kMinPadding) {
        pad += kBlockSize;
    }

    std::vector<std::uint8_t> out(tail_len + pad, 0);
    std::copy(tail, tail + tail_len, out.begin());
    out[tail_len] = 0x80;

    std::uint64_t bits = message_len * 8;
    std::uint8_t* end = out.data() + out.size() - 8;
    util::store_be32(end, static_cast<std::uint32_t>(bits >> 32));
    util::store_be32(end + 4, static_cast<std::uint32_t>(bits));
    return out;
}

void compress(std::array<std::uint32_t, 8>& state, const std::uint8_t* block) {
    // Message schedule
    std::array<std::uint32_t, 64> w;
    for (std::size_t i = 0; i < 16; ++i) {
        w[i] = util::load_be32(block + 4 * i);
    }
    for (std::size_t i = 16; i < 64; ++i) {
        w[i] = w[i - 16] + small_sigma0(w[i - 15]) + w[i - 7] + small_sigma1(w[i - 2]);
    }

    std::uint32_t a = state[0];
    std::uint32_t b = state[1];
    std::uint32_t c = state[2];
    std::uint32_t d = state[3];
    std::uint32_t e = state[4];
    std::uint32_t f = state[5];
    std::uint32_t g = state[6];
    std::uint32_t h = state[7];

    for (std::size_t i = 0; i < 64; ++i) {
        std::uint32_t ch = (e & f) ^ (~e & g);
        std::uint32_t t1 = h + big_sigma1(e) + ch + kRoundConstants[i] + w[i];
        std::uint32_t maj = (a & b) ^ (a & c) ^ (b & c);
        std::uint32_t t2 = big_sigma0(a) + maj;

        h = g;
        g = f;
        f = e;
        e = d + t1;
        d = c;
        c = b;
        b = a;
        a = t1 + t2;
    }

    state[0] += a;
    state[1] += b;
    state[2] += c;
    state[3] += d;
    state[4] += e;
    state[5] += f;
    state[6] += g;
    state[7] += h;
}

} // namespace detail

std::array<std::uint8_t, kDigestSize> Digest256::bytes() const {
    return util::words_to_bytes(words);
}

std::string Digest256::hex() const {
    auto b = bytes();
    return util::to_hex(b.data(), b.size());
}

Digest256 Digest256::from_hex(std::string_view hex) {
    if (hex.size() != 2 * kDigestSize) {
        throw DecodeError(fmt::format("digest hex must be {} characters, got {}",
                                      2 * kDigestSize, hex.size()));
    }
    std::vector<std::uint8_t> raw = util::from_hex(hex);
    std::array<std::uint8_t, kDigestSize> b{};
    std::copy(raw.begin(), raw.end(), b.begin());
    return from_bytes(b);
}

Digest256 Digest256::from_bytes(const std::array<std::uint8_t, kDigestSize>& bytes) {
    Digest256 out;
    out.words = util::bytes_to_words(bytes);
    return out;
}

Digest256 sha256(const std::uint8_t* data, std::size_t len) {
    Digest256 out;
    out.words = kInitialState;

    // Whole blocks straight from the caller's buffer.
    std::size_t full = len / kBlockSize;
    for (std::size_t i = 0; i < full; ++i) {
        detail::compress(out.words, data + i * kBlockSize);
    }

    std::size_t tail_len = len - full * kBlockSize;
    std::vector<std::uint8_t> tail = detail::pad_tail(data + full * kBlockSize, tail_len, len);
    for (std::size_t off = 0; off < tail.size(); off += kBlockSize) {
        detail::compress(out.words, tail.data() + off);
    }
    return out;
}

Digest256 sha256(const std::vector<std::uint8_t>& data) {
    return sha256(data.data(), data.size());
}

Digest256 sha256(std::string_view data) {
    return sha256(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
}

Digest256 sha256d(const std::uint8_t* data, std::size_t len) {
    auto first = sha256(data, len).bytes();
    return sha256(first.data(), first.size());
}

Digest256 sha256d(const std::vector<std::uint8_t>& data) {
    return sha256d(data.data(), data.size());
}

} // namespace crypto
} // namespace bcx
