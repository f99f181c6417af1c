// Copyright (c) 2025 The bcx Authors. All rights reserved.
// Use of this source code is governed by a GPL-3.0-style license that can be
// found in the LICENSE file.

#ifndef BCX_UTIL_ENDIAN_HPP_
#define BCX_UTIL_ENDIAN_HPP_

#include <array>
#include <cstddef>
#include <cstdint>

namespace bcx::util {

// Reads a big-endian 32-bit word from 4 bytes.
inline std::uint32_t load_be32(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0]) << 24) |
           (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) |
           static_cast<std::uint32_t>(p[3]);
}

inline void store_be32(std::uint8_t* p, std::uint32_t v) {
    p[0] = static_cast<std::uint8_t>(v >> 24);
    p[1] = static_cast<std::uint8_t>(v >> 16);
    p[2] = static_cast<std::uint8_t>(v >> 8);
    p[3] = static_cast<std::uint8_t>(v);
}

// Header integers (version, time, bits, nonce) are serialized little-endian.
inline void store_le32(std::uint8_t* p, std::uint32_t v) {
    p[0] = static_cast<std::uint8_t>(v);
    p[1] = static_cast<std::uint8_t>(v >> 8);
    p[2] = static_cast<std::uint8_t>(v >> 16);
    p[3] = static_cast<std::uint8_t>(v >> 24);
}

// Serializes N words as 4*N bytes, each word big-endian.
// The output size is part of the type, so no length check is needed.
template <std::size_t N>
std::array<std::uint8_t, 4 * N> words_to_bytes(const std::array<std::uint32_t, N>& src) {
    std::array<std::uint8_t, 4 * N> out{};
    for (std::size_t i = 0; i < N; ++i) {
        store_be32(out.data() + 4 * i, src[i]);
    }
    return out;
}

// Inverse of words_to_bytes. N must be a multiple of 4.
template <std::size_t N>
std::array<std::uint32_t, N / 4> bytes_to_words(const std::array<std::uint8_t, N>& src) {
    static_assert(N % 4 == 0, "byte count must be a whole number of words");
    std::array<std::uint32_t, N / 4> out{};
    for (std::size_t i = 0; i < N / 4; ++i) {
        out[i] = load_be32(src.data() + 4 * i);
    }
    return out;
}

} // namespace bcx::util

#endif // BCX_UTIL_ENDIAN_HPP_
