/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "bcx/crypto/difficulty.hpp"

#include <algorithm>

namespace bcx {
namespace crypto {

std::array<std::uint8_t, 32> compact_to_target(std::uint32_t bits) {
    // bits = 0xEEMMMMMM where EE is the byte length and MMMMMM the mantissa
    int exponent = static_cast<int>((bits >> 24) & 0xFF);
    std::uint32_t mantissa = bits & 0x007FFFFF;

    std::array<std::uint8_t, 32> target{};

    // Sign bit set means a negative target; nothing can meet it.
    if (bits & 0x00800000) {
        return target;
    }

    // Mantissa byte i (0 = most significant) lands at 32 - exponent + i.
    for (int i = 0; i < 3; ++i) {
        int pos = 32 - exponent + i;
        if (pos < 0 || pos >= 32) continue;
        target[pos] = static_cast<std::uint8_t>(mantissa >> (8 * (2 - i)));
    }

    return target;
}

bool meets_target(const Digest256& pow_hash, std::uint32_t bits) {
    auto hash = pow_hash.bytes();
    // Digest bytes are little-endian as a number; compare most significant first.
    std::reverse(hash.begin(), hash.end());
    auto target = compact_to_target(bits);

    for (std::size_t i = 0; i < 32; ++i) {
        if (hash[i] < target[i]) return true;
        if (hash[i] > target[i]) return false;
    }
    // Equal to the target still meets it.
    return true;
}

} // namespace crypto
} // namespace bcx
