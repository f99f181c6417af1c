#pragma once

#include <array>
#include <cstdint>

#include "bcx/crypto/sha256.hpp"

namespace bcx::crypto {

// Compact target (nBits) to a 32-byte big-endian target: mantissa * 256^(exponent-3).
std::array<std::uint8_t, 32> compact_to_target(std::uint32_t bits);

// True if the proof-of-work digest, read as a little-endian 256-bit number,
// does not exceed the target encoded in `bits`.
bool meets_target(const Digest256& pow_hash, std::uint32_t bits);

} // namespace bcx::crypto
