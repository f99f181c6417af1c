/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include "bcx/crypto/sha256.hpp"

namespace bcx::block {

/*
 * Block header, serialized as 80 bytes:
 *
 *   [0..4)    version       little-endian
 *   [4..36)   prev hash     Digest256 bytes
 *   [36..68)  merkle root   Digest256 bytes
 *   [68..72)  time          little-endian, unix epoch seconds
 *   [72..76)  bits          little-endian, compact target
 *   [76..80)  nonce         little-endian
 */
struct BlockHeader {
    static constexpr std::size_t kSize = 80;

    std::uint32_t version{1};
    crypto::Digest256 prev;
    crypto::Digest256 merkle;
    std::uint32_t time{0};
    std::uint32_t bits{0};
    std::uint32_t nonce{0};

    std::array<std::uint8_t, kSize> serialize() const;

    // Double SHA-256 of the serialized header.
    crypto::Digest256 pow_hash() const;

    // Proof-of-work hash in display order (byte-reversed hex), as block explorers show it.
    std::string block_hash_hex() const;

    // True if pow_hash() satisfies the header's own compact target.
    bool meets_target() const;
};

} // namespace bcx::block
