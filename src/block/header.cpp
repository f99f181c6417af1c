/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "bcx/block/header.hpp"
#include "bcx/crypto/difficulty.hpp"
#include "bcx/util/endian.hpp"
#include "bcx/util/hex.hpp"

#include <algorithm>

namespace bcx {
namespace block {

std::array<std::uint8_t, BlockHeader::kSize> BlockHeader::serialize() const {
    std::array<std::uint8_t, kSize> out{};
    util::store_le32(out.data(), version);

    auto prev_bytes = prev.bytes();
    std::copy(prev_bytes.begin(), prev_bytes.end(), out.begin() + 4);

    auto merkle_bytes = merkle.bytes();
    std::copy(merkle_bytes.begin(), merkle_bytes.end(), out.begin() + 36);

    util::store_le32(out.data() + 68, time);
    util::store_le32(out.data() + 72, bits);
    util::store_le32(out.data() + 76, nonce);
    return out;
}

crypto::Digest256 BlockHeader::pow_hash() const {
    auto raw = serialize();
    return crypto::sha256d(raw.data(), raw.size());
}

std::string BlockHeader::block_hash_hex() const {
    auto hash = pow_hash().bytes();
    std::reverse(hash.begin(), hash.end());
    return util::to_hex(hash.data(), hash.size());
}

bool BlockHeader::meets_target() const {
    return crypto::meets_target(pow_hash(), bits);
}

} // namespace block
} // namespace bcx
