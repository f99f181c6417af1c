/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace bcx::crypto {

constexpr std::size_t kDigestSize = 32;
constexpr std::size_t kBlockSize = 64;

/**
 * SHA-256 output or chaining value: 8 words, serialized big-endian per word.
 */
struct Digest256 {
    std::array<std::uint32_t, 8> words{};

    std::array<std::uint8_t, kDigestSize> bytes() const;
    std::string hex() const;

    /**
     * Parse 64 hex characters (case-insensitive).
     * @throws bcx::DecodeError if the text is not hex or not exactly 32 bytes
     */
    static Digest256 from_hex(std::string_view hex);
    static Digest256 from_bytes(const std::array<std::uint8_t, kDigestSize>& bytes);

    bool operator==(const Digest256& other) const { return words == other.words; }
    bool operator!=(const Digest256& other) const { return words != other.words; }
};

/**
 * Compute SHA-256 of a complete buffer. Never fails; the input is not modified.
 */
Digest256 sha256(const std::uint8_t* data, std::size_t len);
Digest256 sha256(const std::vector<std::uint8_t>& data);
Digest256 sha256(std::string_view data);

/**
 * Double SHA-256: sha256(sha256(data).bytes()), the proof-of-work hash.
 */
Digest256 sha256d(const std::uint8_t* data, std::size_t len);
Digest256 sha256d(const std::vector<std::uint8_t>& data);

namespace detail {

// Number of 64-byte blocks a message of `len` bytes occupies after padding.
std::size_t padded_blocks(std::size_t len);

// Builds the final padded block(s): the `tail_len` (< 64) trailing message
// bytes, 0x80, zeros, then the big-endian bit length of the whole message.
// The result is 64 or 128 bytes long.
std::vector<std::uint8_t> pad_tail(const std::uint8_t* tail, std::size_t tail_len,
                                   std::uint64_t message_len);

// One SHA-256 compression of a 64-byte block into `state`.
void compress(std::array<std::uint32_t, 8>& state, const std::uint8_t* block);

} // namespace detail

} // namespace bcx::crypto
