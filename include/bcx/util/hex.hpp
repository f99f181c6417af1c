/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace bcx::util {

// Lowercase hex, two characters per byte.
std::string to_hex(const std::uint8_t* data, std::size_t len);
std::string to_hex(const std::vector<std::uint8_t>& data);

/**
 * Decode a hex string (case-insensitive) into bytes.
 * @throws bcx::DecodeError on odd length or a non-hex character
 */
std::vector<std::uint8_t> from_hex(std::string_view hex);

// "xx xx xx (n)" rendering of a byte buffer.
std::string dump8(const std::uint8_t* data, std::size_t len);

// "xxxxxxxx xxxxxxxx (n)" rendering of a word buffer.
std::string dump32(const std::uint32_t* data, std::size_t len);

} // namespace bcx::util
