/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "bcx/util/hex.hpp"
#include "bcx/errors.hpp"

#include <iterator>

#include <fmt/format.h>

namespace bcx {
namespace util {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string to_hex(const std::uint8_t* data, std::size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[data[i] >> 4]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

std::string to_hex(const std::vector<std::uint8_t>& data) {
    return to_hex(data.data(), data.size());
}

std::vector<std::uint8_t> from_hex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        throw DecodeError(fmt::format("hex string has odd length {}", hex.size()));
    }

    std::vector<std::uint8_t> bytes;
    bytes.reserve(hex.size() / 2);

    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            std::size_t bad = hi < 0 ? i : i + 1;
            throw DecodeError(fmt::format("invalid hex character '{}' at offset {}", hex[bad], bad));
        }
        bytes.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

std::string dump8(const std::uint8_t* data, std::size_t len) {
    fmt::memory_buffer out;
    for (std::size_t i = 0; i < len; ++i) {
        fmt::format_to(std::back_inserter(out), "{:02x} ", data[i]);
    }
    fmt::format_to(std::back_inserter(out), "({})", len);
    return fmt::to_string(out);
}

std::string dump32(const std::uint32_t* data, std::size_t len) {
    fmt::memory_buffer out;
    for (std::size_t i = 0; i < len; ++i) {
        fmt::format_to(std::back_inserter(out), "{:08x} ", data[i]);
    }
    fmt::format_to(std::back_inserter(out), "({})", len);
    return fmt::to_string(out);
}

} // namespace util
} // namespace bcx
