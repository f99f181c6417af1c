#pragma once

#include <cstdint>
#include <string>

namespace bcx::config {

// Parses a 32-bit unsigned value in decimal or 0x-prefixed hex. Returns error in 'err' if invalid.
bool parse_u32(const std::string& text, std::uint32_t& out, std::string& err);

// Checks that text is a 64-character hex digest.
bool is_valid_digest_hex(const std::string& text, std::string& err);

} // namespace bcx::config
