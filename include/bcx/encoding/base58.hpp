#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace bcx::encoding {

// Base58 is the binary-to-text encoding used for Bitcoin addresses. The
// alphabet leaves out the look-alike characters 0, O, I and l. Leading zero
// bytes are carried as leading '1' symbols rather than folded into the number.
//
// Plain Base58 only: no version byte, no checksum.
class Base58 {
public:
    static constexpr std::string_view kAlphabet =
        "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

    // Encodes bytes as Base58 text. Empty input gives an empty string.
    static std::string encode(const std::uint8_t* data, std::size_t len);
    static std::string encode(const std::vector<std::uint8_t>& data);

    // Decodes Base58 text back into the exact original bytes.
    // Throws bcx::InputError on empty input or a character outside the alphabet.
    static std::vector<std::uint8_t> decode(std::string_view encoded);

private:
    Base58() = delete;
};

} // namespace bcx::encoding
