#include "bcx/encoding/base58.hpp"
#include "bcx/errors.hpp"

#include <array>

#include <fmt/format.h>

namespace bcx::encoding {

namespace {

constexpr unsigned kRadix = 58;

constexpr std::array<std::int8_t, 128> make_reverse_alphabet() {
    std::array<std::int8_t, 128> rev{};
    for (auto& v : rev) v = -1;
    for (std::size_t i = 0; i < Base58::kAlphabet.size(); ++i) {
        rev[static_cast<unsigned char>(Base58::kAlphabet[i])] = static_cast<std::int8_t>(i);
    }
    return rev;
}

// Symbol to digit value, -1 for characters outside the alphabet.
constexpr std::array<std::int8_t, 128> kReverseAlphabet = make_reverse_alphabet();

} // namespace

// Encodes bytes as Base58.
//
// The input is a big-endian number. Each byte is pushed into a base-58 digit
// buffer as a carry (digit * 256 + carry), walking from the least significant
// digit up past the highest digit written so far. Leading zero bytes are
// skipped here and emitted as '1' characters instead.
std::string Base58::encode(const std::uint8_t* data, std::size_t len) {
    std::size_t zeroes = 0;
    while (zeroes < len && data[zeroes] == 0) {
        ++zeroes;
    }

    // log(256) / log(58) = 1.365..
    std::vector<std::uint8_t> digits((len - zeroes) * 137 / 100 + 1, 0);
    // digits[high..] hold the value so far
    std::size_t high = digits.size();

    for (std::size_t i = zeroes; i < len; ++i) {
        unsigned carry = data[i];
        std::size_t j = digits.size();
        // Buffer sizing guarantees carry is exhausted before index 0.
        while ((j > high || carry != 0) && j > 0) {
            --j;
            carry += static_cast<unsigned>(digits[j]) << 8;
            digits[j] = static_cast<std::uint8_t>(carry % kRadix);
            carry /= kRadix;
        }
        high = j;
    }

    // Unused upper capacity, not real zero digits.
    std::size_t first = 0;
    while (first < digits.size() && digits[first] == 0) {
        ++first;
    }

    std::string result;
    result.reserve(zeroes + digits.size() - first);
    result.assign(zeroes, kAlphabet[0]);
    for (std::size_t i = first; i < digits.size(); ++i) {
        result.push_back(kAlphabet[digits[i]]);
    }
    return result;
}

std::string Base58::encode(const std::vector<std::uint8_t>& data) {
    return encode(data.data(), data.size());
}

// Decodes Base58 text.
//
// Mirror image of encode: every symbol multiplies the byte buffer by 58 and
// adds its digit value. Leading '1' symbols come back as leading zero bytes.
std::vector<std::uint8_t> Base58::decode(std::string_view encoded) {
    if (encoded.empty()) {
        throw InputError("base58: no input");
    }

    std::size_t ones = 0;
    while (ones < encoded.size() && encoded[ones] == kAlphabet[0]) {
        ++ones;
    }

    // log(58) / log(256) = 0.732..
    std::vector<std::uint8_t> bytes((encoded.size() - ones) * 733 / 1000 + 1, 0);
    std::size_t high = bytes.size();

    for (std::size_t i = ones; i < encoded.size(); ++i) {
        auto c = static_cast<unsigned char>(encoded[i]);
        int digit = c < kReverseAlphabet.size() ? kReverseAlphabet[c] : -1;
        if (digit < 0) {
            throw InputError(fmt::format("base58: invalid character 0x{:02x} at offset {}", c, i));
        }

        unsigned carry = static_cast<unsigned>(digit);
        std::size_t j = bytes.size();
        while ((j > high || carry != 0) && j > 0) {
            --j;
            carry += static_cast<unsigned>(bytes[j]) * kRadix;
            bytes[j] = static_cast<std::uint8_t>(carry & 0xFF);
            carry >>= 8;
        }
        high = j;
    }

    std::size_t first = 0;
    while (first < bytes.size() && bytes[first] == 0) {
        ++first;
    }

    std::vector<std::uint8_t> result(ones, 0);
    result.insert(result.end(), bytes.begin() + static_cast<std::ptrdiff_t>(first), bytes.end());
    return result;
}

} // namespace bcx::encoding
