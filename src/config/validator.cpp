#include <bcx/config/validator.hpp>

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

#include <bcx/crypto/sha256.hpp>
#include <bcx/errors.hpp>

namespace bcx::config {

bool parse_u32(const std::string& text, std::uint32_t& out, std::string& err) {
    if (text.empty()) { err = "empty number"; return false; }

    std::string digits = text;
    int base = 10;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
        base = 16;
    }
    auto valid = [base](unsigned char c) { return base == 16 ? std::isxdigit(c) != 0 : std::isdigit(c) != 0; };
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(), valid)) {
        err = "'" + text + "' is not a number"; return false; }

    unsigned long long v = 0;
    try { v = std::stoull(digits, nullptr, base); }
    catch (const std::out_of_range&) { err = "'" + text + "' does not fit in 32 bits"; return false; }
    if (v > std::numeric_limits<std::uint32_t>::max()) {
        err = "'" + text + "' does not fit in 32 bits"; return false; }

    out = static_cast<std::uint32_t>(v);
    return true;
}

bool is_valid_digest_hex(const std::string& text, std::string& err) {
    try {
        crypto::Digest256::from_hex(text);
    } catch (const DecodeError& e) {
        err = e.what();
        return false;
    }
    return true;
}

} // namespace bcx::config
