#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace bcx::config {

// Header fields for the mining driver. Defaults describe block 125552.
struct HeaderConfig {
    std::uint32_t version{1};
    std::string prev{"81cd02ab7e569e8bcd9317e2fe99f2de44d49ab2b8851ba4a308000000000000"};
    std::string merkle{"e320b6c2fffc8d750423db8b1eb942ae710e951ed797f7affc8892b0f1fc122b"};
    std::uint32_t time{1305998791};  // 2011-05-21 10:26:31 America/Los_Angeles
    std::uint32_t bits{440711666};
    std::uint32_t nonce{2504433986};
};

// Raw values from the command line; applied last, on top of file and env.
struct HeaderOverrides {
    std::optional<std::string> version;
    std::optional<std::string> prev;
    std::optional<std::string> merkle;
    std::optional<std::string> time;
    std::optional<std::string> bits;
    std::optional<std::string> nonce;
};

struct ParseResult {
    bool ok{false};        // false on argument errors
    bool show_only{false}; // true if --help/--version was printed
    bool debug{false};     // true if --debug was passed on CLI
    std::string config_path{"header.conf"};
    HeaderOverrides overrides;
    std::optional<std::string> sha256_text;     // --sha256: hash text and exit
    std::optional<std::string> base58_hex;      // --base58: encode hex payload and exit
    std::optional<std::string> base58_decode;   // --base58-decode: decode text and exit
};

} // namespace bcx::config
