/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "bcx/crypto/sha256.hpp"
#include "bcx/util/hex.hpp"
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace bcx::crypto;
using bcx::util::from_hex;

void test_sha256d_empty() {
    std::cout << "Testing SHA256d on empty input..." << std::endl;

    std::vector<uint8_t> input;
    Digest256 hash = sha256d(input);

    // SHA256("") = e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855
    // SHA256(e3b0c442...) = 5df6e0e2761359d30a8275058e299fcc0381534545f55cf43e41983f5d4c9456
    assert(hash.hex() == "5df6e0e2761359d30a8275058e299fcc0381534545f55cf43e41983f5d4c9456");
    std::cout << "  ✓ Empty input test passed" << std::endl;
}

void test_sha256d_chain() {
    std::cout << "Testing SHA256d equals two chained SHA256 calls..." << std::endl;

    std::string input_str = "hello world";
    std::vector<uint8_t> input(input_str.begin(), input_str.end());

    auto first = sha256(input);
    assert(first.hex() == "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");

    auto first_bytes = first.bytes();
    assert(sha256(first_bytes.data(), first_bytes.size()) == sha256d(input));
    assert(sha256d(input).hex() == "bc62d4b80d9e36da29c16c5d4d9f11731f36052c72401a76c23c0fb5a9b74423");
    std::cout << "  ✓ Chain test passed" << std::endl;
}

void test_sha256d_header_record() {
    std::cout << "Testing SHA256d on an 80-byte header record..." << std::endl;

    // Block 125552, hashed as an opaque byte record
    std::vector<uint8_t> header = from_hex(
        "0100000081cd02ab7e569e8bcd9317e2fe99f2de44d49ab2b8851ba4a308000000000000"
        "e320b6c2fffc8d750423db8b1eb942ae710e951ed797f7affc8892b0f1fc122b"
        "c7f5d74df2b9441a42a14695");
    assert(header.size() == 80);

    assert(sha256d(header).hex() == "1dbd981fe6985776b644b173a4d0385ddc1aa2a829688d1e0000000000000000");
    std::cout << "  ✓ Header record test passed" << std::endl;
}

void test_sha256d_large_input() {
    std::cout << "Testing SHA256d on large input..." << std::endl;

    std::vector<uint8_t> input(1024);
    for (size_t i = 0; i < input.size(); i++) {
        input[i] = static_cast<uint8_t>(i & 0xFF);
    }

    Digest256 hash = sha256d(input);
    assert(hash.bytes().size() == 32);
    assert(hash == sha256d(input));

    std::cout << "  ✓ Large input test passed" << std::endl;
}

int main() {
    std::cout << "\n=== SHA256d Smoke Tests ===" << std::endl;

    try {
        test_sha256d_empty();
        test_sha256d_chain();
        test_sha256d_header_record();
        test_sha256d_large_input();

        std::cout << "\n✅ All SHA256d tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed: " << e.what() << std::endl;
        return 1;
    }
}
