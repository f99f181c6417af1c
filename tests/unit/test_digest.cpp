/*
 * Unit tests for Digest256 and byte helpers
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <bcx/crypto/sha256.hpp>
#include <bcx/errors.hpp>
#include <bcx/util/endian.hpp>
#include <bcx/util/hex.hpp>

#include <string>
#include <vector>

using namespace bcx;
using bcx::crypto::Digest256;

TEST_SUITE("Digest256") {
    TEST_CASE("from_hex - words are big-endian") {
        auto d = Digest256::from_hex("81cd02ab7e569e8bcd9317e2fe99f2de44d49ab2b8851ba4a308000000000000");
        CHECK(d.words[0] == 0x81cd02abu);
        CHECK(d.words[1] == 0x7e569e8bu);
        CHECK(d.words[6] == 0x00000000u);

        auto b = d.bytes();
        CHECK(b[0] == 0x81);
        CHECK(b[3] == 0xab);
        CHECK(b[29] == 0x00);
        CHECK(d.hex() == "81cd02ab7e569e8bcd9317e2fe99f2de44d49ab2b8851ba4a308000000000000");
    }

    TEST_CASE("from_hex - case-insensitive") {
        auto lower = Digest256::from_hex("e320b6c2fffc8d750423db8b1eb942ae710e951ed797f7affc8892b0f1fc122b");
        auto upper = Digest256::from_hex("E320B6C2FFFC8D750423DB8B1EB942AE710E951ED797F7AFFC8892B0F1FC122B");
        CHECK(lower == upper);
    }

    TEST_CASE("from_hex - wrong length") {
        CHECK_THROWS_AS(Digest256::from_hex(""), DecodeError);
        CHECK_THROWS_AS(Digest256::from_hex("e3b0c442"), DecodeError);
        // 63 and 66 characters
        CHECK_THROWS_AS(Digest256::from_hex(std::string(63, 'a')), DecodeError);
        CHECK_THROWS_AS(Digest256::from_hex(std::string(66, 'a')), DecodeError);
    }

    TEST_CASE("from_hex - non-hex character") {
        std::string bad(64, '0');
        bad[10] = 'g';
        CHECK_THROWS_AS(Digest256::from_hex(bad), DecodeError);
        bad[10] = ' ';
        try {
            Digest256::from_hex(bad);
            FAIL("expected DecodeError");
        } catch (const DecodeError& e) {
            CHECK(std::string(e.what()).find("offset 10") != std::string::npos);
        }
    }

    TEST_CASE("DecodeError is a bcx::Error") {
        CHECK_THROWS_AS(Digest256::from_hex("zz"), Error);
    }

    TEST_CASE("from_bytes inverts bytes") {
        auto d = crypto::sha256("abc");
        CHECK(Digest256::from_bytes(d.bytes()) == d);
    }
}

TEST_SUITE("Byte helpers") {
    TEST_CASE("word/byte conversions") {
        std::array<std::uint32_t, 2> words = {0x01020304u, 0xa0b0c0d0u};
        auto bytes = util::words_to_bytes(words);
        CHECK(bytes.size() == 8);
        CHECK(bytes[0] == 0x01);
        CHECK(bytes[3] == 0x04);
        CHECK(bytes[4] == 0xa0);
        CHECK(util::bytes_to_words(bytes) == words);
    }

    TEST_CASE("little-endian store") {
        std::uint8_t buf[4] = {};
        util::store_le32(buf, 0x4dd7f5c7u);
        CHECK(buf[0] == 0xc7);
        CHECK(buf[1] == 0xf5);
        CHECK(buf[2] == 0xd7);
        CHECK(buf[3] == 0x4d);
    }

    TEST_CASE("hex round trip and errors") {
        std::vector<std::uint8_t> expected = {0xde, 0xad, 0xbe, 0xef};
        CHECK(util::from_hex("deadbeef") == expected);
        CHECK(util::from_hex("DeAdBeEf") == expected);
        CHECK(util::to_hex(expected) == "deadbeef");
        CHECK(util::from_hex("").empty());
        CHECK_THROWS_AS(util::from_hex("abc"), DecodeError);
        CHECK_THROWS_AS(util::from_hex("0x12"), DecodeError);
    }

    TEST_CASE("dumps") {
        std::vector<std::uint8_t> bytes = {0x00, 0x01, 0xff};
        CHECK(util::dump8(bytes.data(), bytes.size()) == "00 01 ff (3)");
        CHECK(util::dump8(nullptr, 0) == "(0)");

        std::uint32_t words[2] = {0x6a09e667u, 0x1u};
        CHECK(util::dump32(words, 2) == "6a09e667 00000001 (2)");
    }
}
