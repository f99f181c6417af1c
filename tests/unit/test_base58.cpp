/*
 * Unit tests for Base58 encoding
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <bcx/encoding/base58.hpp>
#include <bcx/errors.hpp>
#include <bcx/util/hex.hpp>

#include <random>
#include <string>
#include <vector>

using bcx::encoding::Base58;
using bcx::util::from_hex;

TEST_SUITE("Base58 encode") {
    TEST_CASE("empty and zero inputs") {
        CHECK(Base58::encode(std::vector<std::uint8_t>{}) == "");
        CHECK(Base58::encode(std::vector<std::uint8_t>{0x00}) == "1");
        CHECK(Base58::encode(std::vector<std::uint8_t>{0x00, 0x00, 0x00}) == "111");
        CHECK(Base58::encode(std::vector<std::uint8_t>(10, 0x00)) == "1111111111");
    }

    TEST_CASE("leading zero bytes are not absorbed") {
        CHECK(Base58::encode(std::vector<std::uint8_t>{0x01}) == "2");
        CHECK(Base58::encode(std::vector<std::uint8_t>{0x00, 0x01}) == "12");
        CHECK(Base58::encode(std::vector<std::uint8_t>{0x00, 0x00, 0x01}) == "112");
    }

    TEST_CASE("digit boundaries") {
        CHECK(Base58::encode(std::vector<std::uint8_t>{57}) == "z");
        CHECK(Base58::encode(std::vector<std::uint8_t>{58}) == "21");
        CHECK(Base58::encode(std::vector<std::uint8_t>{0xff}) == "5Q");
    }

    TEST_CASE("reference vectors") {
        CHECK(Base58::encode(from_hex("61")) == "2g");
        CHECK(Base58::encode(from_hex("626262")) == "a3gV");
        CHECK(Base58::encode(from_hex("636363")) == "aPEr");
        CHECK(Base58::encode(from_hex("73696d706c792061206c6f6e6720737472696e67")) == "2cFupjhnEsSn59qHXstmK2ffpLv2");
        CHECK(Base58::encode(from_hex("00eb15231dfceb60925886b67d065299925915aeb172c06647")) == "1NS17iag9jJgTHD1VXjvLCEnZuQ3rJDE9L");
        CHECK(Base58::encode(from_hex("516b6fcd0f")) == "ABnLTmg");
        CHECK(Base58::encode(from_hex("bf4f89001e670274dd")) == "3SEo3LWLoPntC");
        CHECK(Base58::encode(from_hex("572e4794")) == "3EFU7m");
        CHECK(Base58::encode(from_hex("ecac89cad93923c02321")) == "EJDM8drfXA6uyA");
        CHECK(Base58::encode(from_hex("10c8511e")) == "Rt5zm");
    }

    TEST_CASE("full alphabet") {
        auto payload = from_hex("000111d38e5fc9071ffcd20b4a763cc9ae4f252bb4e48fd66a835e252ada93ff480d6dd43dc62a641155a5");
        CHECK(Base58::encode(payload) == std::string(Base58::kAlphabet));
    }
}

TEST_SUITE("Base58 decode") {
    TEST_CASE("empty input is an InputError") {
        CHECK_THROWS_AS(Base58::decode(""), bcx::InputError);
    }

    TEST_CASE("characters outside the alphabet") {
        CHECK_THROWS_AS(Base58::decode("0"), bcx::InputError);
        CHECK_THROWS_AS(Base58::decode("O"), bcx::InputError);
        CHECK_THROWS_AS(Base58::decode("I"), bcx::InputError);
        CHECK_THROWS_AS(Base58::decode("l"), bcx::InputError);
        CHECK_THROWS_AS(Base58::decode("3SEo3L WLoPntC"), bcx::InputError);
        CHECK_THROWS_AS(Base58::decode("abc\xff"), bcx::InputError);
    }

    TEST_CASE("reference vectors") {
        CHECK(Base58::decode("1") == std::vector<std::uint8_t>{0x00});
        CHECK(Base58::decode("111") == std::vector<std::uint8_t>{0x00, 0x00, 0x00});
        CHECK(Base58::decode("12") == std::vector<std::uint8_t>{0x00, 0x01});
        CHECK(Base58::decode("21") == std::vector<std::uint8_t>{58});
        CHECK(Base58::decode("2g") == from_hex("61"));
        CHECK(Base58::decode("1NS17iag9jJgTHD1VXjvLCEnZuQ3rJDE9L") == from_hex("00eb15231dfceb60925886b67d065299925915aeb172c06647"));
        CHECK(Base58::decode("3SEo3LWLoPntC") == from_hex("bf4f89001e670274dd"));
    }

    TEST_CASE("decode inverts encode") {
        std::mt19937 rng(125552);
        std::uniform_int_distribution<std::size_t> len_dist(0, 96);
        std::uniform_int_distribution<int> byte_dist(0, 255);
        std::uniform_int_distribution<std::size_t> zero_dist(0, 4);

        for (int iter = 0; iter < 500; ++iter) {
            std::vector<std::uint8_t> data(zero_dist(rng), 0x00);
            std::size_t n = len_dist(rng);
            for (std::size_t i = 0; i < n; ++i) data.push_back(static_cast<std::uint8_t>(byte_dist(rng)));
            if (data.empty()) continue;

            std::string text = Base58::encode(data);
            if (Base58::decode(text) != data) {
                FAIL("round trip failed for " << bcx::util::to_hex(data));
            }
        }
    }
}
