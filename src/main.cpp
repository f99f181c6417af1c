/*
 * bcx-mine: checks the proof-of-work of one block header
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <string>
#include <vector>

#include <fmt/core.h>

#include <bcx/block/header.hpp>
#include <bcx/cli/args.hpp>
#include <bcx/config/loader.hpp>
#include <bcx/crypto/sha256.hpp>
#include <bcx/encoding/base58.hpp>
#include <bcx/errors.hpp>
#include <bcx/logging/fmt_logger.hpp>
#include <bcx/util/hex.hpp>

namespace {

bool report(bcx::logging::Logger& log, const std::vector<std::string>& errs) {
    for (const auto& e : errs) log.error(e);
    return errs.empty();
}

// --sha256 / --base58 / --base58-decode: one-shot conversions.
int run_oneshot(const bcx::config::ParseResult& pr, bcx::logging::Logger& log) {
    try {
        if (pr.sha256_text) {
            fmt::print("{}\n", bcx::crypto::sha256(*pr.sha256_text).hex());
        } else if (pr.base58_hex) {
            auto payload = bcx::util::from_hex(*pr.base58_hex);
            fmt::print("{}\n", bcx::encoding::Base58::encode(payload));
        } else if (pr.base58_decode) {
            auto payload = bcx::encoding::Base58::decode(*pr.base58_decode);
            fmt::print("{}\n", bcx::util::to_hex(payload));
        }
    } catch (const bcx::Error& e) {
        log.error(e.what());
        return 1;
    }
    return 0;
}

int mine(const bcx::config::ParseResult& pr, bcx::logging::Logger& log) {
    bcx::config::HeaderConfig cfg;

    // defaults < config file < environment < command line
    if (!report(log, bcx::config::load_from_file(cfg, pr.config_path))) return 1;
    if (!report(log, bcx::config::apply_env_overrides(cfg))) return 1;
    if (!report(log, bcx::config::apply_overrides(cfg, pr.overrides))) return 1;
    if (!report(log, bcx::config::validate_final(cfg))) return 1;

    const bcx::block::BlockHeader header = bcx::config::to_header(cfg);
    log.debug(fmt::format("prev   : {}", header.prev.hex()));
    log.debug(fmt::format("merkle : {}", header.merkle.hex()));
    log.debug(fmt::format("bits   : 0x{:08x}", header.bits));

    fmt::print("time: {}\n", header.time);

    const auto raw = header.serialize();
    fmt::print("header: {}\n", bcx::util::dump8(raw.data(), raw.size()));

    const auto hash0 = bcx::crypto::sha256(raw.data(), raw.size()).bytes();
    fmt::print("hash0: {}\n", bcx::util::dump8(hash0.data(), hash0.size()));

    const auto hash1 = bcx::crypto::sha256(hash0.data(), hash0.size()).bytes();
    fmt::print("hash1: {}\n", bcx::util::dump8(hash1.data(), hash1.size()));

    fmt::print("block: {}\n", header.block_hash_hex());

    if (!header.meets_target()) {
        log.warn(fmt::format("hash does not meet target 0x{:08x}", header.bits));
        return 1;
    }
    log.info(fmt::format("hash meets target 0x{:08x}", header.bits));
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    bcx::logging::FmtLogger log;
    auto parsed = bcx::cli::parse(argc, argv, log);
    if (parsed.show_only) {
        return 0;
    }
    if (!parsed.ok) {
        return 1;
    }
    log.set_debug(parsed.debug);

    if (parsed.sha256_text || parsed.base58_hex || parsed.base58_decode) {
        return run_oneshot(parsed, log);
    }
    return mine(parsed, log);
}
