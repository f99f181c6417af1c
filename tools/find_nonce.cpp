/*
 * Scans a nonce range for the configured header and reports the first
 * nonce whose SHA-256d meets the header's compact target.
 */

#include <cstdint>
#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <fmt/core.h>

#include <bcx/block/header.hpp>
#include <bcx/config/loader.hpp>
#include <bcx/config/validator.hpp>
#include <bcx/logging/fmt_logger.hpp>

int main(int argc, char** argv) {
    bcx::logging::FmtLogger log(false, true);

    cxxopts::Options options("bcx-find-nonce", "Search a nonce range for a valid proof-of-work");
    options.add_options()
        ("config", "Path to config file (header.conf)", cxxopts::value<std::string>()->default_value("header.conf"))
        ("start",  "First nonce to try", cxxopts::value<std::string>()->default_value("0"))
        ("count",  "Number of nonces to try", cxxopts::value<std::string>()->default_value("1000000"))
        ("h,help", "Show help and exit");

    std::uint32_t start = 0;
    std::uint32_t count = 0;
    std::string config_path;
    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            log.info(options.help());
            return 0;
        }
        std::string err;
        if (!bcx::config::parse_u32(result["start"].as<std::string>(), start, err) ||
            !bcx::config::parse_u32(result["count"].as<std::string>(), count, err)) {
            log.error(fmt::format("Argument error: {}", err));
            return 1;
        }
        config_path = result["config"].as<std::string>();
    } catch (const std::exception& e) {
        log.error(fmt::format("Argument error: {}\n\n{}", e.what(), options.help()));
        return 1;
    }

    auto report = [&log](const std::vector<std::string>& errs) {
        for (const auto& e : errs) log.error(e);
        return errs.empty();
    };

    bcx::config::HeaderConfig cfg;
    if (!report(bcx::config::load_from_file(cfg, config_path))) return 1;
    if (!report(bcx::config::apply_env_overrides(cfg))) return 1;
    if (!report(bcx::config::validate_final(cfg))) return 1;

    bcx::block::BlockHeader header = bcx::config::to_header(cfg);
    log.info(fmt::format("Searching {} nonces from 0x{:08x}, target bits 0x{:08x}", count, start, header.bits));

    for (std::uint64_t i = 0; i < count; ++i) {
        header.nonce = static_cast<std::uint32_t>(start + i);
        if (header.meets_target()) {
            log.info(fmt::format("Found nonce 0x{:08x} ({})", header.nonce, header.nonce));
            fmt::print("{}\n", header.block_hash_hex());
            return 0;
        }
        if (i > 0 && i % 10000000 == 0) {
            log.info(fmt::format("Tried {} million nonces...", i / 1000000));
        }
    }

    log.warn("No nonce in range meets the target");
    return 1;
}
