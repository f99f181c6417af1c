#include <bcx/cli/args.hpp>

#include <optional>
#include <string>

#include <cxxopts.hpp>
#include <fmt/core.h>

#ifndef BCX_VERSION
#define BCX_VERSION "0.0.0"
#endif

namespace bcx::cli {

bcx::config::ParseResult parse(int argc, char** argv, bcx::logging::Logger& log) {
    bcx::config::ParseResult pr;
    cxxopts::Options options("bcx-mine", "Check a block header's proof-of-work (SHA-256d)");
    options.add_options()
        ("config",        "Path to config file (header.conf)", cxxopts::value<std::string>()->default_value("header.conf"))
        ("block-version", "Header version field", cxxopts::value<std::string>())
        ("prev",          "Previous block hash (64 hex chars)", cxxopts::value<std::string>())
        ("merkle",        "Merkle root (64 hex chars)", cxxopts::value<std::string>())
        ("time",          "Header time (unix seconds)", cxxopts::value<std::string>())
        ("bits",          "Compact target", cxxopts::value<std::string>())
        ("nonce",         "Header nonce", cxxopts::value<std::string>())
        ("sha256",        "Print SHA-256 of TEXT and exit", cxxopts::value<std::string>())
        ("base58",        "Print Base58 encoding of HEX payload and exit", cxxopts::value<std::string>())
        ("base58-decode", "Print hex of decoded Base58 TEXT and exit", cxxopts::value<std::string>())
        ("d,debug",       "Enable debug logging")
        ("v,version",     "Show version and exit")
        ("h,help",        "Show help and exit");
    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            log.info(options.help());
            pr.show_only = true;
            return pr;
        }
        if (result.count("version")) {
            log.info(fmt::format("bcx-mine v{}", BCX_VERSION));
            pr.show_only = true;
            return pr;
        }
        auto opt = [&](const char* name) -> std::optional<std::string> {
            if (result.count(name)) return result[name].as<std::string>();
            return std::nullopt;
        };
        pr.overrides.version = opt("block-version");
        pr.overrides.prev    = opt("prev");
        pr.overrides.merkle  = opt("merkle");
        pr.overrides.time    = opt("time");
        pr.overrides.bits    = opt("bits");
        pr.overrides.nonce   = opt("nonce");
        pr.sha256_text   = opt("sha256");
        pr.base58_hex    = opt("base58");
        pr.base58_decode = opt("base58-decode");
        pr.config_path = result["config"].as<std::string>();
        pr.debug = result.count("debug") > 0;
        pr.ok = true;
    } catch (const std::exception& e) {
        log.error(fmt::format("Argument error: {}\n\n{}", e.what(), options.help()));
        return pr;
    }
    return pr;
}

} // namespace bcx::cli
