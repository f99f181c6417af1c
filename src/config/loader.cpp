#include <bcx/config/loader.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <bcx/config/validator.hpp>

namespace bcx::config {

// Routes one textual key/value into cfg. Unknown keys are reported.
static void set_field(HeaderConfig& cfg, const std::string& key, const std::string& val,
                      const std::string& origin, std::vector<std::string>& errs) {
    std::uint32_t* num = nullptr;
    if (key == "version") num = &cfg.version;
    else if (key == "time") num = &cfg.time;
    else if (key == "bits") num = &cfg.bits;
    else if (key == "nonce") num = &cfg.nonce;

    if (num) {
        std::string e;
        if (!parse_u32(val, *num, e)) errs.push_back(fmt::format("{}: '{}': {}", origin, key, e));
        return;
    }
    if (key == "prev") cfg.prev = val;
    else if (key == "merkle") cfg.merkle = val;
    else errs.push_back(fmt::format("{}: unknown key '{}'", origin, key));
}

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

static void load_key_value(HeaderConfig& cfg, const std::string& text, const std::string& path,
                           std::vector<std::string>& errs) {
    std::istringstream iss(text);
    std::string line;
    int lineno = 0;
    while (std::getline(iss, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            errs.push_back(fmt::format("{}:{}: expected key=value", path, lineno));
            continue;
        }
        set_field(cfg, trim(line.substr(0, eq)), trim(line.substr(eq + 1)),
                  fmt::format("{}:{}", path, lineno), errs);
    }
}

static void load_json(HeaderConfig& cfg, const std::string& text, const std::string& path,
                      std::vector<std::string>& errs) {
    try {
        nlohmann::json j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            errs.push_back(fmt::format("{}: top-level JSON value must be an object", path));
            return;
        }
        for (auto it = j.begin(); it != j.end(); ++it) {
            const auto& v = it.value();
            if (v.is_string()) {
                set_field(cfg, it.key(), v.get<std::string>(), path, errs);
            } else if (v.is_number_unsigned()) {
                set_field(cfg, it.key(), std::to_string(v.get<std::uint64_t>()), path, errs);
            } else {
                errs.push_back(fmt::format("{}: '{}' must be a string or unsigned number", path, it.key()));
            }
        }
    } catch (const nlohmann::json::exception& ex) {
        errs.push_back(fmt::format("failed to read {}: {}", path, ex.what()));
    }
}

std::vector<std::string> load_from_file(HeaderConfig& cfg, const std::string& path) {
    std::vector<std::string> errs;
    std::ifstream in(path);
    if (!in.good()) return errs; // optional

    std::stringstream buffer; buffer << in.rdbuf();
    std::string text = buffer.str();
    auto first_non_space = text.find_first_not_of(" \t\n\r");
    if (first_non_space == std::string::npos) return errs;

    HeaderConfig next = cfg;
    if (text[first_non_space] == '{') {
        load_json(next, text, path, errs);
    } else {
        load_key_value(next, text, path, errs);
    }
    if (errs.empty()) cfg = next;
    return errs;
}

std::vector<std::string> apply_env_overrides(HeaderConfig& cfg) {
    static const std::pair<const char*, const char*> vars[] = {
        {"BCX_VERSION", "version"}, {"BCX_PREV", "prev"},   {"BCX_MERKLE", "merkle"},
        {"BCX_TIME", "time"},       {"BCX_BITS", "bits"},   {"BCX_NONCE", "nonce"},
    };
    std::vector<std::string> errs;
    for (const auto& [env, key] : vars) {
        if (const char* v = std::getenv(env)) set_field(cfg, key, v, env, errs);
    }
    return errs;
}

std::vector<std::string> apply_overrides(HeaderConfig& cfg, const HeaderOverrides& ov) {
    std::vector<std::string> errs;
    if (ov.version) set_field(cfg, "version", *ov.version, "--block-version", errs);
    if (ov.prev)    set_field(cfg, "prev", *ov.prev, "--prev", errs);
    if (ov.merkle)  set_field(cfg, "merkle", *ov.merkle, "--merkle", errs);
    if (ov.time)    set_field(cfg, "time", *ov.time, "--time", errs);
    if (ov.bits)    set_field(cfg, "bits", *ov.bits, "--bits", errs);
    if (ov.nonce)   set_field(cfg, "nonce", *ov.nonce, "--nonce", errs);
    return errs;
}

std::vector<std::string> validate_final(const HeaderConfig& cfg) {
    std::vector<std::string> errs;
    std::string e;
    if (!is_valid_digest_hex(cfg.prev, e)) errs.push_back(fmt::format("prev: {}", e));
    if (!is_valid_digest_hex(cfg.merkle, e)) errs.push_back(fmt::format("merkle: {}", e));
    return errs;
}

block::BlockHeader to_header(const HeaderConfig& cfg) {
    block::BlockHeader h;
    h.version = cfg.version;
    h.prev = crypto::Digest256::from_hex(cfg.prev);
    h.merkle = crypto::Digest256::from_hex(cfg.merkle);
    h.time = cfg.time;
    h.bits = cfg.bits;
    h.nonce = cfg.nonce;
    return h;
}

} // namespace bcx::config
