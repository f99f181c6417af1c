#pragma once

#include <string>
#include <vector>

#include <bcx/block/header.hpp>
#include <bcx/config/types.hpp>

namespace bcx::config {

// Read header fields from file (JSON or key=value). A missing file is not an error.
// Returns list of errors (empty if ok); cfg is left untouched on error.
std::vector<std::string> load_from_file(HeaderConfig& cfg, const std::string& path);

// Apply BCX_* environment variables (VERSION, PREV, MERKLE, TIME, BITS, NONCE) on top of cfg.
std::vector<std::string> apply_env_overrides(HeaderConfig& cfg);

// Apply command-line values on top of cfg.
std::vector<std::string> apply_overrides(HeaderConfig& cfg, const HeaderOverrides& ov);

// Validate final config (both digests must be 64 hex characters). Returns list of errors.
std::vector<std::string> validate_final(const HeaderConfig& cfg);

// Build the header; call only after validate_final returned no errors.
block::BlockHeader to_header(const HeaderConfig& cfg);

} // namespace bcx::config
