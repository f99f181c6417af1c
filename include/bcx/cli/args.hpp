#pragma once

#include <bcx/config/types.hpp>
#include <bcx/logging/logger.hpp>

namespace bcx::cli {

// Parse CLI using cxxopts. Writes help/version through provided logger when requested.
bcx::config::ParseResult parse(int argc, char** argv, bcx::logging::Logger& log);

} // namespace bcx::cli
