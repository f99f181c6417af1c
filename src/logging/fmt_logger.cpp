#include <bcx/logging/fmt_logger.hpp>

#include <chrono>
#include <cstdio>
#include <ctime>

#include <fmt/core.h>
#include <fmt/format.h>

namespace bcx::logging {

static std::string now_hms() {
    using namespace std::chrono;
    std::time_t t = system_clock::to_time_t(system_clock::now());
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return fmt::format("[{:02d}:{:02d}:{:02d}] ", tm.tm_hour, tm.tm_min, tm.tm_sec);
}

std::string FmtLogger::prefix(std::string_view level) const {
    std::string p = timestamps_ ? now_hms() : std::string{};
    p += fmt::format("[{}]", level);
    return p;
}

void FmtLogger::info(std::string_view msg) { fmt::print("{} {}\n", prefix("INFO"), msg); }
void FmtLogger::warn(std::string_view msg) { fmt::print("{} {}\n", prefix("WARN"), msg); }
void FmtLogger::error(std::string_view msg) { fmt::print(stderr, "{} {}\n", prefix("ERROR"), msg); }
void FmtLogger::debug(std::string_view msg) {
    if (enable_debug_.load()) fmt::print("{} {}\n", prefix("DEBUG"), msg);
}

} // namespace bcx::logging
