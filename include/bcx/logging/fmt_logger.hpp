#pragma once

#include <bcx/logging/logger.hpp>

#include <atomic>
#include <string>

namespace bcx::logging {

// Writes "[LEVEL] message" lines with {fmt}; errors go to stderr.
// With timestamps enabled each line starts with "[hh:mm:ss] ".
class FmtLogger : public Logger {
public:
    explicit FmtLogger(bool enable_debug = false, bool timestamps = false)
        : enable_debug_(enable_debug), timestamps_(timestamps) {}
    void info(std::string_view msg) override;
    void warn(std::string_view msg) override;
    void error(std::string_view msg) override;
    void debug(std::string_view msg) override;

    void set_debug(bool v) { enable_debug_.store(v); }
    bool debug_enabled() const { return enable_debug_.load(); }

private:
    std::string prefix(std::string_view level) const;

    std::atomic<bool> enable_debug_{false};
    bool timestamps_{false};
};

} // namespace bcx::logging
