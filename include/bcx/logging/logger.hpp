#pragma once

#include <string_view>

namespace bcx::logging {

// Sink for driver and tool messages. The hashing and encoding cores never log.
class Logger {
public:
    virtual ~Logger() = default;
    virtual void info(std::string_view msg) = 0;
    virtual void warn(std::string_view msg) = 0;
    virtual void error(std::string_view msg) = 0;
    virtual void debug(std::string_view msg) = 0;
};

} // namespace bcx::logging
