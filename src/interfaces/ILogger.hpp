#pragma once

#include <string>

#include "../config/CacheConfig.hpp"

// Line-oriented diagnostic sink. Tables hold an optional instance; without one
// they stay silent.
class ILogger {
public:
    virtual ~ILogger() noexcept = default;
    virtual void info(const std::string& message) = 0;
    virtual void debug(const std::string& message) = 0;
    virtual void warn(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
    virtual void setup(const std::string& message) = 0;
    virtual int getLogLevel() = 0;

    // Lets callers skip formatting lines that would be filtered out anyway.
    bool isEnabled(LogUtils::LogLevel level) { return level >= getLogLevel(); }
};
