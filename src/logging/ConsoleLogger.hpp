#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

#include "../config/CacheConfig.hpp"
#include "../interfaces/ILogger.hpp"

class ConsoleLogger : public ILogger {
public:
    // Process-wide logger writing to std::cout / std::cerr. The level passed on
    // the first call wins.
    static std::shared_ptr<ConsoleLogger> getInstance(LogUtils::LogLevel logLevel);

    ConsoleLogger(LogUtils::LogLevel logLevel, std::ostream& out, std::ostream& err)
        : logLevel(logLevel), out_(out), err_(err) {}
    ~ConsoleLogger() override = default;

    void info(const std::string& message) override;
    void debug(const std::string& message) override;
    void warn(const std::string& message) override;
    void error(const std::string& message) override;
    void setup(const std::string& message) override;
    int getLogLevel() override { return logLevel; }

private:
    void write(std::ostream& stream, const std::string& prefix, const std::string& message);

    LogUtils::LogLevel logLevel;
    std::ostream& out_;
    std::ostream& err_;
    std::mutex stream_mutex_; // Serializes whole lines across threads

    static std::shared_ptr<ConsoleLogger> instance;
    static std::once_flag init_flag;

    ConsoleLogger(const ConsoleLogger&) = delete;
    ConsoleLogger& operator=(const ConsoleLogger&) = delete;
    ConsoleLogger(ConsoleLogger&&) = delete;
    ConsoleLogger& operator=(ConsoleLogger&&) = delete;
};
