#include <iostream>
#include <mutex>
#include <string>

#include "ConsoleLogger.hpp"

// Define static members
std::shared_ptr<ConsoleLogger> ConsoleLogger::instance = nullptr;
std::once_flag ConsoleLogger::init_flag;

std::shared_ptr<ConsoleLogger> ConsoleLogger::getInstance(LogUtils::LogLevel logLevel) {
    std::call_once(init_flag, [logLevel]() {
        instance = std::make_shared<ConsoleLogger>(logLevel, std::cout, std::cerr);
    });
    return instance;
}

void ConsoleLogger::write(std::ostream& stream, const std::string& prefix, const std::string& message) {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    stream << prefix << message << std::endl;
}

void ConsoleLogger::info(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::INFO) {
        write(out_, LogUtils::INFO_LOG_PREFIX, message);
    }
}

void ConsoleLogger::debug(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::DEBUG) {
        write(out_, LogUtils::DEBUG_LOG_PREFIX, message);
    }
}

void ConsoleLogger::warn(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::WARN) {
        write(out_, LogUtils::WARN_LOG_PREFIX, message);
    }
}

void ConsoleLogger::error(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::CERROR) {
        // Errors go to the error stream
        write(err_, LogUtils::CERROR_LOG_PREFIX, message);
    }
}

// Setup lines are always written, whatever the level
void ConsoleLogger::setup(const std::string& message) {
    write(out_, LogUtils::SETUP_LOG_PREFIX, message);
}
