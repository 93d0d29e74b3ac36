#ifndef CACHECONFIG_HPP
#define CACHECONFIG_HPP

#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static const std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static const std::string INFO_LOG_PREFIX = "[Info] ";
    static const std::string WARN_LOG_PREFIX = "[Warning] ";
    static const std::string CERROR_LOG_PREFIX = "[Error] ";
    static const std::string SETUP_LOG_PREFIX = "[Setup] ";
}

namespace Constants {
    static const std::vector<std::string> DEFAULT_CONFIG_PATHS = {
        "cachetable.config",                  // Current directory
        "../cachetable.config",               // Parent directory
        "/etc/cachetable/cachetable.config"   // System-wide install
    };
}

// --- Configuration Struct ---
class CacheConfig {
public:
    // Logging Level
    LogUtils::LogLevel log_level;

    // Number of threads driving the io_context on which expiration timers fire
    size_t scheduler_threads;

    // Hand the registry's logger to every table it creates
    bool attach_logger_to_tables;

    CacheConfig() {
        // --- Set Defaults ---
        log_level = LogUtils::LogLevel::CERROR;
        scheduler_threads = 1;
        attach_logger_to_tables = false;
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl
            << "scheduler_threads: " << scheduler_threads << std::endl
            << "attach_logger_to_tables: " << std::boolalpha << attach_logger_to_tables << std::noboolalpha << std::endl
            << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // CACHECONFIG_HPP
