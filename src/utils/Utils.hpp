#ifndef UTILS_HPP
#define UTILS_HPP

#include <chrono>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../config/CacheConfig.hpp"

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING") return LogUtils::LogLevel::WARN;
        if (level == "CERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    // Helper to parse integer safely
    static std::optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            // Check if the entire string was consumed
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (std::string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // Renders a duration as whole milliseconds, e.g. "250ms"
    template <typename Rep, typename Period>
    static std::string formatDuration(std::chrono::duration<Rep, Period> duration) {
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(duration);
        return std::to_string(millis.count()) + "ms";
    }

    // Turns key=value strings (e.g. an embedding program's argv) into the map
    // loadConfiguration takes. Programs with their own option parsing can
    // build that map directly instead.
    static std::optional<std::map<std::string, std::string>> parseArguments(const std::vector<std::string>& args) {
        std::map<std::string, std::string> argMap;
        for (const std::string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != std::string::npos && delimiterPos > 0) { // Ensure key is not empty
                std::string key = arg.substr(0, delimiterPos);
                std::string value = arg.substr(delimiterPos + 1);
                argMap[key] = value;
            } else {
                std::cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << std::endl;
                return std::nullopt; // Signal failure
            }
        }
        return argMap; // Signal success
    }

    // Applies one recognised key to the config. Unknown keys are ignored.
    static void applySetting(CacheConfig& config, const std::string& key, const std::string& value) {
        if (key == "log_level") {
            config.log_level = stringToLogLevel(value);
        } else if (key == "scheduler_threads") {
            auto val = stringToInt(value);
            if (val && *val > 0) {
                config.scheduler_threads = static_cast<size_t>(*val);
            } else {
                std::cerr << "Warning: Invalid thread count for scheduler_threads: " << value << std::endl;
            }
        } else if (key == "attach_logger_to_tables") {
            auto val = stringToInt(value);
            if (val && (*val == 0 || *val == 1)) {
                config.attach_logger_to_tables = (*val == 1);
            } else {
                std::cerr << "Warning: Expected 0 or 1 for attach_logger_to_tables: " << value << std::endl;
            }
        }
    }

    // Load configuration from the first readable config file, then from
    // startup arguments. Arguments override file values.
    static CacheConfig loadConfiguration(
        const std::map<std::string, std::string>& startupArguments,
        const std::vector<std::string>& config_paths = Constants::DEFAULT_CONFIG_PATHS) {
        CacheConfig config;

        // --- Load from Config File ---
        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (!configFile.is_open()) {
                continue;
            }
            config_found = true;
            std::string line;
            while (std::getline(configFile, line)) {
                line = trim(line);
                if (line.empty() || line[0] == '#') { // Skip empty lines and comments
                    continue;
                }
                size_t delimiterPos = line.find('=');
                if (delimiterPos != std::string::npos && delimiterPos > 0) {
                    applySetting(config, trim(line.substr(0, delimiterPos)), trim(line.substr(delimiterPos + 1)));
                } else {
                    std::cerr << "Warning: Ignoring malformed line in " << config_path << ": " << line << std::endl;
                }
            }
            break;
        }

        if (!config_found) {
            std::cerr << "Warning: Configuration file not found in any standard location. Using defaults and command-line arguments." << std::endl;
        }

        // --- Process StartUp Arguments ---
        for (const auto& pair : startupArguments) {
            applySetting(config, pair.first, pair.second);
        }

        return config;
    }
};

#endif // UTILS_HPP
