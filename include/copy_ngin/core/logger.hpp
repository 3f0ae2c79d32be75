// include/copy_ngin/core/logger.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "copy_ngin/core/config_base.hpp"
#include "copy_ngin/core/types.hpp"

namespace copy_ngin {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Detailed debug information
    DEBUG,    // Per-event decisions (skipped trades, skipped fills)
    INFO,     // Lifecycle information
    WARNING,  // External-call failures and degraded paths
    ERR,      // Errors that affect operation but don't stop system
    FATAL     // Critical errors that require system shutdown
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,  // Standard output
    FILE,     // File output
    BOTH      // Both console and file
};

/**
 * @brief Convert a log level to its upper-case name
 * @param level Log level
 * @return "TRACE" ... "FATAL"; ERR is rendered as "ERROR"
 */
std::string level_to_string(LogLevel level);

/**
 * @brief Parse a level name, case-insensitive, "WARN" accepted for WARNING
 * @param fallback Returned for unrecognised names
 */
LogLevel level_from_string(const std::string& level, LogLevel fallback = LogLevel::INFO);

/**
 * @brief Convert a log destination to its upper-case name
 */
std::string log_destination_to_string(LogDestination dest);

/**
 * @brief Parse a destination name, case-insensitive
 * @param dest "console", "file" or "both"
 * @param fallback Returned for unrecognised names
 */
LogDestination log_destination_from_string(const std::string& dest,
                                           LogDestination fallback = LogDestination::CONSOLE);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"copy_ngin"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{50 * 1024 * 1024};  // 50MB
    size_t max_files{10};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["min_level"] = level_to_string(min_level);
        j["destination"] = log_destination_to_string(destination);
        j["log_directory"] = log_directory;
        j["filename_prefix"] = filename_prefix;
        j["include_timestamp"] = include_timestamp;
        j["include_level"] = include_level;
        j["max_file_size"] = max_file_size;
        j["max_files"] = max_files;
        j["version"] = version;

        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("min_level"))
            min_level = level_from_string(j.at("min_level").get<std::string>(), min_level);
        if (j.contains("destination"))
            destination =
                log_destination_from_string(j.at("destination").get<std::string>(), destination);
        if (j.contains("log_directory"))
            log_directory = j.at("log_directory").get<std::string>();
        if (j.contains("filename_prefix"))
            filename_prefix = j.at("filename_prefix").get<std::string>();
        if (j.contains("include_timestamp"))
            include_timestamp = j.at("include_timestamp").get<bool>();
        if (j.contains("include_level"))
            include_level = j.at("include_level").get<bool>();
        if (j.contains("max_file_size"))
            max_file_size = j.at("max_file_size").get<size_t>();
        if (j.contains("max_files"))
            max_files = j.at("max_files").get<size_t>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }
};

/**
 * @brief Process-wide logger shared by the backtest CLI and the live copier
 *
 * Lines carry a UTC millisecond timestamp, the level and the calling
 * thread's component tag. Files are named <prefix>_<YYYYMMDD_HHMMSS>_part<N>.log
 * and rotate at max_file_size; retention only touches files with this
 * logger's prefix.
 */
class Logger {
public:
    /**
     * @brief Get the singleton instance
     * @return Reference to the logger instance
     */
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     *
     * May be called again to switch configuration; an open log file is
     * closed and a new session file started.
     *
     * @param config Logger configuration
     * @throws std::runtime_error if the log directory or file cannot be created
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Reset the logger for testing
     */
    static void reset_for_tests() {
        std::lock_guard<std::mutex> lock(instance().mutex_);
        instance().initialized_ = false;
        if (instance().log_file_.is_open()) {
            instance().log_file_.close();
        }
        instance().current_session_timestamp_.clear();
        instance().current_part_number_ = 1;
        instance().min_level_.store(LogLevel::INFO, std::memory_order_relaxed);
    }

    /**
     * @brief Log a message with specified level
     *
     * Messages below the minimum level are dropped. Before initialize() the
     * message goes to stderr with a warning.
     *
     * @param level Log level
     * @param message Message to log
     */
    void log(LogLevel level, const std::string& message);

    /**
     * @brief Set the minimum log level
     * @param level Minimum level to log
     */
    void set_level(LogLevel level) {
        min_level_.store(level, std::memory_order_relaxed);
    }

    /**
     * @brief Get the minimum log level
     * @return Minimum log level
     */
    LogLevel get_min_level() const {
        return min_level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Check if logger is initialized
     * @return True if initialized, false otherwise
     */
    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag every message logged from the calling thread
     * @param component Component name, empty to clear
     */
    static void register_component(const std::string& component) {
        current_component_ = component;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void rotate_log_files();
    void enforce_retention(const std::filesystem::path& log_dir);
    bool owns_file(const std::filesystem::path& path) const;
    void write_to_file_unsafe(const std::string& message);
    void write_to_console_unsafe(const std::string& message);
    std::string format_message(LogLevel level, const std::string& message);
    std::filesystem::path current_file_path(const std::filesystem::path& log_dir) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    static thread_local std::string current_component_;

    std::string current_session_timestamp_;  // Format: YYYYMMDD_HHMMSS
    int current_part_number_{1};
};

// Usage: INFO("Copied " << count << " fills for " << session_id)
#define LOG(level, message)                                                     \
    do {                                                                        \
        if (level >= ::copy_ngin::Logger::instance().get_min_level()) {         \
            std::ostringstream os;                                              \
            os << message;                                                      \
            ::copy_ngin::Logger::instance().log(level, os.str());               \
        }                                                                       \
    } while (0)

#define TRACE(message) LOG(::copy_ngin::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::copy_ngin::LogLevel::DEBUG, message)
#define INFO(message) LOG(::copy_ngin::LogLevel::INFO, message)
#define WARN(message) LOG(::copy_ngin::LogLevel::WARNING, message)
#define ERROR(message) LOG(::copy_ngin::LogLevel::ERR, message)
#define FATAL(message) LOG(::copy_ngin::LogLevel::FATAL, message)
}  // namespace copy_ngin
