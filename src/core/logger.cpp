// src/core/logger.cpp

#include "copy_ngin/core/logger.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>
#include "copy_ngin/core/time_utils.hpp"

namespace copy_ngin {

thread_local std::string Logger::current_component_;

namespace {

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

}  // namespace

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::ERR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
    }
    return "UNKNOWN";
}

LogLevel level_from_string(const std::string& level, LogLevel fallback) {
    const std::string name = to_upper(level);
    if (name == "TRACE")
        return LogLevel::TRACE;
    if (name == "DEBUG")
        return LogLevel::DEBUG;
    if (name == "INFO")
        return LogLevel::INFO;
    if (name == "WARNING" || name == "WARN")
        return LogLevel::WARNING;
    if (name == "ERROR")
        return LogLevel::ERR;
    if (name == "FATAL")
        return LogLevel::FATAL;
    return fallback;
}

std::string log_destination_to_string(LogDestination dest) {
    switch (dest) {
        case LogDestination::CONSOLE:
            return "CONSOLE";
        case LogDestination::FILE:
            return "FILE";
        case LogDestination::BOTH:
            return "BOTH";
    }
    return "UNKNOWN";
}

LogDestination log_destination_from_string(const std::string& dest, LogDestination fallback) {
    const std::string name = to_upper(dest);
    if (name == "CONSOLE")
        return LogDestination::CONSOLE;
    if (name == "FILE")
        return LogDestination::FILE;
    if (name == "BOTH")
        return LogDestination::BOTH;
    return fallback;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    min_level_.store(config.min_level, std::memory_order_relaxed);

    if (log_file_.is_open()) {
        log_file_.close();
    }

    if (config_.destination == LogDestination::FILE ||
        config_.destination == LogDestination::BOTH) {
        std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);

        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create log directory: " + log_dir.string() +
                                     " - " + ec.message());
        }

        // Retention runs before the new file exists so the total never exceeds max_files
        enforce_retention(log_dir);

        current_session_timestamp_ = core::get_formatted_time("%Y%m%d_%H%M%S");
        current_part_number_ = 1;

        std::filesystem::path log_path = current_file_path(log_dir);
        log_file_.open(log_path, std::ios::app);
        if (!log_file_.is_open()) {
            throw std::runtime_error("Failed to open log file: " + log_path.string());
        }
    }

    initialized_.store(true, std::memory_order_release);
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_.load(std::memory_order_acquire)) {
        std::cerr << "WARNING: Logger not initialized. Message: " << message << std::endl;
        return;
    }
    if (level < get_min_level()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string line = format_message(level, message);

    if (config_.destination == LogDestination::CONSOLE ||
        config_.destination == LogDestination::BOTH) {
        write_to_console_unsafe(line);
    }
    if (config_.destination == LogDestination::FILE ||
        config_.destination == LogDestination::BOTH) {
        write_to_file_unsafe(line);
    }
}

std::string Logger::format_message(LogLevel level, const std::string& message) {
    std::string line;
    if (config_.include_timestamp) {
        line += core::format_timestamp_utc_ms(std::chrono::system_clock::now()) + " ";
    }
    if (config_.include_level) {
        line += "[" + level_to_string(level) + "] ";
    }
    if (!current_component_.empty()) {
        line += "[" + current_component_ + "] ";
    }
    return line + message;
}

void Logger::write_to_console_unsafe(const std::string& message) {
    std::cout << message << std::endl;
}

void Logger::write_to_file_unsafe(const std::string& message) {
    if (!log_file_.is_open()) {
        return;
    }
    log_file_ << message << std::endl;

    if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
        rotate_log_files();
    }
}

std::filesystem::path Logger::current_file_path(const std::filesystem::path& log_dir) const {
    return log_dir / (config_.filename_prefix + "_" + current_session_timestamp_ + "_part" +
                      std::to_string(current_part_number_) + ".log");
}

bool Logger::owns_file(const std::filesystem::path& path) const {
    const std::string name = path.filename().string();
    const std::string prefix = config_.filename_prefix + "_";
    return path.extension() == ".log" && name.compare(0, prefix.size(), prefix) == 0;
}

void Logger::enforce_retention(const std::filesystem::path& log_dir) {
    std::vector<std::filesystem::path> log_files;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir, ec)) {
        if (entry.is_regular_file() && owns_file(entry.path())) {
            log_files.push_back(entry.path());
        }
    }

    std::sort(log_files.begin(), log_files.end(), [](const auto& a, const auto& b) {
        return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
    });

    while (!log_files.empty() && log_files.size() >= config_.max_files) {
        std::filesystem::remove(log_files.front(), ec);
        if (ec) {
            std::cerr << "WARNING: Cannot remove old log " << log_files.front() << ": "
                      << ec.message() << std::endl;
        }
        log_files.erase(log_files.begin());
    }
}

void Logger::rotate_log_files() {
    log_file_.close();

    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);
    enforce_retention(log_dir);

    current_part_number_++;
    log_file_.open(current_file_path(log_dir), std::ios::app);
    if (!log_file_.is_open()) {
        std::cerr << "WARNING: Cannot open " << current_file_path(log_dir)
                  << ", file logging stopped" << std::endl;
    }
}

}  // namespace copy_ngin
