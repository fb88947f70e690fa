// include/holdings_ngin/core/logger.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include "holdings_ngin/core/config_base.hpp"

namespace holdings_ngin {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Detailed debug information
    DEBUG,    // General debug information
    INFO,     // General information
    WARNING,  // Conditions surfaced as warnings to callers
    ERR,      // Errors that affect operation but don't stop the engine
    FATAL     // Configuration errors that prevent startup
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,  // Standard output
    FILE,     // File output
    BOTH      // Both console and file
};

std::string level_to_string(LogLevel level);
std::optional<LogLevel> level_from_string(const std::string& level);
std::string log_destination_to_string(LogDestination dest);
std::optional<LogDestination> log_destination_from_string(const std::string& dest);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"holdings_ngin"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{50 * 1024 * 1024};  // 50MB
    size_t max_files{10};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Thread-safe logging singleton
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @param config Logger configuration
     * @throws std::runtime_error if the log directory or file cannot be created
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Reset the logger for testing
     */
    static void reset_for_tests();

    /**
     * @brief Log a message with specified level
     */
    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_.store(level, std::memory_order_relaxed);
        config_.min_level = level;
    }

    LogLevel get_min_level() const {
        return min_level_.load(std::memory_order_relaxed);
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag messages logged from the calling thread with a component name
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

    // All private helpers assume mutex_ is held
    void open_log_file();
    void enforce_retention(const std::filesystem::path& log_dir) const;
    void rotate_log_file();
    void write_to_file(const std::string& message);
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    static thread_local std::string current_component_;

    std::string session_timestamp_;  // YYYYMMDD_HHMMSS
    int part_number_{1};
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Message: " << variable)
 */
#define LOG(level, message)                                                          \
    do {                                                                             \
        if (level >= ::holdings_ngin::Logger::instance().get_min_level()) {          \
            std::ostringstream os;                                                   \
            os << message;                                                           \
            ::holdings_ngin::Logger::instance().log(level, os.str());                \
        }                                                                            \
    } while (0)

#define TRACE(message) LOG(::holdings_ngin::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::holdings_ngin::LogLevel::DEBUG, message)
#define INFO(message) LOG(::holdings_ngin::LogLevel::INFO, message)
#define WARN(message) LOG(::holdings_ngin::LogLevel::WARNING, message)
#define ERROR(message) LOG(::holdings_ngin::LogLevel::ERR, message)
#define FATAL(message) LOG(::holdings_ngin::LogLevel::FATAL, message)

}  // namespace holdings_ngin
