// include/papertrade/core/logger.hpp
#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "papertrade/core/config_base.hpp"

namespace papertrade {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Per-tick detail
    DEBUG,    // Decisions and sizing detail
    INFO,     // Orders, trades, promotions
    WARNING,  // Feed gaps, failed candidates, lost promotion races
    ERR,      // Errors that affect operation but don't stop the engine
    FATAL     // Unrecoverable configuration errors
};

/**
 * @brief Log destination type
 */
enum class LogDestination { CONSOLE, FILE, BOTH };

std::string level_to_string(LogLevel level);
LogLevel level_from_string(const std::string& level);
std::string log_destination_to_string(LogDestination dest);
LogDestination log_destination_from_string(const std::string& dest);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"papertrade"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{20 * 1024 * 1024};  // 20MB per part
    size_t max_files{10};                    // retention across sessions

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;
};

/**
 * @brief Thread-safe process-wide logger
 *
 * Files are named prefix_YYYYMMDD_HHMMSS_partN.log and rotated by size.
 * Components tag their messages by calling register_component from the
 * thread they run on.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @throws std::runtime_error if the log directory or file cannot be created
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Close files and return to the uninitialized state (tests only)
     */
    static void reset_for_tests();

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        min_level_.store(level, std::memory_order_relaxed);
    }

    LogLevel get_min_level() const {
        return min_level_.load(std::memory_order_relaxed);
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag messages logged from the calling thread
     */
    static void register_component(const std::string& component) {
        current_component_ = component;
    }

    /**
     * @brief Path of the file currently written to, empty for console-only
     */
    std::string current_file() const;

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void open_next_part_unsafe();
    void enforce_retention_unsafe(const std::filesystem::path& log_dir) const;
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::filesystem::path log_path_;
    std::atomic<bool> initialized_{false};
    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    static thread_local std::string current_component_;

    std::string session_timestamp_;  // YYYYMMDD_HHMMSS
    int part_number_{0};
};

/**
 * @brief Stream-style logging macro
 * Usage: LOG(LogLevel::INFO, "Equity: " << equity)
 */
#define LOG(level, message)                                                    \
    do {                                                                       \
        if ((level) >= ::papertrade::Logger::instance().get_min_level()) {     \
            std::ostringstream papertrade_log_os_;                             \
            papertrade_log_os_ << message;                                     \
            ::papertrade::Logger::instance().log((level), papertrade_log_os_.str()); \
        }                                                                      \
    } while (0)

#define TRACE(message) LOG(::papertrade::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::papertrade::LogLevel::DEBUG, message)
#define INFO(message) LOG(::papertrade::LogLevel::INFO, message)
#define WARN(message) LOG(::papertrade::LogLevel::WARNING, message)
#define ERROR(message) LOG(::papertrade::LogLevel::ERR, message)
#define FATAL(message) LOG(::papertrade::LogLevel::FATAL, message)

}  // namespace papertrade
