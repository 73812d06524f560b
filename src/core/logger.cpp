// src/core/logger.cpp

#include "papertrade/core/logger.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <vector>
#include "papertrade/core/time_utils.hpp"

namespace papertrade {

thread_local std::string Logger::current_component_;

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
        default:
            return "UNKNOWN";
    }
}

LogLevel level_from_string(const std::string& level) {
    if (level == "TRACE")
        return LogLevel::TRACE;
    if (level == "DEBUG")
        return LogLevel::DEBUG;
    if (level == "WARNING" || level == "WARN")
        return LogLevel::WARNING;
    if (level == "ERROR")
        return LogLevel::ERR;
    if (level == "FATAL")
        return LogLevel::FATAL;
    return LogLevel::INFO;
}

std::string log_destination_to_string(LogDestination dest) {
    switch (dest) {
        case LogDestination::FILE:
            return "FILE";
        case LogDestination::BOTH:
            return "BOTH";
        default:
            return "CONSOLE";
    }
}

LogDestination log_destination_from_string(const std::string& dest) {
    if (dest == "FILE")
        return LogDestination::FILE;
    if (dest == "BOTH")
        return LogDestination::BOTH;
    return LogDestination::CONSOLE;
}

nlohmann::json LoggerConfig::to_json() const {
    nlohmann::json j;
    j["min_level"] = level_to_string(min_level);
    j["destination"] = log_destination_to_string(destination);
    j["log_directory"] = log_directory;
    j["filename_prefix"] = filename_prefix;
    j["include_timestamp"] = include_timestamp;
    j["include_level"] = include_level;
    j["max_file_size"] = max_file_size;
    j["max_files"] = max_files;
    return j;
}

void LoggerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_level"))
        min_level = level_from_string(j.at("min_level").get<std::string>());
    if (j.contains("destination"))
        destination = log_destination_from_string(j.at("destination").get<std::string>());
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
}

Result<void> LoggerConfig::validate() const {
    if (destination != LogDestination::CONSOLE) {
        if (log_directory.empty()) {
            return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                    "log_directory must be set for file logging", "LoggerConfig");
        }
        if (max_files == 0 || max_file_size == 0) {
            return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                    "max_files and max_file_size must be positive",
                                    "LoggerConfig");
        }
    }
    return Result<void>();
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::reset_for_tests() {
    Logger& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.initialized_.store(false, std::memory_order_release);
    if (logger.log_file_.is_open()) {
        logger.log_file_.close();
    }
    logger.log_path_.clear();
    logger.session_timestamp_.clear();
    logger.part_number_ = 0;
    logger.min_level_.store(LogLevel::INFO, std::memory_order_relaxed);
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    min_level_.store(config.min_level, std::memory_order_relaxed);

    if (log_file_.is_open()) {
        log_file_.close();
    }
    log_path_.clear();

    if (config_.destination != LogDestination::CONSOLE) {
        std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);

        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create log directory: " + log_dir.string() +
                                     " - " + ec.message());
        }

        session_timestamp_ = core::get_formatted_time("%Y%m%d_%H%M%S");
        part_number_ = 0;
        open_next_part_unsafe();

        if (!log_file_.is_open()) {
            throw std::runtime_error("Failed to open log file: " + log_path_.string());
        }
    }

    initialized_.store(true, std::memory_order_release);
}

void Logger::enforce_retention_unsafe(const std::filesystem::path& log_dir) const {
    std::vector<std::filesystem::path> log_files;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".log") {
            log_files.push_back(entry.path());
        }
    }

    std::sort(log_files.begin(), log_files.end(), [](const auto& a, const auto& b) {
        return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
    });

    // Leave room for the part about to be opened
    size_t excess = log_files.size() >= config_.max_files ? log_files.size() - config_.max_files + 1
                                                          : 0;
    for (size_t i = 0; i < excess; ++i) {
        std::error_code ec;
        std::filesystem::remove(log_files[i], ec);
    }
}

void Logger::open_next_part_unsafe() {
    if (log_file_.is_open()) {
        log_file_.close();
    }

    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);
    enforce_retention_unsafe(log_dir);

    ++part_number_;
    log_path_ = log_dir / (config_.filename_prefix + "_" + session_timestamp_ + "_part" +
                           std::to_string(part_number_) + ".log");
    log_file_.open(log_path_, std::ios::app);
}

std::string Logger::current_file() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_path_.string();
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_.load(std::memory_order_acquire)) {
        std::cerr << "WARNING: Logger not initialized. Message: " << message << std::endl;
        return;
    }

    if (level < min_level_.load(std::memory_order_relaxed)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::string line = format_message(level, message);

    if (config_.destination != LogDestination::FILE) {
        std::cout << line << std::endl;
    }

    if (config_.destination != LogDestination::CONSOLE && log_file_.is_open()) {
        log_file_ << line << '\n';
        log_file_.flush();
        if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
            open_next_part_unsafe();
        }
    }
}

std::string Logger::format_message(LogLevel level, const std::string& message) const {
    std::ostringstream ss;

    if (config_.include_timestamp) {
        ss << core::get_formatted_time("%Y-%m-%d %H:%M:%S") << " ";
    }

    if (config_.include_level) {
        ss << "[" << level_to_string(level) << "] ";
    }

    if (!current_component_.empty()) {
        ss << "[" << current_component_ << "] ";
    }

    ss << message;
    return ss.str();
}

}  // namespace papertrade
