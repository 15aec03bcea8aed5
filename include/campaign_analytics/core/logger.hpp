// include/campaign_analytics/core/logger.hpp
#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include "campaign_analytics/core/config_base.hpp"

namespace campaign_analytics {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Detailed debug information
    DEBUG,    // General debug information
    INFO,     // General information
    WARNING,  // Warnings that don't affect operation
    ERR,      // Errors that affect the current call
    FATAL     // Errors that stop the process
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
std::optional<LogLevel> level_from_string(const std::string& name);

std::string log_destination_to_string(LogDestination dest);
std::optional<LogDestination> log_destination_from_string(const std::string& name);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"campaign_analytics"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{50 * 1024 * 1024};  // 50MB
    size_t max_files{10};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;
};

/**
 * @brief Thread-safe logging singleton
 *
 * Writes to the console, a size-rotated log file, or both. File names follow
 * <prefix>_<YYYYMMDD_HHMMSS>_part<N>.log, one timestamp per initialize() call.
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

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
    }

    LogLevel get_min_level() const {
        return config_.min_level;
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Set the component name prefixed to messages logged by this thread
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

    void open_log_file();
    void prune_old_files();
    void rotate_log_files();
    void write_to_file_unsafe(const std::string& message);
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    static thread_local std::string current_component_;

    std::string current_session_timestamp_;  // YYYYMMDD_HHMMSS
    int current_part_number_{1};
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Rows: " << count)
 */
#define LOG(level, message)                                                                  \
    do {                                                                                     \
        if (level >= ::campaign_analytics::Logger::instance().get_min_level()) {            \
            std::ostringstream os;                                                           \
            os << message;                                                                   \
            ::campaign_analytics::Logger::instance().log(level, os.str());                   \
        }                                                                                    \
    } while (0)

#define TRACE(message) LOG(::campaign_analytics::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::campaign_analytics::LogLevel::DEBUG, message)
#define INFO(message) LOG(::campaign_analytics::LogLevel::INFO, message)
#define WARN(message) LOG(::campaign_analytics::LogLevel::WARNING, message)
#define ERROR(message) LOG(::campaign_analytics::LogLevel::ERR, message)
#define FATAL(message) LOG(::campaign_analytics::LogLevel::FATAL, message)

}  // namespace campaign_analytics
