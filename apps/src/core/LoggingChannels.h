#pragma once

// Enable all log levels for SPDLOG_LOGGER_* macros (must be before spdlog includes).
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace DiceTune {

/**
 * @brief Logging channels, one per optimizer subsystem.
 */
enum class LogChannel { Config, Confirm, Evaluation, Evolution, Pool, Progress, Stagnation };

inline const char* toString(LogChannel channel)
{
    switch (channel) {
        case LogChannel::Config:
            return "config";
        case LogChannel::Confirm:
            return "confirm";
        case LogChannel::Evaluation:
            return "evaluation";
        case LogChannel::Evolution:
            return "evolution";
        case LogChannel::Pool:
            return "pool";
        case LogChannel::Progress:
            return "progress";
        case LogChannel::Stagnation:
            return "stagnation";
    }
    return "";
}

/**
 * @brief Centralized logging channel management for fine-grained log filtering.
 *
 * Every channel logger shares a console sink and the dicetune.log file sink, so
 * a noisy subsystem can be silenced without losing the others.
 */
class LoggingChannels {
public:
    /**
     * @brief Initialize the logging system with shared sinks.
     * @param consoleLevel Default log level for console output
     * @param fileLevel Default log level for file output
     * @param componentName Component name for the log pattern (e.g., "cli")
     * @param consoleToStderr Send console output to stderr (keeps stdout clean for JSON)
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug,
        const std::string& componentName = "default",
        bool consoleToStderr = false);

    /**
     * @brief Get a specific channel logger.
     */
    static std::shared_ptr<spdlog::logger> get(LogChannel channel);

    /**
     * @brief Configure channels from a specification string.
     * @param spec Format: "channel:level,channel2:level2" or "*:level" for all
     * Examples:
     *   "confirm:trace,evaluation:debug" - Set confirm to trace, evaluation to debug
     *   "*:off,progress:info" - Disable all except the progress stream
     */
    static void configureFromString(const std::string& spec);

    /**
     * @brief Set the log level for a specific channel.
     */
    static void setChannelLevel(LogChannel channel, spdlog::level::level_enum level);

    /**
     * @brief Set the log level for a channel by name. Unknown names are reported and ignored.
     */
    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    /**
     * @brief Persist the progress channel to an append-only file.
     * @return false if the file could not be opened.
     */
    static bool addProgressLogFile(const std::string& path);

    /**
     * @brief Parse a log level string to enum ("warn", "error", "off", ...).
     */
    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

private:
    static void createLogger(
        const std::string& name,
        const std::vector<spdlog::sink_ptr>& sinks,
        spdlog::level::level_enum level);

    static bool initialized_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

#ifdef LOG_TRACE
#undef LOG_TRACE
#endif
#ifdef LOG_DEBUG
#undef LOG_DEBUG
#endif
#ifdef LOG_INFO
#undef LOG_INFO
#endif
#ifdef LOG_WARN
#undef LOG_WARN
#endif
#ifdef LOG_ERROR
#undef LOG_ERROR
#endif

#define LOG_TRACE(channel, ...) \
    SPDLOG_LOGGER_TRACE(LoggingChannels::get(::DiceTune::LogChannel::channel), __VA_ARGS__)
#define LOG_DEBUG(channel, ...) \
    SPDLOG_LOGGER_DEBUG(LoggingChannels::get(::DiceTune::LogChannel::channel), __VA_ARGS__)
#define LOG_INFO(channel, ...) \
    SPDLOG_LOGGER_INFO(LoggingChannels::get(::DiceTune::LogChannel::channel), __VA_ARGS__)
#define LOG_WARN(channel, ...) \
    SPDLOG_LOGGER_WARN(LoggingChannels::get(::DiceTune::LogChannel::channel), __VA_ARGS__)
#define LOG_ERROR(channel, ...) \
    SPDLOG_LOGGER_ERROR(LoggingChannels::get(::DiceTune::LogChannel::channel), __VA_ARGS__)

// Simple logging macros using default logger (no channel parameter, omits channel in output).
#define SLOG_TRACE(...) SPDLOG_LOGGER_TRACE(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_INFO(...) SPDLOG_LOGGER_INFO(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_WARN(...) SPDLOG_LOGGER_WARN(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_ERROR(...) SPDLOG_LOGGER_ERROR(spdlog::default_logger(), __VA_ARGS__)

} // namespace DiceTune
