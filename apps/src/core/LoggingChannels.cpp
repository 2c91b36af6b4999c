#include "LoggingChannels.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>

namespace DiceTune {

bool LoggingChannels::initialized_ = false;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName,
    bool consoleToStderr)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    spdlog::sink_ptr console_sink;
    if (consoleToStderr) {
        console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    else {
        console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    console_sink->set_level(consoleLevel);

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>("dicetune.log", true);
    file_sink->set_level(fileLevel);

    sharedSinks_ = { console_sink, file_sink };

    std::string pattern = componentName == "default"
        ? "[%H:%M:%S.%e] [%n] [%^%l%$] %v"
        : "[%H:%M:%S.%e] [" + componentName + "] [%n] [%^%l%$] %v";
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    createLogger("config", sharedSinks_, spdlog::level::info);
    createLogger("confirm", sharedSinks_, spdlog::level::info);
    createLogger("evaluation", sharedSinks_, spdlog::level::info);
    createLogger("evolution", sharedSinks_, spdlog::level::info);
    createLogger("pool", sharedSinks_, spdlog::level::info);
    createLogger("progress", sharedSinks_, spdlog::level::info);
    createLogger("stagnation", sharedSinks_, spdlog::level::info);

    // Default logger gets its own sinks so its pattern does not affect channel loggers.
    spdlog::sink_ptr default_console_sink;
    if (consoleToStderr) {
        default_console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    else {
        default_console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    default_console_sink->set_level(consoleLevel);
    auto default_file_sink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>("dicetune.log", false);
    default_file_sink->set_level(fileLevel);

    std::string defaultPattern = componentName == "default"
        ? "[%H:%M:%S.%e] [%^%l%$] %v"
        : "[%H:%M:%S.%e] [" + componentName + "] [%^%l%$] %v";
    default_console_sink->set_pattern(defaultPattern);
    default_file_sink->set_pattern(defaultPattern);

    std::string loggerName = componentName.empty() ? "default" : componentName;
    std::vector<spdlog::sink_ptr> defaultSinks = { default_console_sink, default_file_sink };
    auto default_logger =
        std::make_shared<spdlog::logger>(loggerName, defaultSinks.begin(), defaultSinks.end());
    default_logger->set_level(spdlog::level::info);

    spdlog::set_default_logger(default_logger);

    spdlog::flush_every(std::chrono::seconds(1));

    initialized_ = true;
    SLOG_DEBUG("LoggingChannels initialized successfully");
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Auto-initialize with defaults if get() is called before initialize().
    // This commonly happens in unit tests that use gtest_main.
    if (!initialized_) {
        initialize();
    }

    auto logger = spdlog::get(toString(channel));
    if (!logger) {
        // Logger was dropped from the registry (e.g. spdlog::drop_all in a test).
        return spdlog::default_logger();
    }
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) return;

    if (!initialized_) {
        initialize();
    }

    // Parse format: "channel:level,channel2:level2"
    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);

        size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", item);
            continue;
        }

        std::string channel = item.substr(0, colonPos);
        std::string levelStr = item.substr(colonPos + 1);

        channel.erase(0, channel.find_first_not_of(" \t"));
        channel.erase(channel.find_last_not_of(" \t") + 1);
        levelStr.erase(0, levelStr.find_first_not_of(" \t"));
        levelStr.erase(levelStr.find_last_not_of(" \t") + 1);

        auto level = parseLevelString(levelStr);

        if (channel == "*") {
            spdlog::apply_all(
                [level](std::shared_ptr<spdlog::logger> logger) { logger->set_level(level); });
            spdlog::debug("Set all channels to level: {}", spdlog::level::to_string_view(level));
        }
        else {
            setChannelLevel(channel, level);
        }
    }
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    setChannelLevel(std::string(toString(channel)), level);
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    auto logger = spdlog::get(channel);
    if (!logger) {
        spdlog::warn("Unknown log channel '{}'", channel);
        return;
    }
    logger->set_level(level);
    spdlog::debug("Set channel '{}' to level: {}", channel, spdlog::level::to_string_view(level));
}

bool LoggingChannels::addProgressLogFile(const std::string& path)
{
    if (!initialized_) {
        initialize();
    }

    auto logger = spdlog::get(toString(LogChannel::Progress));
    if (!logger) {
        return false;
    }

    try {
        const std::filesystem::path filePath(path);
        if (filePath.has_parent_path()) {
            std::filesystem::create_directories(filePath.parent_path());
        }

        // Append mode: successive runs accumulate in the same file.
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
        sink->set_pattern("[%Y-%m-%d %H:%M:%S] %v");
        sink->set_level(spdlog::level::info);
        logger->sinks().push_back(sink);
    }
    catch (const std::exception& e) {
        spdlog::error("Cannot open progress log '{}': {}", path, e.what());
        return false;
    }

    spdlog::info("Progress stream persisted to {}", path);
    return true;
}

void LoggingChannels::createLogger(
    const std::string& name,
    const std::vector<spdlog::sink_ptr>& sinks,
    spdlog::level::level_enum level)
{
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    spdlog::register_logger(logger);
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "trace") {
        return spdlog::level::trace;
    }
    else if (lower == "debug") {
        return spdlog::level::debug;
    }
    else if (lower == "info") {
        return spdlog::level::info;
    }
    else if (lower == "warn" || lower == "warning") {
        return spdlog::level::warn;
    }
    else if (lower == "error" || lower == "err") {
        return spdlog::level::err;
    }
    else if (lower == "critical") {
        return spdlog::level::critical;
    }
    else if (lower == "off") {
        return spdlog::level::off;
    }
    else {
        spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
        return spdlog::level::info;
    }
}

} // namespace DiceTune
