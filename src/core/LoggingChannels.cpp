#include "LoggingChannels.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <sstream>
#include <stdexcept>

namespace EvoSim {

namespace {

constexpr const char* DEFAULT_PATTERN = "[%H:%M:%S.%e] [%n] [%^%l%$] %v";

std::string trim(std::string s)
{
    s.erase(0, s.find_first_not_of(" \t"));
    s.erase(s.find_last_not_of(" \t") + 1);
    return s;
}

} // namespace

bool LoggingChannels::initialized_ = false;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

const std::vector<std::string_view>& LoggingChannels::channelNames()
{
    static const std::vector<std::string_view> names = { "energy",      "density",  "targets",
                                                         "reproduction", "decay",    "scarcity",
                                                         "events",       "interaction", "tick",
                                                         "config" };
    return names;
}

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& logFile)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(consoleLevel);
    sharedSinks_ = { consoleSink };

    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
        fileSink->set_level(fileLevel);
        sharedSinks_.push_back(fileSink);
    }

    spdlog::set_pattern(DEFAULT_PATTERN);

    // Channel loggers pass everything; the sinks and per-channel overrides do the filtering.
    createChannelLoggers(spdlog::level::trace);
    setChannelLevel("tick", spdlog::level::info);
    setChannelLevel("config", spdlog::level::info);

    auto defaultLogger =
        std::make_shared<spdlog::logger>("default", sharedSinks_.begin(), sharedSinks_.end());
    defaultLogger->set_level(spdlog::level::info);
    spdlog::set_default_logger(defaultLogger);

    spdlog::flush_every(std::chrono::seconds(1));

    initialized_ = true;
    spdlog::info("LoggingChannels initialized ({} channels)", channelNames().size());
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(const std::string& channel)
{
    auto logger = spdlog::get(channel);
    if (!logger) {
        return spdlog::default_logger();
    }
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) return;

    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item = trim(item);
        const size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", item);
            continue;
        }

        const std::string channel = trim(item.substr(0, colonPos));
        const auto level = parseLevelString(trim(item.substr(colonPos + 1)));

        if (channel == "*") {
            for (auto name : channelNames()) {
                setChannelLevel(std::string(name), level);
            }
        }
        else {
            setChannelLevel(channel, level);
        }
    }
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    auto logger = spdlog::get(channel);
    if (!logger) {
        spdlog::warn("Channel '{}' not found, cannot set level", channel);
        return;
    }

    logger->set_level(level);
    spdlog::debug("Set channel '{}' to level: {}", channel, spdlog::level::to_string_view(level));
}

void LoggingChannels::shutdown()
{
    for (auto name : channelNames()) {
        spdlog::drop(std::string(name));
    }
    sharedSinks_.clear();
    initialized_ = false;
}

void LoggingChannels::createChannelLoggers(spdlog::level::level_enum level)
{
    for (auto name : channelNames()) {
        const std::string channel(name);
        spdlog::drop(channel);
        auto logger = std::make_shared<spdlog::logger>(
            channel, sharedSinks_.begin(), sharedSinks_.end());
        logger->set_level(level);
        spdlog::register_logger(logger);
    }
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error" || lower == "err") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;

    spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
    return spdlog::level::info;
}

nlohmann::json LoggingChannels::defaultConfig()
{
    nlohmann::json channels = nlohmann::json::object();
    for (auto name : channelNames()) {
        channels[std::string(name)] = "info";
    }

    return { { "defaults", { { "pattern", DEFAULT_PATTERN }, { "flush_interval_ms", 1000 } } },
             { "sinks",
               { { "console", { { "enabled", true }, { "level", "info" } } },
                 { "file",
                   { { "enabled", true },
                     { "level", "debug" },
                     { "path", "evosim.log" },
                     { "truncate", true } } } } },
             { "channels", channels } };
}

bool LoggingChannels::initializeFromConfig(const std::string& configPath)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }

    applyConfig(loadConfigFile(configPath));

    initialized_ = true;
    return true;
}

bool LoggingChannels::writeDefaultConfigFile(const std::string& path)
{
    std::ofstream configFile(path);
    if (!configFile.is_open()) {
        spdlog::error("Failed to create config file: {}", path);
        return false;
    }

    configFile << defaultConfig().dump(2) << std::endl;
    spdlog::info("Created default logging config file: {}", path);
    return true;
}

nlohmann::json LoggingChannels::loadConfigFile(const std::string& configPath)
{
    namespace fs = std::filesystem;

    const std::string localPath = configPath + ".local";
    std::string pathToUse;

    if (fs::exists(localPath)) {
        pathToUse = localPath;
        spdlog::info("Using local config override: {}", localPath);
    }
    else if (fs::exists(configPath)) {
        pathToUse = configPath;
    }
    else {
        spdlog::info("Logging config not found, creating default: {}", configPath);
        if (!writeDefaultConfigFile(configPath)) {
            spdlog::warn("Could not create logging config, using built-in defaults");
        }
        return defaultConfig();
    }

    std::ifstream configFile(pathToUse);
    if (!configFile.is_open()) {
        throw std::runtime_error("Cannot open logging config file: " + pathToUse);
    }

    try {
        return nlohmann::json::parse(configFile);
    }
    catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(
            "Failed to parse logging config " + pathToUse + ": " + std::string(e.what()));
    }
}

void LoggingChannels::applyConfig(const nlohmann::json& config)
{
    std::string pattern = DEFAULT_PATTERN;
    int flushIntervalMs = 1000;

    if (auto it = config.find("defaults"); it != config.end() && it->is_object()) {
        pattern = it->value("pattern", pattern);
        flushIntervalMs = it->value("flush_interval_ms", flushIntervalMs);
    }

    std::vector<spdlog::sink_ptr> sinks;
    const nlohmann::json sinksConfig = config.value("sinks", nlohmann::json::object());

    if (auto it = sinksConfig.find("console"); it != sinksConfig.end()) {
        if (it->value("enabled", true)) {
            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_level(parseLevelString(it->value("level", "info")));
            sinks.push_back(consoleSink);
        }
    }

    if (auto it = sinksConfig.find("file"); it != sinksConfig.end()) {
        if (it->value("enabled", true)) {
            const std::string path = it->value("path", "evosim.log");
            spdlog::sink_ptr fileSink;

            // A size limit selects the rotating sink.
            if (it->contains("max_size_mb")) {
                const size_t maxBytes = it->value("max_size_mb", size_t{ 100 }) * 1024 * 1024;
                const size_t maxFiles = it->value("max_files", size_t{ 3 });
                fileSink =
                    std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, maxBytes, maxFiles);
            }
            else {
                fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                    path, it->value("truncate", true));
            }

            fileSink->set_level(parseLevelString(it->value("level", "debug")));
            sinks.push_back(fileSink);
        }
    }

    sharedSinks_ = sinks;
    spdlog::set_pattern(pattern);

    createChannelLoggers(spdlog::level::trace);

    if (auto it = config.find("channels"); it != config.end() && it->is_object()) {
        for (const auto& [channel, levelStr] : it->items()) {
            if (levelStr.is_string()) {
                setChannelLevel(channel, parseLevelString(levelStr.get<std::string>()));
            }
        }
    }

    auto defaultLogger =
        std::make_shared<spdlog::logger>("default", sharedSinks_.begin(), sharedSinks_.end());
    defaultLogger->set_level(spdlog::level::info);
    spdlog::set_default_logger(defaultLogger);

    spdlog::flush_every(std::chrono::milliseconds(flushIntervalMs));

    spdlog::info("LoggingChannels initialized from config");
}

} // namespace EvoSim
