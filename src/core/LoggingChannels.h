#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <vector>

namespace EvoSim {

/**
 * @brief Named logger channels for the simulation subsystems.
 *
 * Every channel writes to the same shared sinks (colour console + log file) so that a single
 * subsystem can be turned up to trace without flooding the output with the others.
 */
class LoggingChannels {
public:
    /**
     * @brief Create the shared sinks and all channel loggers.
     * @param consoleLevel Level filter on the console sink.
     * @param fileLevel Level filter on the file sink.
     * @param logFile Path of the file sink; empty disables file output.
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug,
        const std::string& logFile = "evosim.log");

    /**
     * @brief Initialize from a JSON config file.
     * Prefers <configPath>.local when it exists. A missing config is written out with
     * defaults so it can be edited.
     * @return false when already initialized.
     */
    static bool initializeFromConfig(const std::string& configPath = "logging-config.json");

    /**
     * @brief Logger for a channel, or the default logger when the channel is unknown.
     */
    static std::shared_ptr<spdlog::logger> get(const std::string& channel);

    /**
     * @brief Apply "channel:level" pairs, comma separated. "*" addresses every channel.
     * Example: "*:off,reproduction:trace".
     */
    static void configureFromString(const std::string& spec);

    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    static bool isInitialized() { return initialized_; }

    // Drops all channel loggers and sinks. Used between test cases.
    static void shutdown();

    static const std::vector<std::string_view>& channelNames();

    static std::shared_ptr<spdlog::logger> energy() { return get("energy"); }
    static std::shared_ptr<spdlog::logger> density() { return get("density"); }
    static std::shared_ptr<spdlog::logger> targets() { return get("targets"); }
    static std::shared_ptr<spdlog::logger> reproduction() { return get("reproduction"); }
    static std::shared_ptr<spdlog::logger> decay() { return get("decay"); }
    static std::shared_ptr<spdlog::logger> scarcity() { return get("scarcity"); }
    static std::shared_ptr<spdlog::logger> events() { return get("events"); }
    static std::shared_ptr<spdlog::logger> interaction() { return get("interaction"); }
    static std::shared_ptr<spdlog::logger> tick() { return get("tick"); }
    static std::shared_ptr<spdlog::logger> config() { return get("config"); }

private:
    static void createChannelLoggers(spdlog::level::level_enum level);

    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

    static nlohmann::json defaultConfig();

    static nlohmann::json loadConfigFile(const std::string& configPath);

    static bool writeDefaultConfigFile(const std::string& path);

    static void applyConfig(const nlohmann::json& config);

    static bool initialized_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

} // namespace EvoSim
