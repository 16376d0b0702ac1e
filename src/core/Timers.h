#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace EvoSim {

/**
 * Named accumulating wall-clock timers for the tick phases.
 * All durations are reported in milliseconds.
 */
class Timers {
public:
    void startTimer(const std::string& name);

    // Returns the accumulated time, or -1 for an unknown timer.
    double stopTimer(const std::string& name);

    bool hasTimer(const std::string& name) const;

    // Includes the in-flight interval of a running timer.
    double getAccumulatedTime(const std::string& name) const;

    void resetTimer(const std::string& name);
    uint32_t getCallCount(const std::string& name) const;
    void resetCallCount(const std::string& name);
    void resetAll();

    std::vector<std::string> getAllTimerNames() const;

    // Logs every timer, relative to the "tick" timer when one exists.
    void dumpTimerStats() const;

    nlohmann::json exportAllTimersAsJson() const;

private:
    using TimePoint = std::chrono::steady_clock::time_point;

    struct TimerData {
        TimePoint startTime;
        double accumulatedTime = 0.0;
        bool isRunning = false;
        uint32_t callCount = 0;
    };

    std::unordered_map<std::string, TimerData> timers_;
};

} // namespace EvoSim
