#include "Timers.h"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace EvoSim {

void Timers::startTimer(const std::string& name)
{
    auto& timer = timers_[name];
    if (!timer.isRunning) {
        timer.startTime = std::chrono::steady_clock::now();
        timer.isRunning = true;
        timer.callCount++;
    }
}

double Timers::stopTimer(const std::string& name)
{
    auto it = timers_.find(name);
    if (it == timers_.end()) {
        return -1.0;
    }

    auto& timer = it->second;
    if (!timer.isRunning) {
        return timer.accumulatedTime;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - timer.startTime);
    timer.accumulatedTime += elapsed.count() / 1000.0;
    timer.isRunning = false;
    return timer.accumulatedTime;
}

bool Timers::hasTimer(const std::string& name) const
{
    return timers_.contains(name);
}

double Timers::getAccumulatedTime(const std::string& name) const
{
    auto it = timers_.find(name);
    if (it == timers_.end()) {
        return -1.0;
    }

    const auto& timer = it->second;
    if (!timer.isRunning) {
        return timer.accumulatedTime;
    }

    auto inFlight = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - timer.startTime);
    return timer.accumulatedTime + inFlight.count() / 1000.0;
}

void Timers::resetTimer(const std::string& name)
{
    auto it = timers_.find(name);
    if (it == timers_.end()) {
        return;
    }

    it->second.accumulatedTime = 0.0;
    if (it->second.isRunning) {
        it->second.startTime = std::chrono::steady_clock::now();
    }
}

uint32_t Timers::getCallCount(const std::string& name) const
{
    auto it = timers_.find(name);
    return it == timers_.end() ? 0 : it->second.callCount;
}

void Timers::resetCallCount(const std::string& name)
{
    auto it = timers_.find(name);
    if (it != timers_.end()) {
        it->second.callCount = 0;
    }
}

void Timers::resetAll()
{
    timers_.clear();
}

std::vector<std::string> Timers::getAllTimerNames() const
{
    std::vector<std::string> names;
    names.reserve(timers_.size());
    for (const auto& [name, data] : timers_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void Timers::dumpTimerStats() const
{
    const double tickTime = getAccumulatedTime("tick");
    const uint32_t tickCalls = getCallCount("tick");

    spdlog::info("Timer statistics ({} ticks):", tickCalls);
    for (const auto& name : getAllTimerNames()) {
        const double total = getAccumulatedTime(name);
        const uint32_t calls = getCallCount(name);
        const double avg = calls > 0 ? total / calls : 0.0;
        if (tickTime > 0.0 && name != "tick") {
            spdlog::info(
                "  {:<16} {:>10.3f}ms ({:5.1f}% of tick, {:.4f}ms avg, {} calls)",
                name,
                total,
                total / tickTime * 100.0,
                avg,
                calls);
        }
        else {
            spdlog::info("  {:<16} {:>10.3f}ms ({:.4f}ms avg, {} calls)", name, total, avg, calls);
        }
    }
}

nlohmann::json Timers::exportAllTimersAsJson() const
{
    nlohmann::json j = nlohmann::json::object();

    for (const auto& [name, data] : timers_) {
        const double totalMs = getAccumulatedTime(name);
        const double avgMs = data.callCount > 0 ? totalMs / data.callCount : 0.0;
        j[name] = { { "total_ms", totalMs }, { "avg_ms", avgMs }, { "calls", data.callCount } };
    }

    return j;
}

} // namespace EvoSim
