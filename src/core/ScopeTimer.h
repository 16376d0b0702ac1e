#pragma once

#include "Timers.h"
#include <string>

namespace EvoSim {

// Times the enclosing scope under `name`.
class ScopeTimer {
public:
    ScopeTimer(Timers& timers, std::string name) : timers_(timers), name_(std::move(name))
    {
        timers_.startTimer(name_);
    }

    ~ScopeTimer() { timers_.stopTimer(name_); }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;

private:
    Timers& timers_;
    std::string name_;
};

} // namespace EvoSim
