#include "EventManager.h"
#include "LoggingChannels.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <nlohmann/json.hpp>
#include <string>

namespace EvoSim {

namespace {

constexpr std::array<std::string_view, EVENT_TYPE_COUNT> EVENT_NAMES = {
    "flood", "drought", "heatwave", "coldwave"
};

// clang-format off
const std::array<EventEffect, EVENT_TYPE_COUNT> EVENT_EFFECTS = { {
    { .regenAdd = 0.25, .regenScale = std::nullopt,               .drainAdd = 0.0,  .energyLoss = 0.3  },
    { .regenAdd = 0.0,  .regenScale = RegenScale{ 1.0, -0.7, 0.0 },  .drainAdd = 0.1,  .energyLoss = 0.25 },
    { .regenAdd = 0.0,  .regenScale = RegenScale{ 1.0, -0.45, 0.0 }, .drainAdd = 0.08, .energyLoss = 0.35 },
    { .regenAdd = 0.0,  .regenScale = RegenScale{ 1.0, -0.25, 0.0 }, .drainAdd = 0.0,  .energyLoss = 0.2  },
} };
// clang-format on

int spanFor(int extent, const EventSettings& settings)
{
    const int span = std::max(
        settings.span_min, static_cast<int>(std::floor(extent * settings.span_ratio)));
    return std::clamp(span, 1, std::max(1, extent));
}

} // namespace

std::string_view eventTypeName(EventType type)
{
    return EVENT_NAMES[static_cast<size_t>(type)];
}

std::optional<EventType> eventTypeFromName(std::string_view name)
{
    for (size_t i = 0; i < EVENT_TYPE_COUNT; ++i) {
        if (EVENT_NAMES[i] == name) {
            return static_cast<EventType>(i);
        }
    }
    return std::nullopt;
}

const EventEffect& eventEffect(EventType type)
{
    return EVENT_EFFECTS[static_cast<size_t>(type)];
}

EventManager::EventManager(int rows, int cols)
    : rows_(std::max(0, rows)), cols_(std::max(0, cols)), rowIndex_(static_cast<size_t>(rows_))
{}

void EventManager::addEvent(const Event& event)
{
    Event clipped = event;
    const int x0 = std::clamp(event.area.x, 0, cols_);
    const int y0 = std::clamp(event.area.y, 0, rows_);
    const int x1 = std::clamp(event.area.x + event.area.width, 0, cols_);
    const int y1 = std::clamp(event.area.y + event.area.height, 0, rows_);
    clipped.area = { .x = x0, .y = y0, .width = x1 - x0, .height = y1 - y0 };
    clipped.strength = std::isfinite(event.strength) ? std::max(0.0, event.strength) : 0.0;

    if (clipped.area.width <= 0 || clipped.area.height <= 0 || clipped.remaining <= 0) {
        LoggingChannels::events()->debug(
            "Ignoring {} event with empty area or duration", eventTypeName(event.type));
        return;
    }

    events_.push_back(clipped);
    rebuildRowIndex();

    LoggingChannels::events()->info(
        "{} started: strength {:.2f}, area ({}, {}) {}x{}, {} ticks",
        eventTypeName(clipped.type),
        clipped.strength,
        clipped.area.x,
        clipped.area.y,
        clipped.area.width,
        clipped.area.height,
        clipped.remaining);
}

void EventManager::update(const EventSettings& settings, std::mt19937& rng)
{
    bool changed = false;
    for (auto& event : events_) {
        --event.remaining;
    }

    auto expired = std::remove_if(events_.begin(), events_.end(), [](const Event& event) {
        return event.remaining <= 0;
    });
    if (expired != events_.end()) {
        for (auto it = expired; it != events_.end(); ++it) {
            LoggingChannels::events()->info("{} ended", eventTypeName(it->type));
        }
        events_.erase(expired, events_.end());
        changed = true;
    }

    if (changed) {
        rebuildRowIndex();
    }

    if (!settings.enabled || settings.frequency_multiplier <= 0.0) {
        return;
    }

    if (cooldown_ > 0) {
        --cooldown_;
        return;
    }

    if (static_cast<int>(events_.size()) >= settings.max_concurrent) {
        return;
    }

    addEvent(makeRandomEvent(settings, rng));
    cooldown_ = rollCooldown(settings, rng);
}

void EventManager::reset(const EventSettings& settings, std::mt19937& rng)
{
    clear();
    if (!settings.enabled || settings.frequency_multiplier <= 0.0) {
        cooldown_ = 0;
        return;
    }

    if (settings.start_with_event && settings.max_concurrent > 0) {
        addEvent(makeRandomEvent(settings, rng));
    }
    cooldown_ = rollCooldown(settings, rng);
}

void EventManager::clear()
{
    events_.clear();
    rebuildRowIndex();
}

bool EventManager::rowHasEvents(int row) const
{
    return row >= 0 && row < rows_ && !rowIndex_[row].empty();
}

EnergyModifiers EventManager::modifiersAt(int row, int col, double strengthMultiplier) const
{
    EnergyModifiers mods;
    if (!rowHasEvents(row)) {
        return mods;
    }

    const double multiplier = std::isfinite(strengthMultiplier) ? std::max(0.0, strengthMultiplier) : 1.0;
    for (size_t i : rowIndex_[row]) {
        const Event& event = events_[i];
        if (!event.area.contains(row, col)) {
            continue;
        }

        const double strength = event.strength * multiplier;
        const EventEffect& effect = eventEffect(event.type);
        if (effect.regenScale) {
            const auto& scale = *effect.regenScale;
            mods.regenScale *= std::max(scale.min, scale.base + scale.change * strength);
        }
        mods.regenAdd += effect.regenAdd * strength;
        mods.drainAdd += effect.drainAdd * strength;
        mods.energyLoss = std::max(mods.energyLoss, effect.energyLoss);
        mods.strength = std::max(mods.strength, strength);
    }
    return mods;
}

nlohmann::json EventManager::toJson() const
{
    nlohmann::json events = nlohmann::json::array();
    for (const auto& event : events_) {
        events.push_back({ { "type", std::string(eventTypeName(event.type)) },
                           { "strength", event.strength },
                           { "x", event.area.x },
                           { "y", event.area.y },
                           { "width", event.area.width },
                           { "height", event.area.height },
                           { "remaining", event.remaining } });
    }
    return { { "cooldown", cooldown_ }, { "events", events } };
}

Event EventManager::makeRandomEvent(const EventSettings& settings, std::mt19937& rng) const
{
    Event event;
    event.type = static_cast<EventType>(
        std::uniform_int_distribution<int>(0, static_cast<int>(EVENT_TYPE_COUNT) - 1)(rng));
    event.remaining =
        std::uniform_int_distribution<int>(settings.duration_min, settings.duration_max)(rng);
    event.strength = settings.strength_max > settings.strength_min
        ? std::uniform_real_distribution<double>(settings.strength_min, settings.strength_max)(rng)
        : settings.strength_min;

    const int width = spanFor(cols_, settings);
    const int height = spanFor(rows_, settings);
    event.area.width = width;
    event.area.height = height;
    event.area.x = std::uniform_int_distribution<int>(0, std::max(0, cols_ - width))(rng);
    event.area.y = std::uniform_int_distribution<int>(0, std::max(0, rows_ - height))(rng);
    return event;
}

int EventManager::rollCooldown(const EventSettings& settings, std::mt19937& rng) const
{
    const double raw = settings.cooldown_max > settings.cooldown_min
        ? std::uniform_real_distribution<double>(settings.cooldown_min, settings.cooldown_max)(rng)
        : settings.cooldown_min;
    return static_cast<int>(std::floor(raw / settings.frequency_multiplier));
}

void EventManager::rebuildRowIndex()
{
    for (auto& row : rowIndex_) {
        row.clear();
    }
    for (size_t i = 0; i < events_.size(); ++i) {
        const auto& area = events_[i].area;
        for (int row = area.y; row < area.y + area.height; ++row) {
            rowIndex_[row].push_back(i);
        }
    }
}

} // namespace EvoSim
