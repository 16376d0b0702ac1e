#pragma once

#include "SimulationSettings.h"

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <random>
#include <string_view>
#include <vector>

namespace EvoSim {

enum class EventType : uint8_t { FLOOD = 0, DROUGHT, HEATWAVE, COLDWAVE };

constexpr size_t EVENT_TYPE_COUNT = 4;

std::string_view eventTypeName(EventType type);
std::optional<EventType> eventTypeFromName(std::string_view name);

// Affected rectangle; x/width are columns, y/height are rows.
struct EventArea {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool contains(int row, int col) const
    {
        return col >= x && col < x + width && row >= y && row < y + height;
    }
};

struct Event {
    EventType type = EventType::FLOOD;
    double strength = 0.0;
    EventArea area;
    int remaining = 0; // Ticks left.
};

// regenScale = max(min, base + change * strength).
struct RegenScale {
    double base;
    double change;
    double min;
};

struct EventEffect {
    double regenAdd;
    std::optional<RegenScale> regenScale;
    double drainAdd;
    double energyLoss; // Direct organism damage at strength 1.
};

const EventEffect& eventEffect(EventType type);

/**
 * Combined effect of all events covering one tile.
 * Scales multiply; adds and drains are strength-weighted and summed.
 */
struct EnergyModifiers {
    double regenScale = 1.0;
    double regenAdd = 0.0;
    double drainAdd = 0.0;
    double energyLoss = 0.0;
    double strength = 0.0; // Strongest covering event.
};

/**
 * Active environmental events plus the random generator that spawns new ones.
 *
 * Events are indexed by the rows they cover so per-tile lookups outside every event stay
 * free. Subclasses can replace the random generation by overriding update().
 */
class EventManager {
public:
    EventManager(int rows, int cols);
    virtual ~EventManager() = default;

    // Clamps the area to the grid; events with an empty area or no duration are ignored.
    virtual void addEvent(const Event& event);

    /**
     * @brief Advance one tick: age and expire events, then maybe spawn a random one.
     * Spawning needs events enabled, a positive frequency, fewer than max_concurrent active
     * events and an elapsed cooldown.
     */
    virtual void update(const EventSettings& settings, std::mt19937& rng);

    /**
     * @brief Roll the first cooldown, and spawn an opening event when configured.
     */
    virtual void reset(const EventSettings& settings, std::mt19937& rng);

    virtual void clear();

    const std::vector<Event>& getActiveEvents() const { return events_; }

    bool rowHasEvents(int row) const;

    EnergyModifiers modifiersAt(int row, int col, double strengthMultiplier) const;

    int getCooldown() const { return cooldown_; }

    nlohmann::json toJson() const;

protected:
    Event makeRandomEvent(const EventSettings& settings, std::mt19937& rng) const;
    int rollCooldown(const EventSettings& settings, std::mt19937& rng) const;

    void rebuildRowIndex();

    int rows_;
    int cols_;
    int cooldown_ = 0;
    std::vector<Event> events_;
    std::vector<std::vector<size_t>> rowIndex_;
};

} // namespace EvoSim
