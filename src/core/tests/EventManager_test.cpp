#include "core/EventManager.h"
#include "core/SimulationSettings.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <random>

using namespace EvoSim;

class EventManagerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        settings = getDefaultSimulationSettings().events;
        rng.seed(42);
    }

    EventSettings settings;
    std::mt19937 rng;
};

TEST_F(EventManagerTest, TypeNamesRoundTrip)
{
    for (size_t i = 0; i < EVENT_TYPE_COUNT; ++i) {
        const auto type = static_cast<EventType>(i);
        EXPECT_EQ(eventTypeFromName(eventTypeName(type)), type);
    }
    EXPECT_FALSE(eventTypeFromName("meteor").has_value());
}

TEST_F(EventManagerTest, AddEventClipsToGrid)
{
    EventManager events(10, 8);
    events.addEvent({ .type = EventType::FLOOD,
                      .strength = 0.5,
                      .area = { .x = -3, .y = 6, .width = 6, .height = 10 },
                      .remaining = 5 });

    ASSERT_EQ(events.getActiveEvents().size(), 1u);
    const EventArea& area = events.getActiveEvents()[0].area;
    EXPECT_EQ(area.x, 0);
    EXPECT_EQ(area.y, 6);
    EXPECT_EQ(area.width, 3);
    EXPECT_EQ(area.height, 4);

    EXPECT_TRUE(events.rowHasEvents(6));
    EXPECT_TRUE(events.rowHasEvents(9));
    EXPECT_FALSE(events.rowHasEvents(5));
}

TEST_F(EventManagerTest, IgnoresEmptyEvents)
{
    EventManager events(10, 10);
    events.addEvent({ .type = EventType::FLOOD,
                      .strength = 1.0,
                      .area = { .x = 20, .y = 0, .width = 4, .height = 4 },
                      .remaining = 5 });
    events.addEvent({ .type = EventType::FLOOD,
                      .strength = 1.0,
                      .area = { .x = 0, .y = 0, .width = 4, .height = 4 },
                      .remaining = 0 });

    EXPECT_TRUE(events.getActiveEvents().empty());
}

TEST_F(EventManagerTest, ModifiersCombineOverlappingEvents)
{
    EventManager events(6, 6);
    events.addEvent({ .type = EventType::DROUGHT,
                      .strength = 1.0,
                      .area = { .x = 0, .y = 0, .width = 4, .height = 6 },
                      .remaining = 10 });
    events.addEvent({ .type = EventType::FLOOD,
                      .strength = 0.5,
                      .area = { .x = 2, .y = 0, .width = 4, .height = 6 },
                      .remaining = 10 });

    const EnergyModifiers droughtOnly = events.modifiersAt(1, 0, 1.0);
    EXPECT_NEAR(droughtOnly.regenScale, 0.3, 1e-12);
    EXPECT_NEAR(droughtOnly.drainAdd, 0.1, 1e-12);
    EXPECT_DOUBLE_EQ(droughtOnly.regenAdd, 0.0);
    EXPECT_DOUBLE_EQ(droughtOnly.energyLoss, 0.25);

    const EnergyModifiers both = events.modifiersAt(1, 3, 1.0);
    EXPECT_NEAR(both.regenScale, 0.3, 1e-12);
    EXPECT_NEAR(both.regenAdd, 0.125, 1e-12);
    EXPECT_DOUBLE_EQ(both.energyLoss, 0.3);
    EXPECT_DOUBLE_EQ(both.strength, 1.0);

    const EnergyModifiers doubled = events.modifiersAt(1, 0, 2.0);
    EXPECT_DOUBLE_EQ(doubled.regenScale, 0.0);
    EXPECT_NEAR(doubled.drainAdd, 0.2, 1e-12);
}

TEST_F(EventManagerTest, TilesOutsideEventsAreNeutral)
{
    EventManager events(6, 6);
    events.addEvent({ .type = EventType::HEATWAVE,
                      .strength = 1.0,
                      .area = { .x = 0, .y = 0, .width = 2, .height = 2 },
                      .remaining = 10 });

    const EnergyModifiers mods = events.modifiersAt(4, 4, 1.0);
    EXPECT_DOUBLE_EQ(mods.regenScale, 1.0);
    EXPECT_DOUBLE_EQ(mods.regenAdd, 0.0);
    EXPECT_DOUBLE_EQ(mods.drainAdd, 0.0);
    EXPECT_DOUBLE_EQ(mods.energyLoss, 0.0);
}

TEST_F(EventManagerTest, EventsExpire)
{
    EventManager events(6, 6);
    settings.enabled = false;
    events.addEvent({ .type = EventType::COLDWAVE,
                      .strength = 1.0,
                      .area = { .x = 0, .y = 0, .width = 6, .height = 6 },
                      .remaining = 2 });

    events.update(settings, rng);
    EXPECT_EQ(events.getActiveEvents().size(), 1u);
    EXPECT_EQ(events.getActiveEvents()[0].remaining, 1);

    events.update(settings, rng);
    EXPECT_TRUE(events.getActiveEvents().empty());
    EXPECT_FALSE(events.rowHasEvents(0));
}

TEST_F(EventManagerTest, DisabledManagerNeverSpawns)
{
    EventManager events(20, 20);
    settings.enabled = false;
    settings.cooldown_min = 0;
    settings.cooldown_max = 0;
    events.reset(settings, rng);

    for (int i = 0; i < 50; ++i) {
        events.update(settings, rng);
    }
    EXPECT_TRUE(events.getActiveEvents().empty());
}

TEST_F(EventManagerTest, SpawnsAfterCooldownUpToConcurrencyLimit)
{
    EventManager events(30, 30);
    settings.cooldown_min = 3;
    settings.cooldown_max = 3;
    settings.max_concurrent = 1;
    settings.duration_min = 1000;
    settings.duration_max = 1000;
    events.reset(settings, rng);

    EXPECT_EQ(events.getCooldown(), 3);
    for (int i = 0; i < 3; ++i) {
        events.update(settings, rng);
        EXPECT_TRUE(events.getActiveEvents().empty());
    }

    events.update(settings, rng);
    ASSERT_EQ(events.getActiveEvents().size(), 1u);

    const Event& spawned = events.getActiveEvents()[0];
    EXPECT_GE(spawned.strength, settings.strength_min);
    EXPECT_LE(spawned.strength, settings.strength_max);
    EXPECT_EQ(spawned.area.width, 10);
    EXPECT_EQ(spawned.area.height, 10);
    EXPECT_LE(spawned.area.x + spawned.area.width, 30);

    for (int i = 0; i < 20; ++i) {
        events.update(settings, rng);
    }
    EXPECT_EQ(events.getActiveEvents().size(), 1u);
}

TEST_F(EventManagerTest, FrequencyMultiplierShortensCooldown)
{
    EventManager events(10, 10);
    settings.cooldown_min = 100;
    settings.cooldown_max = 100;
    settings.frequency_multiplier = 4.0;
    events.reset(settings, rng);

    EXPECT_EQ(events.getCooldown(), 25);
}

TEST_F(EventManagerTest, StartWithEvent)
{
    EventManager events(10, 10);
    settings.start_with_event = true;
    events.reset(settings, rng);

    EXPECT_EQ(events.getActiveEvents().size(), 1u);

    const nlohmann::json j = events.toJson();
    ASSERT_EQ(j["events"].size(), 1u);
    EXPECT_TRUE(eventTypeFromName(j["events"][0]["type"].get<std::string>()).has_value());

    events.clear();
    EXPECT_TRUE(events.getActiveEvents().empty());
}
