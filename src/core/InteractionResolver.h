#pragma once

#include "StatsCollector.h"
#include "Vector2.h"
#include "organisms/Organism.h"

#include <random>

namespace EvoSim {

struct InteractionIntent {
    InteractionAction action = InteractionAction::AVOID;
    Organism* initiator = nullptr;
    Vector2i initiatorPosition;
    Organism* target = nullptr;
    Vector2i targetPosition;
};

struct InteractionOutcome {
    bool resolved = false;
    InteractionAction action = InteractionAction::AVOID;
    Organism* winner = nullptr;
    Organism* loser = nullptr;
    double transferred = 0.0; // Energy moved by cooperation.
    bool initiatorMoved = false;
    Vector2i initiatorPosition;
};

/**
 * Grid operations a resolver may perform. Implemented by the world that owns the organisms.
 */
class InteractionHost {
public:
    virtual ~InteractionHost() = default;

    virtual double getMaxTileEnergy() const = 0;

    // Remove the organism at `position` and hand its energy to decay.
    virtual void killOrganism(Organism& organism, const Vector2i& position, DeathCause cause) = 0;

    virtual bool moveOrganism(Organism& organism, const Vector2i& from, const Vector2i& to) = 0;

    virtual double harvestAt(Organism& organism, const Vector2i& position) = 0;

    virtual StatsCollector& getStats() = 0;

    virtual std::mt19937& getRng() = 0;
};

class InteractionResolver {
public:
    virtual ~InteractionResolver() = default;

    virtual InteractionOutcome resolve(const InteractionIntent& intent, InteractionHost& host) = 0;
};

/**
 * Fights compare energy scaled by combat power after both sides pay their fight cost; the
 * loser dies and a winning initiator takes the loser's tile. Cooperation gives the target a
 * share of the initiator's energy.
 */
class DefaultInteractionResolver : public InteractionResolver {
public:
    InteractionOutcome resolve(const InteractionIntent& intent, InteractionHost& host) override;

private:
    InteractionOutcome resolveFight(const InteractionIntent& intent, InteractionHost& host);
    InteractionOutcome resolveCooperation(const InteractionIntent& intent, InteractionHost& host);
};

} // namespace EvoSim
