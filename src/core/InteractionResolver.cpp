#include "InteractionResolver.h"
#include "LoggingChannels.h"

#include <algorithm>

namespace EvoSim {

InteractionOutcome DefaultInteractionResolver::resolve(
    const InteractionIntent& intent, InteractionHost& host)
{
    InteractionOutcome outcome;
    outcome.action = intent.action;
    outcome.initiatorPosition = intent.initiatorPosition;

    if (!intent.initiator || !intent.target || intent.initiator == intent.target
        || !intent.initiator->isAlive() || !intent.target->isAlive()) {
        return outcome;
    }

    switch (intent.action) {
        case InteractionAction::FIGHT:
            return resolveFight(intent, host);
        case InteractionAction::COOPERATE:
            return resolveCooperation(intent, host);
        case InteractionAction::AVOID:
            break;
    }
    return outcome;
}

InteractionOutcome DefaultInteractionResolver::resolveFight(
    const InteractionIntent& intent, InteractionHost& host)
{
    Organism& attacker = *intent.initiator;
    Organism& defender = *intent.target;
    const double maxEnergy = host.getMaxTileEnergy();

    InteractionOutcome outcome;
    outcome.action = InteractionAction::FIGHT;
    outcome.initiatorPosition = intent.initiatorPosition;
    outcome.resolved = true;

    attacker.energy = std::max(0.0, attacker.energy - attacker.trait(Trait::FightCost) * maxEnergy);
    defender.energy = std::max(0.0, defender.energy - defender.trait(Trait::FightCost) * maxEnergy);

    const double attackPower = attacker.energy * attacker.trait(Trait::CombatPower);
    const double defendPower = defender.energy * defender.trait(Trait::CombatPower);

    bool attackerWins = attackPower > defendPower;
    if (attackPower == defendPower) {
        attackerWins = std::uniform_real_distribution<double>(0.0, 1.0)(host.getRng()) < 0.5;
    }

    Organism& winner = attackerWins ? attacker : defender;
    Organism& loser = attackerWins ? defender : attacker;
    const Vector2i loserPos = attackerWins ? intent.targetPosition : intent.initiatorPosition;

    ++winner.fights_won;
    ++loser.fights_lost;
    outcome.winner = &winner;
    outcome.loser = &loser;
    host.getStats().onFight(winner, loser);

    LoggingChannels::interaction()->trace(
        "Fight: {} ({:.3f}) vs {} ({:.3f}), winner {}",
        attacker.id,
        attackPower,
        defender.id,
        defendPower,
        winner.id);

    host.killOrganism(loser, loserPos, DeathCause::COMBAT);

    if (attackerWins
        && host.moveOrganism(attacker, intent.initiatorPosition, intent.targetPosition)) {
        outcome.initiatorMoved = true;
        outcome.initiatorPosition = intent.targetPosition;
        host.harvestAt(attacker, intent.targetPosition);
    }

    return outcome;
}

InteractionOutcome DefaultInteractionResolver::resolveCooperation(
    const InteractionIntent& intent, InteractionHost& host)
{
    Organism& giver = *intent.initiator;
    Organism& receiver = *intent.target;
    const double maxEnergy = host.getMaxTileEnergy();

    InteractionOutcome outcome;
    outcome.action = InteractionAction::COOPERATE;
    outcome.initiatorPosition = intent.initiatorPosition;

    const double share = std::min(maxEnergy, giver.energy * giver.trait(Trait::CooperateShareFrac));
    const double transfer = std::min(share, std::max(0.0, maxEnergy - receiver.energy));
    if (transfer <= 0.0) {
        return outcome;
    }

    giver.energy -= transfer;
    receiver.energy += transfer;
    outcome.resolved = true;
    outcome.transferred = transfer;
    host.getStats().onCooperate(giver, receiver, transfer);

    LoggingChannels::interaction()->trace(
        "Cooperate: {} gave {:.4f} to {}", giver.id, transfer, receiver.id);
    return outcome;
}

} // namespace EvoSim
