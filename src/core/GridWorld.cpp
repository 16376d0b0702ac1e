#include "GridWorld.h"
#include "DecayRedistributor.h"
#include "DensityField.h"
#include "EventManager.h"
#include "EvolutionStats.h"
#include "GridData.h"
#include "InteractionResolver.h"
#include "LoggingChannels.h"
#include "PopulationScarcityController.h"
#include "RandomStreams.h"
#include "ReproductionPolicy.h"
#include "ReproductionZonePolicy.h"
#include "ScopeTimer.h"
#include "SimilarityCache.h"
#include "SpatialTargetResolver.h"
#include "TileEnergyField.h"
#include "Timers.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace EvoSim {

std::string_view placementErrorName(PlacementError error)
{
    switch (error) {
        case PlacementError::OUT_OF_BOUNDS:
            return "out_of_bounds";
        case PlacementError::BLOCKED:
            return "blocked";
        case PlacementError::OCCUPIED:
            return "occupied";
        case PlacementError::NO_GENOME:
            return "no_genome";
    }
    return "unknown";
}

namespace {

int checkedDimension(int value, const char* name)
{
    if (value <= 0) {
        throw std::invalid_argument(
            std::string("GridWorld: ") + name + " must be positive, got " + std::to_string(value));
    }
    return value;
}

int sign(int value)
{
    return (value > 0) - (value < 0);
}

const TargetEntry* nearest(const std::vector<TargetEntry>& entries)
{
    const TargetEntry* best = nullptr;
    for (const auto& entry : entries) {
        if (!entry.target || !entry.target->isAlive()) {
            continue;
        }
        if (!best || entry.distance < best->distance) {
            best = &entry;
        }
    }
    return best;
}

} // namespace

struct GridWorld::Impl : public ReproductionHost, public InteractionHost {
    GridData grid_;
    SimulationSettings settings_;
    SimulationSettings current_; // settings_ with this tick's overrides applied.

    TileEnergyField energy_;
    DensityField density_;
    std::unique_ptr<EventManager> events_;
    SimilarityCache similarity_;
    SpatialTargetResolver targetResolver_;
    ReproductionPolicy reproduction_;
    DecayRedistributor decay_;
    PopulationScarcityController scarcity_;
    std::unique_ptr<ReproductionZonePolicy> zonePolicy_;
    std::unique_ptr<InteractionResolver> resolver_;
    std::unique_ptr<StatsCollector> stats_;

    // Live organisms in arrival order; activeIndex_ maps id to slot for swap-removal.
    std::vector<Organism*> active_;
    std::unordered_map<OrganismId, size_t> activeIndex_;

    // Organisms that died this tick; kept alive so in-flight pointers stay valid.
    std::vector<std::unique_ptr<Organism>> graveyard_;

    uint64_t tick_ = 0;
    uint32_t seed_ = 0;
    OrganismId nextId_ = 1;
    std::unique_ptr<std::mt19937> rng_;
    int driftRepairs_ = 0;
    TickSnapshot lastSnapshot_;
    mutable Timers timers_;

    Impl(int rows, int cols, const SimulationSettings& settings, uint32_t seed)
        : grid_(checkedDimension(rows, "rows"), checkedDimension(cols, "cols")),
          settings_(settings),
          current_(settings),
          energy_(rows, cols, settings.energy.max_tile_energy),
          density_(rows, cols, std::max(1, settings.energy.density_radius)),
          events_(std::make_unique<EventManager>(rows, cols)),
          zonePolicy_(std::make_unique<AllowAllZonePolicy>()),
          resolver_(std::make_unique<DefaultInteractionResolver>()),
          stats_(std::make_unique<EvolutionStats>()),
          seed_(seed),
          rng_(std::make_unique<std::mt19937>(seed))
    {}

    // ReproductionHost / InteractionHost.
    const GridData& getGrid() const override { return grid_; }
    const TileEnergyField& getEnergyField() const override { return energy_; }
    const DensityField& getDensityField() const override { return density_; }
    const ReproductionZonePolicy& getZonePolicy() const override { return *zonePolicy_; }
    StatsCollector& getStats() override { return *stats_; }
    std::mt19937& getRng() override { return *rng_; }
    uint64_t getTick() const override { return tick_; }
    uint32_t getWorldSeed() const override { return seed_; }
    int getPopulation() const override { return static_cast<int>(active_.size()); }
    int getMinPopulation() const override { return scarcity_.getMinPopulation(); }
    double getPopulationScarcity() const override { return scarcity_.getScarcity(); }
    double getMaxTileEnergy() const override { return energy_.getMaxTileEnergy(); }

    bool moveOrganism(Organism& organism, const Vector2i& from, const Vector2i& to) override;
    Organism* spawnOffspring(
        std::shared_ptr<const Genome> genome, const Vector2i& position, double energy) override;
    void killOrganism(Organism& organism, const Vector2i& position, DeathCause cause) override;
    double harvestAt(Organism& organism, const Vector2i& position) override;

    // Population bookkeeping.
    Result<Organism*, PlacementError> checkPlacement(
        const std::shared_ptr<const Genome>& genome, int row, int col) const;
    Organism* insert(std::shared_ptr<const Genome> genome, int row, int col, double energy);
    std::unique_ptr<Organism> detach(Organism& organism, int row, int col);
    void retire(std::unique_ptr<Organism> organism);
    std::optional<Vector2i> resolvePosition(Organism& organism);
    void registerDeath(Organism& organism, const DeathDetails& details);

    // Tick phases.
    void applyTickOptions(const TickOptions& options);
    void updateScarcity();
    void prepareEnergy();
    void processOrganism(Organism& organism);
    void interact(Organism& organism, Vector2i position, const TargetLists& targets, double effD);
    void move(Organism& organism, Vector2i position, const TargetLists& targets, double effD);
    bool tryMove(Organism& organism, const Vector2i& from, int dr, int dc);
    bool moveToward(Organism& organism, const Vector2i& from, const Vector2i& target);
    bool moveAway(Organism& organism, const Vector2i& from, const Vector2i& threat);
    bool stepAlong(Organism& organism, const Vector2i& from, int dr, int dc);
    bool moveRandomly(Organism& organism, const Vector2i& from);
    bool exploitEnergy(Organism& organism, const Vector2i& from);
    int seedScarcePopulation();
    void enforceEnergyExclusivity();
    TickSnapshot buildSnapshot() const;
};

// =================================================================
// POPULATION BOOKKEEPING
// =================================================================

Result<Organism*, PlacementError> GridWorld::Impl::checkPlacement(
    const std::shared_ptr<const Genome>& genome, int row, int col) const
{
    if (!genome) {
        return Result<Organism*, PlacementError>::error(PlacementError::NO_GENOME);
    }
    if (!grid_.inBounds(row, col)) {
        return Result<Organism*, PlacementError>::error(PlacementError::OUT_OF_BOUNDS);
    }
    if (grid_.isBlocked(row, col)) {
        return Result<Organism*, PlacementError>::error(PlacementError::BLOCKED);
    }
    if (grid_.occupantAt(row, col)) {
        return Result<Organism*, PlacementError>::error(PlacementError::OCCUPIED);
    }
    return Result<Organism*, PlacementError>::okay(nullptr);
}

Organism* GridWorld::Impl::insert(
    std::shared_ptr<const Genome> genome, int row, int col, double energy)
{
    const double clamped =
        std::isfinite(energy) ? std::clamp(energy, 0.0, energy_.getMaxTileEnergy()) : 0.0;
    auto organism =
        std::make_unique<Organism>(nextId_++, std::move(genome), Vector2i{ col, row }, clamped);
    Organism* raw = organism.get();

    grid_.occupants[grid_.index(row, col)] = std::move(organism);
    density_.applyDelta(row, col, +1);
    activeIndex_[raw->id] = active_.size();
    active_.push_back(raw);
    return raw;
}

std::unique_ptr<Organism> GridWorld::Impl::detach(Organism& organism, int row, int col)
{
    auto& slot = grid_.occupants[grid_.index(row, col)];
    std::unique_ptr<Organism> owned = std::move(slot);
    density_.applyDelta(row, col, -1);

    if (auto it = activeIndex_.find(organism.id); it != activeIndex_.end()) {
        const size_t i = it->second;
        Organism* last = active_.back();
        active_[i] = last;
        activeIndex_[last->id] = i;
        active_.pop_back();
        activeIndex_.erase(organism.id);
    }
    return owned;
}

void GridWorld::Impl::retire(std::unique_ptr<Organism> organism)
{
    organism->markDead();
    graveyard_.push_back(std::move(organism));
}

std::optional<Vector2i> GridWorld::Impl::resolvePosition(Organism& organism)
{
    const Vector2i cached = organism.position;
    if (grid_.inBounds(cached.y, cached.x) && grid_.occupantAt(cached) == &organism) {
        return cached;
    }

    for (int row = 0; row < grid_.rows; ++row) {
        for (int col = 0; col < grid_.cols; ++col) {
            if (grid_.occupantAt(row, col) == &organism) {
                organism.position = { col, row };
                ++driftRepairs_;
                LoggingChannels::tick()->debug(
                    "Organism {} cached at ({}, {}) found at ({}, {})",
                    organism.id,
                    cached.y,
                    cached.x,
                    row,
                    col);
                return organism.position;
            }
        }
    }
    return std::nullopt;
}

void GridWorld::Impl::registerDeath(Organism& organism, const DeathDetails& details)
{
    if (!organism.isAlive()) {
        return;
    }

    Vector2i position{ details.col, details.row };
    if (!grid_.inBounds(position.y, position.x) || grid_.occupantAt(position) != &organism) {
        const auto found = resolvePosition(organism);
        if (!found) {
            LoggingChannels::tick()->error(
                "Death of organism {} not on the grid; ignoring", organism.id);
            return;
        }
        position = *found;
    }

    const double energy = organism.energy;
    const auto fraction = organism.genome().findTrait(Trait::DecayReturnFraction);
    stats_->onDeath(organism, details.cause);
    retire(detach(organism, position.y, position.x));

    decay_.registerDeath(energy_, grid_, position.y, position.x, energy, fraction, current_.decay);
}

// =================================================================
// HOST SERVICES
// =================================================================

bool GridWorld::Impl::moveOrganism(Organism& organism, const Vector2i& from, const Vector2i& to)
{
    if (!grid_.inBounds(from.y, from.x) || grid_.occupantAt(from) != &organism
        || !grid_.isOpen(to.y, to.x)) {
        return false;
    }

    grid_.occupants[grid_.index(to.y, to.x)] = std::move(grid_.occupants[grid_.index(from.y, from.x)]);
    density_.applyDelta(from.y, from.x, -1);
    density_.applyDelta(to.y, to.x, +1);
    organism.position = to;
    organism.energy = std::max(0.0, organism.energy - organism.trait(Trait::MoveCost));
    return true;
}

Organism* GridWorld::Impl::spawnOffspring(
    std::shared_ptr<const Genome> genome, const Vector2i& position, double energy)
{
    if (!genome || !grid_.isOpen(position.y, position.x)) {
        return nullptr;
    }

    const double maxEnergy = energy_.getMaxTileEnergy();
    const double given = std::isfinite(energy) ? std::max(0.0, energy) : 0.0;
    const double tileEnergy = energy_.takeEnergyAt(position.y, position.x);
    Organism* child = insert(std::move(genome), position.y, position.x, given);
    const double room = std::max(0.0, maxEnergy - child->energy);
    const double absorbed = std::min(tileEnergy, room);
    child->energy += absorbed;

    // The child keeps what it can hold; the rest stays in the world.
    const double overflow = (given - std::min(given, maxEnergy)) + (tileEnergy - absorbed);
    if (overflow > 0.0) {
        decay_.returnOverflow(energy_, grid_, position.y, position.x, overflow);
    }
    return child;
}

void GridWorld::Impl::killOrganism(Organism& organism, const Vector2i& position, DeathCause cause)
{
    registerDeath(organism, { .row = position.y, .col = position.x, .cause = cause });
}

double GridWorld::Impl::harvestAt(Organism& organism, const Vector2i& position)
{
    const double pending = energy_.takePendingRegen(position.y, position.x);
    if (pending > 0.0) {
        energy_.addEnergy(position.y, position.x, pending);
    }
    return energy_.harvest(
        organism,
        position.y,
        position.x,
        density_.getDensityAt(position.y, position.x),
        current_.energy);
}

// =================================================================
// TICK PHASES
// =================================================================

void GridWorld::Impl::applyTickOptions(const TickOptions& options)
{
    current_ = settings_;
    if (options.densityEffectMultiplier) {
        current_.energy.density_effect_multiplier = *options.densityEffectMultiplier;
    }
    if (options.eventStrengthMultiplier) {
        current_.energy.event_strength_multiplier = *options.eventStrengthMultiplier;
    }
    if (options.regenRate) {
        current_.energy.regen_rate = *options.regenRate;
    }
    if (options.diffusionRate) {
        current_.energy.diffusion_rate = *options.diffusionRate;
    }
    if (options.societySimilarity) {
        current_.reproduction.society_similarity = *options.societySimilarity;
    }
    if (options.enemySimilarity) {
        current_.reproduction.enemy_similarity = *options.enemySimilarity;
    }
    validateSimulationSettings(current_);
}

void GridWorld::Impl::updateScarcity()
{
    const double scarcity = scarcity_.update(getPopulation());
    stats_->setPopulationScarcity(scarcity);
}

void GridWorld::Impl::prepareEnergy()
{
    {
        ScopeTimer timer(timers_, "density_sync");
        density_.sync();
    }

    {
        ScopeTimer timer(timers_, "decay");
        DecayRedistributor::SpawnHandler spawn;
        if (getPopulation() < getMinPopulation()) {
            spawn = [this](int row, int col, double available) -> double {
                if (getPopulation() >= getMinPopulation()) {
                    return 0.0;
                }
                auto genome = std::make_shared<const Genome>(Genome::random(*rng_));
                Organism* child = insert(std::move(genome), row, col, available);
                stats_->onBirth(*child);
                return child->energy;
            };
        }
        decay_.processPools(energy_, grid_, current_.decay, spawn);
    }

    {
        ScopeTimer timer(timers_, "regenerate");
        energy_.regenerate(grid_, density_, *events_, current_.energy);
        decay_.applyPendingDeltas(energy_);
    }
}

void GridWorld::Impl::processOrganism(Organism& organism)
{
    const auto located = resolvePosition(organism);
    if (!located) {
        LoggingChannels::tick()->error("Organism {} lost from the grid", organism.id);
        if (auto it = activeIndex_.find(organism.id); it != activeIndex_.end()) {
            const size_t i = it->second;
            Organism* last = active_.back();
            active_[i] = last;
            activeIndex_[last->id] = i;
            active_.pop_back();
            activeIndex_.erase(organism.id);
        }
        organism.markDead();
        return;
    }

    Vector2i position = *located;
    const double maxEnergy = energy_.getMaxTileEnergy();

    ++organism.age;
    organism.reproduction_cooldown = std::max(0, organism.reproduction_cooldown - 1);
    organism.last_event_pressure *= 0.9;

    if (organism.age >= organism.lifespan) {
        killOrganism(organism, position, DeathCause::SENESCENCE);
        return;
    }

    const EnergyModifiers mods = events_->modifiersAt(
        position.y, position.x, current_.energy.event_strength_multiplier);
    if (mods.strength > 0.0) {
        organism.applyEventDamage(mods.energyLoss, mods.strength, maxEnergy);
        if (organism.energy <= 0.0) {
            killOrganism(organism, position, DeathCause::EVENT);
            return;
        }
    }

    harvestAt(organism, position);

    const double localDensity = density_.getDensityAt(position.y, position.x);
    const double multiplier = current_.energy.density_effect_multiplier;
    if (organism.manageEnergy(localDensity, multiplier, maxEnergy) || organism.energy <= 0.0) {
        killOrganism(organism, position, DeathCause::STARVATION);
        return;
    }

    if (current_.behavior.activity_gate_enabled
        && !(RandomStreams::unit(*rng_) < organism.trait(Trait::ActivityRate))) {
        return;
    }

    const double effD = std::clamp(localDensity * multiplier, 0.0, 1.0);
    const TargetLists targets = targetResolver_.findTargets(
        organism, position, grid_, effD, current_.reproduction, similarity_, *rng_);

    if (current_.behavior.reproduction_enabled
        && !(targets.mates.empty() && targets.society.empty())) {
        const ReproductionOutcome outcome =
            reproduction_.attempt(organism, position, targets, *this, current_, *rng_);
        if (outcome.reproduced) {
            return;
        }
        position = outcome.parentPosition;
    }

    if (current_.behavior.interactions_enabled && !targets.enemies.empty()) {
        interact(organism, position, targets, effD);
        return;
    }

    if (current_.behavior.movement_enabled) {
        move(organism, position, targets, effD);
    }
}

void GridWorld::Impl::interact(
    Organism& organism, Vector2i position, const TargetLists& targets, double effD)
{
    const TargetEntry& enemy = targets.enemies[RandomStreams::index(*rng_, targets.enemies.size())];
    if (!enemy.target || !enemy.target->isAlive()) {
        return;
    }

    const InteractionAction action = organism.chooseInteractionAction(effD, *rng_);
    if (action == InteractionAction::AVOID) {
        moveAway(organism, position, enemy.position);
        return;
    }

    if (chebyshevDistance(position, enemy.position) > 1) {
        moveToward(organism, position, enemy.position);
        return;
    }

    const InteractionIntent intent{ .action = action,
                                    .initiator = &organism,
                                    .initiatorPosition = position,
                                    .target = enemy.target,
                                    .targetPosition = enemy.position };
    resolver_->resolve(intent, *this);
}

void GridWorld::Impl::move(
    Organism& organism, Vector2i position, const TargetLists& targets, double effD)
{
    const TargetEntry* enemy = nearest(targets.enemies);
    const TargetEntry* mate = nearest(targets.mates);
    const TargetEntry* ally = nearest(targets.society);
    const TargetEntry* anyone = enemy ? enemy : (mate ? mate : ally);

    switch (organism.chooseMovementStrategy(effD, *rng_)) {
        case MovementStrategy::PURSUIT:
            if (anyone) {
                moveToward(organism, position, anyone->position);
                return;
            }
            break;
        case MovementStrategy::CAUTIOUS:
            if (anyone) {
                moveAway(organism, position, anyone->position);
                return;
            }
            break;
        case MovementStrategy::WANDERING:
            if (ally && RandomStreams::unit(*rng_) < organism.trait(Trait::Cohesion)) {
                moveToward(organism, position, ally->position);
                return;
            }
            if (exploitEnergy(organism, position)) {
                return;
            }
            break;
    }

    moveRandomly(organism, position);
}

bool GridWorld::Impl::tryMove(Organism& organism, const Vector2i& from, int dr, int dc)
{
    if (dr == 0 && dc == 0) {
        return false;
    }
    return moveOrganism(organism, from, { from.x + dc, from.y + dr });
}

bool GridWorld::Impl::moveToward(Organism& organism, const Vector2i& from, const Vector2i& target)
{
    return stepAlong(organism, from, sign(target.y - from.y), sign(target.x - from.x));
}

bool GridWorld::Impl::moveAway(Organism& organism, const Vector2i& from, const Vector2i& threat)
{
    return stepAlong(organism, from, -sign(threat.y - from.y), -sign(threat.x - from.x));
}

// Take the diagonal step when both axes differ, falling back to either axis alone.
bool GridWorld::Impl::stepAlong(Organism& organism, const Vector2i& from, int dr, int dc)
{
    if (tryMove(organism, from, dr, dc)) {
        return true;
    }
    if (dr != 0 && dc != 0) {
        return tryMove(organism, from, dr, 0) || tryMove(organism, from, 0, dc);
    }
    return false;
}

bool GridWorld::Impl::moveRandomly(Organism& organism, const Vector2i& from)
{
    static constexpr int directions[4][2] = { { -1, 0 }, { 1, 0 }, { 0, -1 }, { 0, 1 } };
    const auto& d = directions[RandomStreams::index(*rng_, 4)];
    return tryMove(organism, from, d[0], d[1]);
}

// Step onto the richest orthogonal neighbour, with a probability set by the wandering gene
// share and the exploitation bias. Occupied tiles count one unit of energy less.
bool GridWorld::Impl::exploitEnergy(Organism& organism, const Vector2i& from)
{
    static constexpr int directions[4][2] = { { -1, 0 }, { 1, 0 }, { 0, -1 }, { 0, 1 } };
    const double maxEnergy = energy_.getMaxTileEnergy();

    const int* best = nullptr;
    double bestValue = -std::numeric_limits<double>::infinity();
    for (const auto& d : directions) {
        const int r = from.y + d[0];
        const int c = from.x + d[1];
        if (!grid_.inBounds(r, c) || grid_.isBlocked(r, c)) {
            continue;
        }
        const double value =
            energy_.getEnergyAt(r, c) / maxEnergy - (grid_.occupantAt(r, c) ? 1.0 : 0.0);
        if (value > bestValue) {
            bestValue = value;
            best = d;
        }
    }
    if (!best) {
        return false;
    }

    const MovementGenes& genes = organism.movement_genes;
    double total = std::max(0.0, genes.wandering) + std::max(0.0, genes.pursuit)
        + std::max(0.0, genes.cautious);
    if (total <= 0.0) {
        total = 1.0;
    }
    const double exploitChance = std::clamp(
        0.3 + 0.4 * (std::max(0.0, genes.wandering) / total)
            + 0.3 * organism.trait(Trait::ExploitationBias),
        0.05,
        0.95);
    if (!(RandomStreams::unit(*rng_) < exploitChance)) {
        return false;
    }

    tryMove(organism, from, best[0], best[1]);
    return true;
}

int GridWorld::Impl::seedScarcePopulation()
{
    const ScarcitySettings& settings = current_.scarcity;
    const int deficit = scarcity_.getDeficit(getPopulation());
    if (!settings.seeding_enabled || deficit <= 0) {
        return 0;
    }

    const SeedingPlan plan = PopulationScarcityController::seedingPlan(scarcity_.getScarcity());
    std::vector<SeedSite> sites =
        scarcity_.selectSeedSites(grid_, energy_, density_, plan, settings.seeding_top_band);

    const double maxEnergy = energy_.getMaxTileEnergy();
    const int wanted = std::min(deficit, settings.max_seeds_per_tick);
    int placed = 0;

    while (placed < wanted && !sites.empty()) {
        const size_t pick = RandomStreams::index(*rng_, sites.size());
        const Vector2i site = sites[pick].position;
        sites.erase(sites.begin() + static_cast<std::ptrdiff_t>(pick));

        const double available = energy_.getEnergyAt(site.y, site.x);
        const double availableFrac = std::clamp(available / maxEnergy, 0.0, 1.0);
        if (availableFrac <= 0.0) {
            continue;
        }

        for (int attempt = 0; attempt < settings.seeding_attempts_per_tile; ++attempt) {
            auto genome = std::make_shared<const Genome>(Genome::random(*rng_));
            const double starvation =
                std::clamp(genome->trait(Trait::StarvationThresholdFrac), 0.0, 1.0);
            const double target = PopulationScarcityController::spawnTargetFraction(starvation, plan);
            if (target - availableFrac > 1e-6) {
                continue;
            }

            const double seedEnergy = std::min(available, maxEnergy * target);
            energy_.setEnergyAt(site.y, site.x, available - seedEnergy);
            Organism* seed = insert(std::move(genome), site.y, site.x, seedEnergy);
            stats_->onBirth(*seed);
            ++placed;
            break;
        }
    }

    if (placed > 0) {
        LoggingChannels::scarcity()->debug(
            "Tick {}: seeded {} organisms (deficit {})", tick_, placed, deficit);
    }
    return placed;
}

void GridWorld::Impl::enforceEnergyExclusivity()
{
    const double maxEnergy = energy_.getMaxTileEnergy();
    for (Organism* organism : active_) {
        const Vector2i pos = organism->position;
        const double tileEnergy = energy_.takeEnergyAt(pos.y, pos.x);
        if (tileEnergy > 0.0) {
            const double room = std::max(0.0, maxEnergy - organism->energy);
            const double absorbed = std::min(tileEnergy, room);
            organism->energy += absorbed;
            if (tileEnergy > absorbed) {
                decay_.returnOverflow(energy_, grid_, pos.y, pos.x, tileEnergy - absorbed);
            }
        }
    }
}

TickSnapshot GridWorld::Impl::buildSnapshot() const
{
    TickSnapshot snapshot;
    snapshot.tick = tick_;
    snapshot.population_scarcity = scarcity_.getScarcity();
    snapshot.entries.reserve(active_.size());

    const double maxEnergy = energy_.getMaxTileEnergy();
    bool first = true;
    for (int row = 0; row < grid_.rows; ++row) {
        for (int col = 0; col < grid_.cols; ++col) {
            const Organism* organism = grid_.occupantAt(row, col);
            if (!organism) {
                continue;
            }

            const double fitness = organism->fitness(maxEnergy);
            ++snapshot.population;
            snapshot.total_energy += organism->energy;
            snapshot.total_age += organism->age;
            snapshot.max_fitness = first ? fitness : std::max(snapshot.max_fitness, fitness);
            first = false;

            snapshot.entries.push_back({ .row = row,
                                         .col = col,
                                         .fitness = fitness,
                                         .age = organism->age,
                                         .energy = organism->energy,
                                         .fights_won = organism->fights_won,
                                         .offspring = organism->offspring });
        }
    }
    return snapshot;
}

// =================================================================
// PUBLIC INTERFACE
// =================================================================

GridWorld::GridWorld(int rows, int cols, const SimulationSettings& settings, uint32_t seed)
    : pImpl(rows, cols,
            [&settings] {
                SimulationSettings validated = settings;
                validateSimulationSettings(validated);
                return validated;
            }(),
            seed)
{
    pImpl->events_->reset(pImpl->settings_.events, *pImpl->rng_);
    pImpl->energy_.fill(
        pImpl->settings_.energy.initial_tile_energy_fraction * pImpl->energy_.getMaxTileEnergy());
    pImpl->scarcity_.configure(rows, cols, pImpl->settings_.scarcity);

    LoggingChannels::tick()->info("GridWorld {}x{} created (seed {})", rows, cols, seed);
}

GridWorld::~GridWorld() = default;

GridWorld::GridWorld(GridWorld&&) noexcept = default;
GridWorld& GridWorld::operator=(GridWorld&&) noexcept = default;

TickSnapshot GridWorld::tick(const TickOptions& options)
{
    Impl& w = *pImpl;
    ScopeTimer tickTimer(w.timers_, "tick");

    w.applyTickOptions(options);
    ++w.tick_;
    w.similarity_.reset();
    w.stats_->resetTick();
    w.driftRepairs_ = 0;

    w.events_->update(w.current_.events, *w.rng_);
    w.updateScarcity();
    w.stats_->updateFromPopulation(w.active_, *w.rng_);

    w.prepareEnergy();

    {
        ScopeTimer timer(w.timers_, "organisms");
        // Organisms born during the tick wait for the next one.
        const std::vector<Organism*> snapshot = w.active_;
        for (Organism* organism : snapshot) {
            if (organism->isAlive()) {
                w.processOrganism(*organism);
            }
        }
    }

    {
        ScopeTimer timer(w.timers_, "seeding");
        w.updateScarcity();
        w.seedScarcePopulation();
    }

    if (w.driftRepairs_ > 0) {
        LoggingChannels::tick()->warn(
            "Tick {}: repaired {} stale organism positions", w.tick_, w.driftRepairs_);
    }

    w.enforceEnergyExclusivity();

    {
        ScopeTimer timer(w.timers_, "snapshot");
        w.lastSnapshot_ = w.buildSnapshot();
    }
    w.graveyard_.clear();

    LoggingChannels::tick()->trace(
        "Tick {}: population {}, energy {:.3f}",
        w.tick_,
        w.lastSnapshot_.population,
        w.lastSnapshot_.total_energy);
    return w.lastSnapshot_;
}

const TickSnapshot& GridWorld::getLastSnapshot() const
{
    return pImpl->lastSnapshot_;
}

uint64_t GridWorld::getTick() const
{
    return pImpl->tick_;
}

void GridWorld::setRandomSeed(uint32_t seed)
{
    pImpl->seed_ = seed;
    pImpl->rng_->seed(seed);
    // Event scheduling draws from the same stream, so it restarts with it.
    pImpl->events_->reset(pImpl->settings_.events, *pImpl->rng_);
}

uint32_t GridWorld::getSeed() const
{
    return pImpl->seed_;
}

Result<Organism*, PlacementError> GridWorld::placeOrganism(
    std::shared_ptr<const Genome> genome, int row, int col, double energy)
{
    auto check = pImpl->checkPlacement(genome, row, col);
    if (check.isError()) {
        return check;
    }
    return Result<Organism*, PlacementError>::okay(
        pImpl->insert(std::move(genome), row, col, energy));
}

Result<Organism*, PlacementError> GridWorld::spawnOrganism(
    std::shared_ptr<const Genome> genome, int row, int col, double energy)
{
    auto check = pImpl->checkPlacement(genome, row, col);
    if (check.isError()) {
        return check;
    }
    Organism* child = pImpl->spawnOffspring(std::move(genome), { col, row }, energy);
    pImpl->stats_->onBirth(*child);
    return Result<Organism*, PlacementError>::okay(child);
}

bool GridWorld::removeOrganism(int row, int col)
{
    Impl& w = *pImpl;
    if (!w.grid_.inBounds(row, col)) {
        return false;
    }
    Organism* organism = w.grid_.occupantAt(row, col);
    if (!organism) {
        return false;
    }

    w.stats_->onDeath(*organism, DeathCause::REMOVED);
    w.retire(w.detach(*organism, row, col));
    return true;
}

void GridWorld::registerDeath(Organism& organism, const DeathDetails& details)
{
    pImpl->registerDeath(organism, details);
}

int GridWorld::seedRandomPopulation(double fillFraction, double energyFraction)
{
    Impl& w = *pImpl;
    const double fill = std::isfinite(fillFraction) ? std::clamp(fillFraction, 0.0, 1.0) : 0.0;
    const double energy = (std::isfinite(energyFraction) ? std::clamp(energyFraction, 0.0, 1.0) : 0.0)
        * w.energy_.getMaxTileEnergy();

    int placed = 0;
    for (int row = 0; row < w.grid_.rows; ++row) {
        for (int col = 0; col < w.grid_.cols; ++col) {
            if (!w.grid_.isOpen(row, col) || !(RandomStreams::unit(*w.rng_) < fill)) {
                continue;
            }
            auto genome = std::make_shared<const Genome>(Genome::random(*w.rng_));
            w.insert(std::move(genome), row, col, energy);
            ++placed;
        }
    }

    w.density_.sync(true);
    LoggingChannels::tick()->info(
        "Seeded {} organisms ({:.0f}% fill)", placed, fill * 100.0);
    return placed;
}

Organism* GridWorld::getOrganismAt(int row, int col) const
{
    return pImpl->grid_.inBounds(row, col) ? pImpl->grid_.occupantAt(row, col) : nullptr;
}

int GridWorld::getPopulation() const
{
    return pImpl->getPopulation();
}

int GridWorld::getRows() const
{
    return pImpl->grid_.rows;
}

int GridWorld::getCols() const
{
    return pImpl->grid_.cols;
}

bool GridWorld::setObstacle(int row, int col, bool blocked)
{
    Impl& w = *pImpl;
    if (!w.grid_.inBounds(row, col)) {
        return false;
    }

    const size_t i = w.grid_.index(row, col);
    if (!blocked) {
        w.grid_.obstacles[i] = 0;
        return true;
    }

    if (Organism* occupant = w.grid_.occupantAt(row, col)) {
        w.registerDeath(*occupant, { .row = row, .col = col, .cause = DeathCause::REMOVED });
    }
    w.grid_.obstacles[i] = 1;
    w.energy_.setEnergyAt(row, col, 0.0);
    return true;
}

bool GridWorld::isObstacle(int row, int col) const
{
    return pImpl->grid_.inBounds(row, col) && pImpl->grid_.isBlocked(row, col);
}

double GridWorld::getDensityAt(int row, int col) const
{
    return pImpl->density_.getDensityAt(row, col);
}

const GridData& GridWorld::getGrid() const
{
    return pImpl->grid_;
}

TileEnergyField& GridWorld::getEnergyField()
{
    return pImpl->energy_;
}

const TileEnergyField& GridWorld::getEnergyField() const
{
    return pImpl->energy_;
}

const DensityField& GridWorld::getDensityField() const
{
    return pImpl->density_;
}

const DecayRedistributor& GridWorld::getDecay() const
{
    return pImpl->decay_;
}

const PopulationScarcityController& GridWorld::getScarcityController() const
{
    return pImpl->scarcity_;
}

EventManager& GridWorld::getEventManager()
{
    return *pImpl->events_;
}

void GridWorld::setEventManager(std::unique_ptr<EventManager> events)
{
    if (events) {
        pImpl->events_ = std::move(events);
    }
}

const ReproductionZonePolicy& GridWorld::getZonePolicy() const
{
    return *pImpl->zonePolicy_;
}

void GridWorld::setZonePolicy(std::unique_ptr<ReproductionZonePolicy> policy)
{
    pImpl->zonePolicy_ = policy ? std::move(policy) : std::make_unique<AllowAllZonePolicy>();
}

void GridWorld::setInteractionResolver(std::unique_ptr<InteractionResolver> resolver)
{
    pImpl->resolver_ =
        resolver ? std::move(resolver) : std::make_unique<DefaultInteractionResolver>();
}

StatsCollector& GridWorld::getStats()
{
    return *pImpl->stats_;
}

const StatsCollector& GridWorld::getStats() const
{
    return *pImpl->stats_;
}

void GridWorld::setStatsCollector(std::unique_ptr<StatsCollector> stats)
{
    pImpl->stats_ = stats ? std::move(stats) : std::make_unique<EvolutionStats>();
}

const SimulationSettings& GridWorld::getSettings() const
{
    return pImpl->settings_;
}

void GridWorld::setSettings(const SimulationSettings& settings)
{
    SimulationSettings validated = settings;
    validateSimulationSettings(validated);
    if (validated.energy.max_tile_energy != pImpl->energy_.getMaxTileEnergy()) {
        throw std::invalid_argument("GridWorld: max_tile_energy cannot change after construction");
    }
    pImpl->settings_ = validated;
    pImpl->current_ = validated;
    pImpl->scarcity_.configure(pImpl->grid_.rows, pImpl->grid_.cols, validated.scarcity);
}

Timers& GridWorld::getTimers()
{
    return pImpl->timers_;
}

const Timers& GridWorld::getTimers() const
{
    return pImpl->timers_;
}

} // namespace EvoSim
