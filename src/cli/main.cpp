#include "core/EvolutionStats.h"
#include "core/GridWorld.h"
#include "core/LoggingChannels.h"
#include "core/SimulationSettings.h"
#include "core/Timers.h"
#include <args.hxx>
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

using namespace EvoSim;

static std::atomic<bool> g_stopRequested{ false };

void signalHandler(int signum)
{
    spdlog::info("Interrupt signal ({}) received, stopping after this tick...", signum);
    g_stopRequested = true;
}

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "EvoSim command line runner", "Runs a headless evolving-population simulation.");
    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::ValueFlag<int> rowsArg(parser, "rows", "Grid rows (default: 120)", { "rows" }, 120);
    args::ValueFlag<int> colsArg(parser, "cols", "Grid columns (default: 120)", { "cols" }, 120);
    args::ValueFlag<int> ticksArg(
        parser, "ticks", "Number of ticks to run (default: 1000)", { 't', "ticks" }, 1000);
    args::ValueFlag<uint32_t> seedArg(parser, "seed", "Random seed (default: 1)", { "seed" }, 1);
    args::ValueFlag<double> populationArg(
        parser,
        "population",
        "Initial fill fraction (default: from settings)",
        { 'p', "population" });
    args::ValueFlag<std::string> configArg(
        parser, "config", "Simulation settings JSON file", { 'c', "config" });
    args::ValueFlag<std::string> logConfig(
        parser,
        "log-config",
        "Path to logging config JSON file (default: logging-config.json)",
        { "log-config" },
        "logging-config.json");
    args::ValueFlag<std::string> logChannels(
        parser,
        "channels",
        "Override log channels (e.g., reproduction:trace,decay:debug,*:off)",
        { 'C', "channels" });
    args::ValueFlag<int> snapshotEvery(
        parser,
        "snapshot-every",
        "Log a snapshot summary every N ticks (default: 100, 0 disables)",
        { "snapshot-every" },
        100);
    args::Flag dumpSettings(
        parser, "dump-settings", "Print the effective settings as JSON and exit", { "dump-settings" });
    args::Flag printStats(
        parser, "print-stats", "Print timer statistics on exit", { "print-stats" });

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    // Initialize logging from config file (supports .local override).
    try {
        LoggingChannels::initializeFromConfig(args::get(logConfig));
    }
    catch (const std::runtime_error& e) {
        std::cerr << "Logging setup failed: " << e.what() << std::endl;
        return 1;
    }
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
        spdlog::info("Applied channel overrides: {}", args::get(logChannels));
    }

    SimulationSettings settings = getDefaultSimulationSettings();
    if (configArg) {
        auto loaded = loadSimulationSettings(args::get(configArg));
        if (loaded.isError()) {
            spdlog::error("Failed to load settings: {}", loaded.errorValue());
            return 1;
        }
        settings = loaded.value();
    }

    if (dumpSettings) {
        nlohmann::json j = settings;
        std::cout << j.dump(2) << std::endl;
        return 0;
    }

    const int ticks = args::get(ticksArg);
    const int every = args::get(snapshotEvery);
    const double fill =
        populationArg ? args::get(populationArg) : settings.population.initial_fill_fraction;

    std::unique_ptr<GridWorld> world;
    try {
        world = std::make_unique<GridWorld>(
            args::get(rowsArg), args::get(colsArg), settings, args::get(seedArg));
    }
    catch (const std::invalid_argument& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 1;
    }

    world->seedRandomPopulation(fill, settings.population.initial_energy_fraction);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    spdlog::info(
        "Running {} ticks on a {}x{} grid (seed {})",
        ticks,
        world->getRows(),
        world->getCols(),
        world->getSeed());

    for (int i = 0; i < ticks && !g_stopRequested; ++i) {
        const TickSnapshot& snapshot = world->tick();

        if (every > 0 && snapshot.tick % static_cast<uint64_t>(every) == 0) {
            spdlog::info(
                "Tick {}: population {}, energy {:.2f}, mean age {:.1f}, max fitness {:.2f}, "
                "scarcity {:.3f}",
                snapshot.tick,
                snapshot.population,
                snapshot.total_energy,
                snapshot.population > 0 ? snapshot.total_age / snapshot.population : 0.0,
                snapshot.max_fitness,
                snapshot.population_scarcity);
        }

        if (snapshot.population == 0) {
            spdlog::warn("Population extinct at tick {}", snapshot.tick);
            break;
        }
    }

    const TickSnapshot& last = world->getLastSnapshot();
    nlohmann::json summary = { { "ticks", world->getTick() },
                               { "population", last.population },
                               { "total_energy", last.total_energy },
                               { "max_fitness", last.max_fitness },
                               { "tile_energy", world->getEnergyField().totalEnergy() } };
    if (const auto* stats = dynamic_cast<const EvolutionStats*>(&world->getStats())) {
        summary["stats"] = stats->toJson();
    }
    std::cout << summary.dump(2) << std::endl;

    if (printStats) {
        std::cout << "\n=== Simulation Timer Statistics ===" << std::endl;
        world->getTimers().dumpTimerStats();
    }

    LoggingChannels::shutdown();
    return 0;
}
