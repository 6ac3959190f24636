#pragma once

#include "../core/types.hpp"
#include "../core/event.hpp"
#include "../core/region.hpp"
#include "../kernel/parameters.hpp"
#include "../kernel/kernels.hpp"
#include "../background/background_field.hpp"
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace openetas {

// What happens to offspring that land outside the region
enum class OutOfRegionPolicy {
    Discard,        // dropped together with their descendants
    KeepAsSource,   // trigger further events but are not emitted
    Keep            // emitted like any other event
};

std::string outOfRegionPolicyToString(OutOfRegionPolicy policy);
bool stringToOutOfRegionPolicy(const std::string& s, OutOfRegionPolicy& out);

enum class SimulationMode {
    FreshStart,     // background from the burn-in start, no history
    Continuation    // seed catalog supplies the history before t0
};

std::string simulationModeToString(SimulationMode mode);
bool stringToSimulationMode(const std::string& s, SimulationMode& out);

/**
 * SimulationOptions - Settings of one branching-process realisation
 */
struct SimulationOptions {
    KernelConfig kernels;
    SimulationMode mode = SimulationMode::FreshStart;

    TimeWindow horizon;                 // emitted events fall in (t0, t1]
    double burn_in_days = 0.0;          // fresh start begins at t0 - burn_in_days

    double mc = 0.0;
    double delta_m = 0.0;               // > 0: emitted magnitudes binned on the mc grid
    double beta = constants::LN10;      // b = 1
    double m_max = std::numeric_limits<double>::infinity();
    double depth = 10.0;                // km, background events

    uint64_t seed = 42;
    int max_generations = 100;
    size_t max_events = 1000000;
    OutOfRegionPolicy out_of_region = OutOfRegionPolicy::Discard;

    bool verbose = false;

    double referenceMagnitude() const { return mc - delta_m / 2.0; }
    TimeDays startTime() const {
        return mode == SimulationMode::Continuation ? horizon.start
                                                    : horizon.start - burn_in_days;
    }
};

/**
 * SimulatedEvent - One node of the branching tree
 *
 * parent is the arena index of the triggering event, -1 for background
 * and seed events. root is the arena index of the generation-0 ancestor.
 * event.id is the id in the flat catalog, 0 for events not emitted
 * (seed events keep their observed id).
 */
struct SimulatedEvent {
    Event event;
    int64_t parent;
    int generation;
    int64_t root;
    bool is_background;
    bool is_seed;
    bool in_region;

    SimulatedEvent()
        : parent(-1), generation(0), root(-1),
          is_background(false), is_seed(false), in_region(true) {}
};

/**
 * SimulationResult - Arena of a finished realisation and its flat catalog
 */
struct SimulationResult {
    std::vector<SimulatedEvent> events;     // breadth-first arena
    Catalog catalog;                        // emitted events, time-ordered
    int generations = 0;                    // deepest generation reached
    size_t seed_count = 0;
    size_t background_count = 0;
    size_t triggered_count = 0;
    size_t burn_in_discarded = 0;
    size_t out_of_region = 0;
};

/**
 * ETASSimulator - Monte Carlo realisations of the ETAS branching process
 *
 * Background events are drawn as a Poisson process over the region with
 * locations from the background field; every event then spawns a Poisson
 * number of children, processed generation by generation through an
 * index cursor over the arena. Realisations are reproducible from the
 * random seed.
 */
class ETASSimulator {
public:
    // Throws std::invalid_argument for parameters outside the model domain
    ETASSimulator(const Parameters& params, const SimulationOptions& options,
                  const Region& region,
                  BackgroundFieldPtr field = nullptr);

    // Uses options.seed. Seed events (t <= t0) are used in continuation mode only.
    SimulationResult simulate(const std::vector<Event>& seeds = std::vector<Event>()) const;

    // Draws from a caller-owned random stream
    SimulationResult simulate(const std::vector<Event>& seeds, Rng& rng) const;

    // mu * area * duration of the background period
    double expectedBackgroundCount() const;

    const Parameters& parameters() const { return params_; }
    const SimulationOptions& options() const { return options_; }
    const Region& region() const { return region_; }

private:
    Parameters params_;
    SimulationOptions options_;
    Region region_;
    BackgroundFieldPtr field_;
    TriggeringKernel kernel_;
    GutenbergRichter magnitudes_;

    void checkLimits(const std::vector<SimulatedEvent>& arena, size_t seeds,
                     int generation) const;
};

} // namespace openetas
