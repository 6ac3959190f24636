#include "openetas/simulation/etas_simulator.hpp"
#include "openetas/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace openetas {

namespace {

// Centre of the delta_m bin holding m, on the grid through mc; halves round up
double binMagnitude(double m, double mc, double delta_m) {
    return mc + std::floor((m - mc) / delta_m + 0.5 + 1e-9) * delta_m;
}

} // anonymous namespace

std::string outOfRegionPolicyToString(OutOfRegionPolicy policy) {
    switch (policy) {
        case OutOfRegionPolicy::Discard: return "discard";
        case OutOfRegionPolicy::KeepAsSource: return "keep_as_source";
        case OutOfRegionPolicy::Keep: return "keep";
    }
    return "?";
}

bool stringToOutOfRegionPolicy(const std::string& s, OutOfRegionPolicy& out) {
    if (s == "discard") { out = OutOfRegionPolicy::Discard; return true; }
    if (s == "keep_as_source") { out = OutOfRegionPolicy::KeepAsSource; return true; }
    if (s == "keep") { out = OutOfRegionPolicy::Keep; return true; }
    return false;
}

std::string simulationModeToString(SimulationMode mode) {
    switch (mode) {
        case SimulationMode::FreshStart: return "fresh";
        case SimulationMode::Continuation: return "continuation";
    }
    return "?";
}

bool stringToSimulationMode(const std::string& s, SimulationMode& out) {
    if (s == "fresh" || s == "fresh_start") { out = SimulationMode::FreshStart; return true; }
    if (s == "continuation") { out = SimulationMode::Continuation; return true; }
    return false;
}

ETASSimulator::ETASSimulator(const Parameters& params, const SimulationOptions& options,
                             const Region& region, BackgroundFieldPtr field)
    : params_(params)
    , options_(options)
    , region_(region)
    , field_(field)
    , kernel_(params, options.kernels, options.referenceMagnitude())
    , magnitudes_(options.beta, options.referenceMagnitude(), options.m_max)
{
    std::string reason;
    if (!params_.isValid(options_.kernels, &reason)) {
        throw std::invalid_argument("ETASSimulator: " + reason);
    }
    if (!(options_.beta > 0)) {
        throw std::invalid_argument("ETASSimulator: beta must be positive");
    }
    if (!(options_.horizon.end > options_.horizon.start) || options_.burn_in_days < 0) {
        throw std::invalid_argument("ETASSimulator: empty horizon or negative burn-in");
    }
    if (region_.empty()) {
        throw std::invalid_argument("ETASSimulator: no region");
    }
    if (!field_) {
        field_ = std::make_shared<const BackgroundField>(BackgroundField::uniform(region_));
    }
}

double ETASSimulator::expectedBackgroundCount() const {
    return params_.mu * region_.area() * (options_.horizon.end - options_.startTime());
}

void ETASSimulator::checkLimits(const std::vector<SimulatedEvent>& arena, size_t seeds,
                                int generation) const {
    size_t simulated = arena.size() - seeds;
    if (simulated > options_.max_events) {
        throw SimulationOverflow("Simulation exceeded " +
                                 std::to_string(options_.max_events) + " events",
                                 simulated, generation);
    }
    if (generation > options_.max_generations) {
        throw SimulationOverflow("Simulation exceeded " +
                                 std::to_string(options_.max_generations) + " generations",
                                 simulated, generation);
    }
}

SimulationResult ETASSimulator::simulate(const std::vector<Event>& seeds) const {
    Rng rng(options_.seed);
    return simulate(seeds, rng);
}

SimulationResult ETASSimulator::simulate(const std::vector<Event>& seeds, Rng& rng) const {
    const TimeDays t0 = options_.horizon.start;
    const TimeDays t1 = options_.horizon.end;
    const TimeDays t_start = options_.startTime();

    SimulationResult result;
    std::vector<SimulatedEvent>& arena = result.events;

    // Generation-0 ancestors from the observed history
    if (options_.mode == SimulationMode::Continuation) {
        size_t skipped = 0;
        for (const auto& e : seeds) {
            if (e.time > t0) {
                skipped++;
                continue;
            }
            SimulatedEvent se;
            se.event = e;
            se.is_seed = true;
            se.in_region = region_.contains(e.x, e.y);
            se.root = static_cast<int64_t>(arena.size());
            arena.push_back(se);
        }
        if (skipped > 0) {
            std::cerr << "ETASSimulator: ignored " << skipped
                      << " seed events after t0" << std::endl;
        }
        result.seed_count = arena.size();
    }

    // Background
    std::poisson_distribution<long> n_background(expectedBackgroundCount());
    std::uniform_real_distribution<double> uniform_time(t_start, t1);
    long nb = n_background(rng);

    for (long k = 0; k < nb; k++) {
        SimulatedEvent se;
        Point2D loc = field_->sample(rng);
        se.event = Event(uniform_time(rng), loc.x, loc.y, options_.depth,
                         magnitudes_.sample(rng));
        se.is_background = true;
        se.root = static_cast<int64_t>(arena.size());
        arena.push_back(se);
        checkLimits(arena, result.seed_count, 0);
    }
    result.background_count = static_cast<size_t>(nb);

    // Offspring, breadth first
    std::uniform_real_distribution<double> uniform_angle(0.0, 2.0 * M_PI);

    for (size_t cursor = 0; cursor < arena.size(); cursor++) {
        // Copy: push_back below may reallocate
        const SimulatedEvent parent = arena[cursor];

        // A draw beyond the event limit overflows even if its children are dropped
        const double expected = kernel_.productivity(parent.event.magnitude);
        const size_t simulated = arena.size() - result.seed_count;
        if (!(expected <= static_cast<double>(options_.max_events))) {
            throw SimulationOverflow("Simulation exceeded " +
                                     std::to_string(options_.max_events) + " events",
                                     simulated, parent.generation + 1);
        }
        std::poisson_distribution<long> n_children(expected);
        long nc = n_children(rng);
        if (static_cast<size_t>(nc) > options_.max_events) {
            throw SimulationOverflow("Simulation exceeded " +
                                     std::to_string(options_.max_events) + " events",
                                     simulated + static_cast<size_t>(nc), parent.generation + 1);
        }

        for (long k = 0; k < nc; k++) {
            double t = parent.event.time + kernel_.sampleTimeOffset(rng);
            double mag = magnitudes_.sample(rng);
            double r = kernel_.sampleRadius(parent.event.magnitude, rng);
            double theta = uniform_angle(rng);

            if (t > t1) continue;
            if (parent.is_seed && t <= t0) continue;

            double x = parent.event.x + r * std::cos(theta);
            double y = parent.event.y + r * std::sin(theta);
            bool inside = region_.contains(x, y);

            if (!inside) {
                result.out_of_region++;
                if (options_.out_of_region == OutOfRegionPolicy::Discard) continue;
            }

            SimulatedEvent child;
            child.event = Event(t, x, y, parent.event.depth, mag);
            child.parent = static_cast<int64_t>(cursor);
            child.generation = parent.generation + 1;
            child.root = parent.root;
            child.in_region = inside;
            arena.push_back(child);

            checkLimits(arena, result.seed_count, child.generation);
            result.generations = std::max(result.generations, child.generation);
        }
    }

    result.triggered_count = arena.size() - result.seed_count - result.background_count;

    // Flatten; emitted arena entries take their catalog id
    std::vector<size_t> emitted;
    for (size_t k = 0; k < arena.size(); k++) {
        const SimulatedEvent& se = arena[k];
        if (se.is_seed) continue;
        if (se.event.time < t0) {
            result.burn_in_discarded++;
            continue;
        }
        if (!se.in_region && options_.out_of_region != OutOfRegionPolicy::Keep) continue;
        emitted.push_back(k);
    }
    std::stable_sort(emitted.begin(), emitted.end(),
        [&arena](size_t a, size_t b) { return arena[a].event.time < arena[b].event.time; });

    std::vector<Event> events;
    events.reserve(emitted.size());
    for (size_t k = 0; k < emitted.size(); k++) {
        Event& e = arena[emitted[k]].event;
        e.id = static_cast<int64_t>(k + 1);
        if (options_.delta_m > 0) e.magnitude = binMagnitude(e.magnitude, options_.mc, options_.delta_m);
        events.push_back(e);
    }

    result.catalog = Catalog(std::move(events), region_, options_.horizon,
                             options_.mc, options_.delta_m);

    if (options_.verbose) {
        std::cout << "ETASSimulator: " << result.background_count << " background, "
                  << result.triggered_count << " triggered, "
                  << result.generations << " generations, "
                  << result.catalog.size() << " emitted" << std::endl;
    }

    return result;
}

} // namespace openetas
