/**
 * Unit tests for the branching-process simulator
 */

#include "test_framework.hpp"
#include "openetas/simulation/etas_simulator.hpp"
#include "openetas/core/errors.hpp"
#include <cmath>
#include <stdexcept>

using namespace openetas;
using namespace openetas::test;

namespace {

Parameters subCritical() {
    Parameters p;
    p.mu = 1e-4;
    p.k0 = 0.1;
    p.alpha = 0.8;       // branching ratio 0.5 with b = 1
    p.c = 0.01;
    p.p = 1.2;
    p.d = 1.0;
    p.gamma = 0.5;
    p.q = 1.5;
    return p;
}

SimulationOptions baseOptions() {
    SimulationOptions options;
    options.horizon = TimeWindow(0.0, 1000.0);
    options.mc = 3.0;
    options.beta = constants::LN10;
    options.seed = 1234;
    return options;
}

Region square() {
    return Region::rectangle(0.0, 100.0, 0.0, 100.0);
}

} // anonymous namespace

TEST(Simulation, DeterministicForSeed) {
    ETASSimulator sim(subCritical(), baseOptions(), square());
    SimulationResult a = sim.simulate();
    SimulationResult b = sim.simulate();

    ASSERT_EQ(a.catalog.size(), b.catalog.size());
    ASSERT_EQ(a.events.size(), b.events.size());
    for (size_t i = 0; i < a.catalog.size(); i++) {
        ASSERT_EQ(a.catalog[i].time, b.catalog[i].time);
        ASSERT_EQ(a.catalog[i].magnitude, b.catalog[i].magnitude);
    }

    SimulationOptions other = baseOptions();
    other.seed = 4321;
    SimulationResult c = ETASSimulator(subCritical(), other, square()).simulate();
    bool differs = c.catalog.size() != a.catalog.size() ||
                   (a.catalog.size() > 0 && c.catalog[0].time != a.catalog[0].time);
    ASSERT_TRUE(differs);
}

TEST(Simulation, BackgroundCountMatchesRate) {
    Parameters p = subCritical();
    p.k0 = 1e-6;
    ETASSimulator sim(p, baseOptions(), square());
    ASSERT_NEAR(sim.expectedBackgroundCount(), 1000.0, 1e-9);

    Rng rng(5);
    double total = 0;
    const int runs = 20;
    for (int i = 0; i < runs; i++) {
        total += static_cast<double>(sim.simulate(std::vector<Event>(), rng).background_count);
    }
    ASSERT_NEAR(total / runs, 1000.0, 30.0);
}

TEST(Simulation, ArenaStructure) {
    ETASSimulator sim(subCritical(), baseOptions(), square());
    SimulationResult r = sim.simulate();

    ASSERT_GT(r.background_count, 0u);
    ASSERT_GT(r.triggered_count, 0u);
    ASSERT_EQ(r.events.size(), r.seed_count + r.background_count + r.triggered_count);
    ASSERT_LT(r.generations, baseOptions().max_generations);

    for (size_t k = 0; k < r.events.size(); k++) {
        const SimulatedEvent& se = r.events[k];
        if (se.is_background) {
            ASSERT_EQ(se.parent, -1);
            ASSERT_EQ(se.generation, 0);
            ASSERT_EQ(se.root, static_cast<int64_t>(k));
            continue;
        }
        ASSERT_GE(se.parent, 0);
        ASSERT_LT(se.parent, static_cast<int64_t>(k));
        const SimulatedEvent& parent = r.events[se.parent];
        ASSERT_EQ(se.generation, parent.generation + 1);
        ASSERT_EQ(se.root, parent.root);
        ASSERT_GE(se.event.time, parent.event.time);
        // Discard policy keeps only in-region offspring
        ASSERT_TRUE(se.in_region);
    }
}

TEST(Simulation, CatalogOrderAndIds) {
    SimulationOptions options = baseOptions();
    options.delta_m = 0.1;
    options.mc = 3.05;
    ETASSimulator sim(subCritical(), options, square());
    SimulationResult r = sim.simulate();

    const Catalog& cat = r.catalog;
    ASSERT_GT(cat.size(), 0u);
    ASSERT_NEAR(cat.referenceMagnitude(), 3.0, 1e-12);
    for (size_t i = 0; i < cat.size(); i++) {
        ASSERT_EQ(cat[i].id, static_cast<int64_t>(i + 1));
        ASSERT_GE(cat[i].time, 0.0);
        ASSERT_LE(cat[i].time, 1000.0);
        ASSERT_GE(cat[i].magnitude, 3.0);
        ASSERT_TRUE(cat.region().contains(cat[i].x, cat[i].y));
        if (i > 0) ASSERT_LE(cat[i - 1].time, cat[i].time);
    }

    // Arena entries point at their catalog rows
    for (const SimulatedEvent& se : r.events) {
        if (se.event.id == 0) continue;
        ASSERT_EQ(cat[se.event.id - 1].time, se.event.time);
    }
}

TEST(Simulation, BinnedMagnitudes) {
    SimulationOptions options = baseOptions();
    options.delta_m = 0.1;
    ETASSimulator sim(subCritical(), options, square());
    SimulationResult r = sim.simulate();

    ASSERT_GT(r.catalog.size(), 0u);
    ASSERT_NEAR(r.catalog.deltaM(), 0.1, 1e-15);
    for (const Event& e : r.catalog.events()) {
        double bins = (e.magnitude - 3.0) / 0.1;
        ASSERT_NEAR(bins, std::round(bins), 1e-6);
        ASSERT_GE(e.magnitude, 3.0 - 1e-9);
    }
    // Arena entries carry the binned value too
    for (const SimulatedEvent& se : r.events) {
        if (se.event.id == 0) continue;
        ASSERT_EQ(se.event.magnitude, r.catalog[se.event.id - 1].magnitude);
    }
}

TEST(Simulation, MagnitudeTruncation) {
    SimulationOptions options = baseOptions();
    options.m_max = 4.0;
    ETASSimulator sim(subCritical(), options, square());
    SimulationResult r = sim.simulate();
    ASSERT_LE(r.catalog.maxMagnitude(), 4.0);
}

TEST(Simulation, BurnInDiscarded) {
    SimulationOptions options = baseOptions();
    options.burn_in_days = 500.0;
    ETASSimulator sim(subCritical(), options, square());
    ASSERT_NEAR(sim.expectedBackgroundCount(), 1500.0, 1e-9);

    SimulationResult r = sim.simulate();
    ASSERT_GT(r.burn_in_discarded, 0u);
    for (const Event& e : r.catalog.events()) {
        ASSERT_GE(e.time, 0.0);
    }
}

TEST(Simulation, OverflowOnEventLimit) {
    Parameters p = subCritical();
    p.k0 = 1.0;
    p.alpha = 1.2;      // super-critical for b = 1
    SimulationOptions options = baseOptions();
    options.max_events = 5000;
    ETASSimulator sim(p, options, square());

    bool thrown = false;
    try {
        sim.simulate();
    } catch (const SimulationOverflow& e) {
        thrown = true;
        ASSERT_GT(e.eventCount(), 5000u);
    }
    ASSERT_TRUE(thrown);
}

TEST(Simulation, OverflowOnGenerationLimit) {
    Parameters p = subCritical();
    p.k0 = 2.0;
    p.alpha = 0.0;
    SimulationOptions options = baseOptions();
    options.max_generations = 0;
    ETASSimulator sim(p, options, square());
    ASSERT_THROW(sim.simulate(), SimulationOverflow);
}

TEST(Simulation, OverflowWhenChildrenAreDropped) {
    // Every child lands far outside the region and is discarded, so the
    // arena never grows; the draw itself must still overflow
    Parameters p = subCritical();
    p.mu = 1e-8;
    p.k0 = 1e4;
    p.alpha = 0.0;
    p.d = 1e6;
    SimulationOptions options = baseOptions();
    options.mode = SimulationMode::Continuation;
    options.horizon = TimeWindow(0.0, 1.0);
    options.max_events = 1000;

    std::vector<Event> seeds = {Event(0.0, 5.0, 5.0, 8.0, 4.0)};
    ETASSimulator sim(p, options, Region::rectangle(0.0, 10.0, 0.0, 10.0));

    bool thrown = false;
    try {
        sim.simulate(seeds);
    } catch (const SimulationOverflow& e) {
        thrown = true;
        ASSERT_EQ(e.generation(), 1);
    }
    ASSERT_TRUE(thrown);
}

TEST(Simulation, OutOfRegionPolicies) {
    Parameters p = subCritical();
    p.d = 25.0;
    p.mu = 1e-2;
    Region small = Region::rectangle(0.0, 10.0, 0.0, 10.0);
    SimulationOptions options = baseOptions();
    options.horizon = TimeWindow(0.0, 200.0);

    options.out_of_region = OutOfRegionPolicy::Discard;
    SimulationResult discard = ETASSimulator(p, options, small).simulate();
    ASSERT_GT(discard.out_of_region, 0u);
    for (const SimulatedEvent& se : discard.events) ASSERT_TRUE(se.in_region);

    options.out_of_region = OutOfRegionPolicy::KeepAsSource;
    SimulationResult source = ETASSimulator(p, options, small).simulate();
    bool outside_in_arena = false;
    for (const SimulatedEvent& se : source.events) {
        if (!se.in_region) {
            outside_in_arena = true;
            ASSERT_EQ(se.event.id, 0);
        }
    }
    ASSERT_TRUE(outside_in_arena);
    for (const Event& e : source.catalog.events()) {
        ASSERT_TRUE(small.contains(e.x, e.y));
    }

    options.out_of_region = OutOfRegionPolicy::Keep;
    SimulationResult keep = ETASSimulator(p, options, small).simulate();
    bool outside_in_catalog = false;
    for (const Event& e : keep.catalog.events()) {
        if (!small.contains(e.x, e.y)) outside_in_catalog = true;
    }
    ASSERT_TRUE(outside_in_catalog);
}

TEST(Simulation, ContinuationFromSeeds) {
    Parameters p = subCritical();
    p.mu = 1e-8;
    SimulationOptions options = baseOptions();
    options.mode = SimulationMode::Continuation;
    options.horizon = TimeWindow(0.0, 30.0);

    std::vector<Event> seeds = {
        Event(-0.01, 50.0, 50.0, 8.0, 7.0, 77),
        Event(5.0, 50.0, 50.0, 8.0, 6.0, 78),      // at or after t0: ignored
    };
    ETASSimulator sim(p, options, square());
    SimulationResult r = sim.simulate(seeds);

    ASSERT_EQ(r.seed_count, 1u);
    ASSERT_TRUE(r.events[0].is_seed);
    ASSERT_EQ(r.events[0].event.id, 77);
    // kappa(7) = 0.1 * 10^3.2, most of them inside 30 days
    ASSERT_GT(r.catalog.size(), 50u);
    for (const Event& e : r.catalog.events()) {
        ASSERT_GT(e.time, 0.0);
    }
    for (size_t k = 1; k < r.events.size(); k++) {
        ASSERT_FALSE(r.events[k].is_seed);
    }
}

TEST(Simulation, SeedAtHorizonStartTriggers) {
    Parameters p = subCritical();
    p.mu = 1e-8;
    p.k0 = 0.3;
    p.alpha = 0.5;
    SimulationOptions options = baseOptions();
    options.mode = SimulationMode::Continuation;
    options.horizon = TimeWindow(100.0, 110.0);

    // Latest observed event sits exactly at the end of the catalog window
    std::vector<Event> seeds = {Event(100.0, 50.0, 50.0, 8.0, 6.5, 12)};
    SimulationResult r = ETASSimulator(p, options, square()).simulate(seeds);

    ASSERT_EQ(r.seed_count, 1u);
    ASSERT_TRUE(r.events[0].is_seed);
    // kappa(6.5) = 0.3 * 10^1.75, three quarters of it within 10 days
    ASSERT_GT(r.catalog.size(), 0u);
    for (const Event& e : r.catalog.events()) {
        ASSERT_GT(e.time, 100.0);
        ASSERT_LE(e.time, 110.0);
    }
}

TEST(Simulation, FreshStartIgnoresSeeds) {
    std::vector<Event> seeds = {Event(-1.0, 50.0, 50.0, 8.0, 7.0)};
    ETASSimulator sim(subCritical(), baseOptions(), square());
    SimulationResult r = sim.simulate(seeds);
    ASSERT_EQ(r.seed_count, 0u);
    for (const SimulatedEvent& se : r.events) ASSERT_FALSE(se.is_seed);
}

TEST(Simulation, InvalidArguments) {
    Parameters bad = subCritical();
    bad.p = 0.9;
    ASSERT_THROW(ETASSimulator(bad, baseOptions(), square()), std::invalid_argument);

    SimulationOptions empty_horizon = baseOptions();
    empty_horizon.horizon = TimeWindow(10.0, 10.0);
    ASSERT_THROW(ETASSimulator(subCritical(), empty_horizon, square()), std::invalid_argument);

    SimulationOptions no_beta = baseOptions();
    no_beta.beta = 0.0;
    ASSERT_THROW(ETASSimulator(subCritical(), no_beta, square()), std::invalid_argument);

    ASSERT_THROW(ETASSimulator(subCritical(), baseOptions(), Region()), std::invalid_argument);
}

TEST(Simulation, PolicyNames) {
    OutOfRegionPolicy policy;
    ASSERT_TRUE(stringToOutOfRegionPolicy("keep_as_source", policy));
    ASSERT_TRUE(policy == OutOfRegionPolicy::KeepAsSource);
    ASSERT_EQ(outOfRegionPolicyToString(OutOfRegionPolicy::Discard), "discard");
    ASSERT_FALSE(stringToOutOfRegionPolicy("drop", policy));

    SimulationMode mode;
    ASSERT_TRUE(stringToSimulationMode("continuation", mode));
    ASSERT_TRUE(mode == SimulationMode::Continuation);
}
