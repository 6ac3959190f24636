/**
 * Synthetic Round Trip - Simulate, Invert, Forecast
 *
 * Generates synthetic ETAS catalogs from known parameters for several
 * kernel configurations, inverts each one and compares the recovered
 * parameters with the truth. The last configuration also drives a short
 * continuation forecast.
 *
 * This example:
 *   1. Simulates a fresh-start catalog over a 100 x 100 km region
 *   2. Inverts it with the EM engine
 *   3. Prints true and recovered parameters side by side
 *   4. Runs a 30-day forecast ensemble from the recovered model
 *   5. Stores catalogs and runs in an SQLite database
 */

#include <iostream>
#include <iomanip>
#include <cmath>
#include <string>
#include <vector>

#include "openetas/core/types.hpp"
#include "openetas/core/region.hpp"
#include "openetas/core/event.hpp"
#include "openetas/core/errors.hpp"
#include "openetas/database/catalog_database.hpp"
#include "openetas/inversion/etas_inversion.hpp"
#include "openetas/simulation/etas_simulator.hpp"
#include "openetas/forecast/forecast.hpp"

using namespace openetas;

// ============================================================================
// Ground Truth
// ============================================================================
namespace Truth {
    constexpr double MU = 2e-4;         // events / km^2 / day
    constexpr double K0 = 0.02;
    constexpr double ALPHA = 1.0;
    constexpr double C = 0.01;          // days
    constexpr double P = 1.15;
    constexpr double TAU = 500.0;       // days
    constexpr double D = 0.5;           // km^2
    constexpr double GAMMA = 0.5;
    constexpr double Q = 1.6;

    constexpr double MC = 3.0;
    constexpr double DELTA_M = 0.1;
    constexpr double B_VALUE = 1.0;
    constexpr double DURATION = 3652.5; // days
}

struct RoundTripConfig {
    std::string name;
    KernelConfig kernels;
};

struct RoundTripResult {
    std::string name;
    size_t n_events;
    Parameters recovered;
    InversionState state;
    int iterations;
    double branching_ratio;
};

static Parameters trueParameters() {
    Parameters p;
    p.mu = Truth::MU;
    p.k0 = Truth::K0;
    p.alpha = Truth::ALPHA;
    p.c = Truth::C;
    p.p = Truth::P;
    p.tau = Truth::TAU;
    p.d = Truth::D;
    p.gamma = Truth::GAMMA;
    p.q = Truth::Q;
    return p;
}

static void printComparison(const Parameters& truth, const RoundTripResult& res,
                            const KernelConfig& kernels) {
    std::cout << "  " << std::left << std::setw(8) << "param"
              << std::right << std::setw(14) << "true"
              << std::setw(14) << "recovered"
              << std::setw(12) << "rel.err" << "\n";
    for (int i = 0; i < PARAM_COUNT; i++) {
        Param which = static_cast<Param>(i);
        if (!Parameters::isUsed(which, kernels)) continue;
        double t = truth.get(which);
        double r = res.recovered.get(which);
        std::cout << "  " << std::left << std::setw(8) << paramName(which)
                  << std::right << std::setw(14) << std::setprecision(5) << t
                  << std::setw(14) << r
                  << std::setw(11) << std::setprecision(1) << std::fixed
                  << 100.0 * std::abs(r - t) / t << "%" << std::defaultfloat << "\n";
    }
}

int main(int argc, char* argv[]) {
    std::string db_file = "synthetic_roundtrip.db";
    uint64_t seed = 2024;
    if (argc > 1) db_file = argv[1];
    if (argc > 2) seed = std::stoull(argv[2]);

    std::cout << "================================================================\n"
              << " OpenETAS - Synthetic Round Trip\n"
              << "================================================================\n\n";

    Region region = Region::rectangle(0.0, 100.0, 0.0, 100.0);
    Parameters truth = trueParameters();

    CatalogDatabase database;
    bool db_enabled = database.open(db_file);
    if (!db_enabled) {
        std::cerr << "Database disabled: " << database.lastError() << std::endl;
    }

    std::vector<RoundTripConfig> configs = {
        {"Omori + power law",   KernelConfig(TemporalKernel::OmoriUtsu, SpatialKernel::PowerLaw)},
        {"Omori + Gaussian",    KernelConfig(TemporalKernel::OmoriUtsu, SpatialKernel::Gaussian)},
        {"Tapered + power law", KernelConfig(TemporalKernel::TaperedOmori, SpatialKernel::PowerLaw)},
    };

    std::vector<RoundTripResult> results;
    Catalog last_catalog;
    InversionResult last_inversion;

    for (size_t k = 0; k < configs.size(); k++) {
        const RoundTripConfig& cfg = configs[k];
        std::cout << "--- " << cfg.name << " ---\n";

        SimulationOptions sim;
        sim.kernels = cfg.kernels;
        sim.horizon = TimeWindow(0.0, Truth::DURATION);
        sim.burn_in_days = 365.25;
        sim.mc = Truth::MC;
        sim.delta_m = Truth::DELTA_M;
        sim.beta = Truth::B_VALUE * constants::LN10;
        sim.m_max = 8.0;
        sim.seed = seed + k;

        std::cout << "  Branching ratio (truth): "
                  << branchingRatio(truth, sim.beta, sim.referenceMagnitude(), sim.m_max)
                  << "\n";

        SimulationResult simulated;
        try {
            ETASSimulator simulator(truth, sim, region);
            simulated = simulator.simulate();
        } catch (const SimulationOverflow& e) {
            std::cerr << "  Simulation aborted: " << e.what() << std::endl;
            continue;
        }

        std::cout << "  Simulated " << simulated.catalog.size() << " events ("
                  << simulated.background_count << " background, "
                  << simulated.generations << " generations)\n";

        int64_t catalog_id = schema::NULL_INT;
        if (db_enabled) {
            catalog_id = database.storeSimulation(simulated, cfg.name, static_cast<int64_t>(k));
        }

        InversionOptions inv;
        inv.kernels = cfg.kernels;
        inv.max_iterations = 50;
        inv.b_value = Truth::B_VALUE;

        InversionResult inverted;
        try {
            ETASInversion inversion(inv);
            inverted = inversion.run(simulated.catalog);
        } catch (const InversionError& e) {
            std::cerr << "  Inversion failed at iteration " << e.iteration()
                      << ": " << e.what() << std::endl;
            continue;
        }

        RoundTripResult res;
        res.name = cfg.name;
        res.n_events = simulated.catalog.size();
        res.recovered = inverted.parameters;
        res.state = inverted.state;
        res.iterations = inverted.diagnostics.iterations;
        res.branching_ratio = inverted.diagnostics.branching_ratio;

        std::cout << "  Inversion " << inversionStateToString(res.state)
                  << " after " << res.iterations << " iterations\n";
        printComparison(truth, res, cfg.kernels);
        std::cout << "\n";

        if (db_enabled && inverted.succeeded()) {
            database.storeInversion(inverted, catalog_id);
        }

        results.push_back(res);
        last_catalog = simulated.catalog;
        last_inversion = inverted;
    }

    // Summary table
    std::cout << "================================================================\n"
              << " Summary\n"
              << "================================================================\n";
    std::cout << std::left << std::setw(24) << "Configuration"
              << std::right << std::setw(8) << "Events"
              << std::setw(24) << "State"
              << std::setw(6) << "Iter"
              << std::setw(10) << "n_br" << "\n";
    for (const auto& r : results) {
        std::cout << std::left << std::setw(24) << r.name
                  << std::right << std::setw(8) << r.n_events
                  << std::setw(24) << inversionStateToString(r.state)
                  << std::setw(6) << r.iterations
                  << std::setw(10) << std::setprecision(3) << r.branching_ratio << "\n";
    }
    std::cout << "\n";

    if (!last_inversion.succeeded()) {
        std::cerr << "No usable inversion for the forecast" << std::endl;
        return 1;
    }

    // Continuation forecast from the recovered model
    ForecastOptions fc;
    fc.simulation.kernels = last_inversion.kernels;
    fc.simulation.mc = Truth::MC;
    fc.simulation.delta_m = Truth::DELTA_M;
    fc.simulation.m_max = 8.0;
    fc.simulation.seed = seed;
    fc.n_simulations = 200;
    fc.forecast_days = 30.0;
    fc.m_threshold = 5.0;

    ForecastEngine engine(fc);
    ForecastResult forecast = engine.run(last_catalog, last_inversion.parameters,
                                         last_inversion.background);

    std::cout << "30-day forecast from the last recovered model:\n"
              << forecast.ensemble.summary() << std::endl;

    if (db_enabled) {
        std::cout << "\nDatabase " << db_file << ": " << database.countCatalogs()
                  << " catalogs, " << database.countEvents() << " events, "
                  << database.countInversionRuns() << " inversion runs" << std::endl;
    }

    return 0;
}
