#pragma once

#include "../core/event.hpp"
#include "../inversion/etas_inversion.hpp"
#include "../simulation/etas_simulator.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace openetas {

/**
 * ForecastOptions - Ensemble forecast settings
 *
 * simulation carries kernels, seed, safety limits and the out-of-region
 * policy; its horizon, mode and magnitude settings are filled in from
 * the catalog and the fields below.
 */
struct ForecastOptions {
    SimulationOptions simulation;
    SimulationMode mode = SimulationMode::Continuation;

    int n_simulations = 100;
    double forecast_days = 30.0;
    double burn_in_days = 365.25;       // fresh-start mode only
    double m_threshold = 5.0;

    int grid_nx = 32;                   // expected-rate map
    int grid_ny = 32;

    bool keep_catalogs = false;
    int n_threads = 0;
    bool verbose = false;
};

/**
 * RealizationSummary - Outcome of one ensemble member
 */
struct RealizationSummary {
    uint64_t index = 0;
    bool failed = false;
    std::string error;
    size_t n_events = 0;
    size_t n_above_threshold = 0;
    double max_magnitude = 0;
    int generations = 0;
};

/**
 * EnsembleResult - Realisations and their summary statistics
 */
struct EnsembleResult {
    TimeWindow window;
    double m_threshold = 0;
    std::vector<RealizationSummary> realizations;
    std::vector<Catalog> catalogs;          // only with keep_catalogs

    size_t n_failed = 0;
    double mean_count = 0;
    double quantile_05 = 0;
    double quantile_50 = 0;
    double quantile_95 = 0;
    double probability_above_threshold = 0; // P(at least one event >= m_threshold)

    // Expected events per cell over the window, row-major from the
    // south-west corner of grid_bounds
    Bounds grid_bounds;
    int grid_nx = 0;
    int grid_ny = 0;
    std::vector<double> rate_map;

    double elapsed_seconds = 0;

    size_t succeeded() const { return realizations.size() - n_failed; }
    std::string summary() const;
};

/**
 * ForecastResult - Optional inversion followed by an ensemble
 */
struct ForecastResult {
    bool inverted = false;
    InversionResult inversion;
    Parameters parameters;
    EnsembleResult ensemble;
};

/**
 * ForecastEngine - Inversion plus Monte Carlo ensemble
 *
 * Each realisation r draws from its own stream seeded from (seed, r), so
 * results do not depend on the number of worker threads. A realisation
 * that overflows is recorded as failed and the ensemble continues.
 */
class ForecastEngine {
public:
    ForecastEngine(const ForecastOptions& options,
                   const InversionOptions& inversion = InversionOptions());

    // Invert the catalog, then simulate
    ForecastResult run(const Catalog& catalog);

    // Simulate from supplied parameters; the inversion is skipped.
    // Throws std::invalid_argument for parameters outside the model domain.
    ForecastResult run(const Catalog& catalog, const Parameters& params,
                       BackgroundFieldPtr field = nullptr);

    EnsembleResult runEnsemble(const Catalog& catalog, const Parameters& params,
                               BackgroundFieldPtr field, double beta) const;

    // Independent stream for realisation r
    static Rng realizationStream(uint64_t seed, uint64_t r);

    // Linear interpolation between order statistics of a sorted sample
    static double quantile(const std::vector<double>& sorted, double q);

    const ForecastOptions& options() const { return options_; }

private:
    ForecastOptions options_;
    InversionOptions inversion_options_;

    double catalogBeta(const Catalog& catalog) const;
};

} // namespace openetas
