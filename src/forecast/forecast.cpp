#include "openetas/forecast/forecast.hpp"
#include "openetas/inversion/magnitude_estimator.hpp"
#include "openetas/core/errors.hpp"
#include "openetas/core/parallel.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace openetas {

std::string EnsembleResult::summary() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "Forecast [" << window.start << ", " << window.end << "] days, "
        << realizations.size() << " realisations (" << n_failed << " failed)\n";
    oss << "  Events: mean " << mean_count
        << ", 5% " << quantile_05
        << ", 50% " << quantile_50
        << ", 95% " << quantile_95 << "\n";
    oss << std::setprecision(4);
    oss << "  P(M >= " << m_threshold << "): " << probability_above_threshold << "\n";
    oss << std::setprecision(2);
    oss << "  Elapsed: " << elapsed_seconds << " s\n";
    return oss.str();
}

ForecastEngine::ForecastEngine(const ForecastOptions& options,
                               const InversionOptions& inversion)
    : options_(options)
    , inversion_options_(inversion)
{
    inversion_options_.kernels = options_.simulation.kernels;
}

Rng ForecastEngine::realizationStream(uint64_t seed, uint64_t r) {
    std::seed_seq seq{
        static_cast<uint32_t>(seed & 0xffffffffu), static_cast<uint32_t>(seed >> 32),
        static_cast<uint32_t>(r & 0xffffffffu), static_cast<uint32_t>(r >> 32)
    };
    return Rng(seq);
}

double ForecastEngine::quantile(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) return 0.0;
    if (sorted.size() == 1) return sorted.front();

    double pos = q * (sorted.size() - 1);
    size_t lo = static_cast<size_t>(std::floor(pos));
    size_t hi = std::min(lo + 1, sorted.size() - 1);
    double frac = pos - lo;
    return sorted[lo] * (1.0 - frac) + sorted[hi] * frac;
}

double ForecastEngine::catalogBeta(const Catalog& catalog) const {
    try {
        return MagnitudeEstimator::estimate(catalog).beta;
    } catch (const DataError& e) {
        std::cerr << "ForecastEngine: " << e.what()
                  << ", using configured beta" << std::endl;
        return options_.simulation.beta;
    }
}

ForecastResult ForecastEngine::run(const Catalog& catalog) {
    ForecastResult result;
    result.inverted = true;

    ETASInversion inversion(inversion_options_);
    result.inversion = inversion.run(catalog);

    if (!result.inversion.succeeded()) {
        std::cerr << "ForecastEngine: inversion " << inversionStateToString(result.inversion.state)
                  << ", no ensemble simulated" << std::endl;
        result.parameters = result.inversion.parameters;
        return result;
    }

    result.parameters = result.inversion.parameters;
    result.ensemble = runEnsemble(catalog, result.parameters, result.inversion.background,
                                  result.inversion.diagnostics.beta);
    return result;
}

ForecastResult ForecastEngine::run(const Catalog& catalog, const Parameters& params,
                                   BackgroundFieldPtr field) {
    std::string reason;
    if (!params.isValid(options_.simulation.kernels, &reason)) {
        throw std::invalid_argument("ForecastEngine: " + reason);
    }

    ForecastResult result;
    result.inverted = false;
    result.parameters = params;
    result.ensemble = runEnsemble(catalog, params, field, catalogBeta(catalog));
    return result;
}

EnsembleResult ForecastEngine::runEnsemble(const Catalog& catalog, const Parameters& params,
                                           BackgroundFieldPtr field, double beta) const {
    auto start_time = std::chrono::steady_clock::now();

    SimulationOptions sim = options_.simulation;
    sim.mode = options_.mode;
    sim.horizon = TimeWindow(catalog.window().end,
                             catalog.window().end + options_.forecast_days);
    sim.burn_in_days = options_.burn_in_days;
    sim.mc = catalog.mc();
    sim.delta_m = catalog.deltaM();
    sim.beta = beta;
    sim.verbose = false;

    ETASSimulator simulator(params, sim, catalog.region(), field);

    const size_t n = static_cast<size_t>(std::max(0, options_.n_simulations));
    // Events below their local completeness are not part of the history
    std::vector<Event> seeds;
    seeds.reserve(catalog.size());
    for (size_t i = 0; i < catalog.size(); i++) {
        if (catalog.isComplete(i)) seeds.push_back(catalog[i]);
    }

    EnsembleResult ensemble;
    ensemble.window = sim.horizon;
    ensemble.m_threshold = options_.m_threshold;
    ensemble.realizations.resize(n);
    if (options_.keep_catalogs) ensemble.catalogs.resize(n);

    const Bounds& bounds = catalog.region().bounds();
    const int nx = std::max(1, options_.grid_nx);
    const int ny = std::max(1, options_.grid_ny);
    ensemble.grid_bounds = bounds;
    ensemble.grid_nx = nx;
    ensemble.grid_ny = ny;

    const int workers = resolveThreadCount(options_.n_threads, n);
    std::vector<std::vector<double>> cell_counts(
        workers, std::vector<double>(static_cast<size_t>(nx) * ny, 0.0));

    std::cout << "ForecastEngine: " << n << " realisations of ["
              << sim.horizon.start << ", " << sim.horizon.end << "] ("
              << simulationModeToString(sim.mode) << ") on "
              << workers << " threads" << std::endl;

    parallelFor(n, workers, [&](size_t begin, size_t end, int w) {
        for (size_t r = begin; r < end; r++) {
            RealizationSummary& summary = ensemble.realizations[r];
            summary.index = r;

            Rng rng = realizationStream(sim.seed, r);
            SimulationResult realization;
            try {
                realization = simulator.simulate(seeds, rng);
            } catch (const SimulationOverflow& e) {
                summary.failed = true;
                summary.error = e.what();
                continue;
            }

            const Catalog& cat = realization.catalog;
            summary.n_events = cat.size();
            summary.generations = realization.generations;
            summary.max_magnitude = cat.empty() ? 0.0 : cat.maxMagnitude();
            for (const auto& e : cat.events()) {
                if (e.magnitude >= options_.m_threshold) summary.n_above_threshold++;

                int ix = static_cast<int>((e.x - bounds.min_x) / bounds.width() * nx);
                int iy = static_cast<int>((e.y - bounds.min_y) / bounds.height() * ny);
                if (ix >= 0 && ix < nx && iy >= 0 && iy < ny) {
                    cell_counts[w][static_cast<size_t>(iy) * nx + ix] += 1.0;
                }
            }

            if (options_.keep_catalogs) ensemble.catalogs[r] = cat;
        }
    });

    // Statistics over successful realisations
    std::vector<double> counts;
    size_t with_large = 0;
    for (const auto& s : ensemble.realizations) {
        if (s.failed) {
            ensemble.n_failed++;
            std::cerr << "ForecastEngine: realisation " << s.index
                      << " failed: " << s.error << std::endl;
            continue;
        }
        counts.push_back(static_cast<double>(s.n_events));
        if (s.n_above_threshold > 0) with_large++;
    }

    if (!counts.empty()) {
        std::sort(counts.begin(), counts.end());
        double sum = 0;
        for (double c : counts) sum += c;
        ensemble.mean_count = sum / counts.size();
        ensemble.quantile_05 = quantile(counts, 0.05);
        ensemble.quantile_50 = quantile(counts, 0.50);
        ensemble.quantile_95 = quantile(counts, 0.95);
        ensemble.probability_above_threshold =
            static_cast<double>(with_large) / counts.size();

        ensemble.rate_map.assign(static_cast<size_t>(nx) * ny, 0.0);
        for (const auto& grid : cell_counts) {
            for (size_t k = 0; k < grid.size(); k++) ensemble.rate_map[k] += grid[k];
        }
        for (double& v : ensemble.rate_map) v /= counts.size();
    }

    ensemble.elapsed_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_time).count();

    if (options_.verbose) std::cout << ensemble.summary();
    return ensemble;
}

} // namespace openetas
