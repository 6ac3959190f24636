#include "openetas/inversion/etas_inversion.hpp"
#include "openetas/inversion/magnitude_estimator.hpp"
#include "openetas/core/parallel.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <numeric>
#include <sstream>

namespace openetas {

namespace {

// Triggering parameters handled by the numerical M-step
const Param TRIGGERING_PARAMS[] = {
    Param::K0, Param::Alpha, Param::C, Param::P,
    Param::Tau, Param::D, Param::Gamma, Param::Q
};

// Scale parameters are optimised in log space
bool isLogScaled(Param p) {
    return p == Param::K0 || p == Param::C || p == Param::Tau || p == Param::D;
}

double toInternal(Param p, double v) {
    return isLogScaled(p) ? std::log(v) : v;
}

double fromInternal(Param p, double x) {
    return isLogScaled(p) ? std::exp(x) : x;
}

double maxRelativeChange(const Parameters& a, const Parameters& b,
                         const KernelConfig& kernels) {
    double change = 0;
    for (int i = 0; i < PARAM_COUNT; i++) {
        Param which = static_cast<Param>(i);
        if (!Parameters::isUsed(which, kernels)) continue;
        double old_v = a.get(which);
        double new_v = b.get(which);
        double scale = std::max(std::abs(old_v), 1e-12);
        change = std::max(change, std::abs(new_v - old_v) / scale);
    }
    return change;
}

} // anonymous namespace

std::string inversionStateToString(InversionState state) {
    switch (state) {
        case InversionState::Initializing: return "Initializing";
        case InversionState::Iterating: return "Iterating";
        case InversionState::Converged: return "Converged";
        case InversionState::MaxIterationsReached: return "MaxIterationsReached";
        case InversionState::Failed: return "Failed";
    }
    return "Unknown";
}

// ============================================================================
// TriggeringProbabilityMatrix
// ============================================================================

size_t TriggeringProbabilityMatrix::linkCount() const {
    size_t n = 0;
    for (const auto& row : triggers) n += row.size();
    return n;
}

double TriggeringProbabilityMatrix::rowSum(size_t row) const {
    double sum = background[row];
    for (const auto& link : triggers[row]) sum += link.probability;
    return sum;
}

double TriggeringProbabilityMatrix::expectedBackgroundCount() const {
    return std::accumulate(background.begin(), background.end(), 0.0);
}

double TriggeringProbabilityMatrix::expectedTriggeredCount() const {
    return static_cast<double>(rows()) - expectedBackgroundCount();
}

// ============================================================================
// InversionResult
// ============================================================================

Catalog InversionResult::declusteredCatalog(double threshold) const {
    if (!catalog) return Catalog();

    std::vector<Event> kept;
    for (size_t i = 0; i < catalog->size(); i++) {
        if (!catalog->isTarget(i)) continue;
        if (i < background_probability.size() && background_probability[i] >= threshold) {
            kept.push_back((*catalog)[i]);
        }
    }
    return Catalog(kept, catalog->region(), catalog->window(), catalog->mc(),
                   catalog->deltaM(), catalog->auxiliaryStart());
}

std::string InversionResult::summary() const {
    std::ostringstream oss;
    oss << "Inversion " << inversionStateToString(state)
        << " after " << diagnostics.iterations << " iterations";
    if (!message.empty()) oss << " (" << message << ")";
    oss << "\n";
    oss << "  Kernels: " << kernels.toString() << "\n";
    oss << "  Parameters: " << parameters.toString() << "\n";
    oss << std::fixed << std::setprecision(3);
    oss << "  Targets: " << diagnostics.n_targets
        << ", sources: " << diagnostics.n_sources << "\n";
    oss << "  b-value: " << diagnostics.b_value
        << ", branching ratio: " << diagnostics.branching_ratio << "\n";
    oss << "  Expected background events: " << diagnostics.expected_background << "\n";
    if (!diagnostics.log_likelihood.empty()) {
        oss << "  Log-likelihood: " << diagnostics.log_likelihood.back() << "\n";
    }
    oss << "  Warnings: " << diagnostics.warnings.size()
        << ", elapsed: " << diagnostics.elapsed_seconds << " s\n";
    return oss.str();
}

// ============================================================================
// ETASInversion
// ============================================================================

ETASInversion::ETASInversion(const InversionOptions& options)
    : options_(options)
    , state_(InversionState::Initializing)
{
}

void ETASInversion::warn(InversionDiagnostics& diag, const std::string& message,
                         int iteration) const {
    diag.warnings.emplace_back(message, iteration);
    std::cerr << "ETASInversion: warning: " << message << std::endl;
}

Parameters ETASInversion::initialParameters(const Catalog& catalog, double b_value) const {
    Parameters p;

    const double area = catalog.region().area();
    const double duration = catalog.window().length();
    const size_t n = catalog.targetCount();

    if (n > 0 && area > 0 && duration > 0) {
        p.mu = 0.5 * static_cast<double>(n) / (area * duration);
    }
    if (b_value > 0) {
        p.alpha = 0.8 * b_value;
    }

    for (const auto& kv : options_.initial_values) {
        p.set(kv.first, kv.second);
    }
    return p;
}

TriggeringProbabilityMatrix ETASInversion::computeTriggeringProbabilities(
    const Catalog& catalog, const Parameters& params,
    const BackgroundField& field) const {

    TriggeringKernel kernel(params, options_.kernels, catalog.referenceMagnitude());
    const auto& events = catalog.events();

    TriggeringProbabilityMatrix probs;
    probs.targets = catalog.targetIndices();
    const size_t rows = probs.targets.size();
    probs.background.assign(rows, 0.0);
    probs.log_intensity.assign(rows, 0.0);
    probs.triggers.assign(rows, std::vector<TriggeringLink>());

    const int workers = resolveThreadCount(options_.n_threads, rows);
    std::vector<double> partial_log(workers, 0.0);
    std::vector<size_t> partial_floor(workers, 0);

    parallelFor(rows, workers, [&](size_t begin, size_t end, int w) {
        for (size_t r = begin; r < end; r++) {
            const size_t j = probs.targets[r];
            const Event& target = events[j];

            // Earliest source inside the lookback window
            auto first = std::lower_bound(events.begin(), events.begin() + j,
                target.time - options_.lookback_days,
                [](const Event& e, double t) { return e.time < t; });

            double lambda_b = field.intensity(target.x, target.y, params.mu);
            if (field.belowFloor(target.x, target.y)) partial_floor[w]++;

            auto& links = probs.triggers[r];
            double total = lambda_b;

            for (auto it = first; it != events.begin() + j; ++it) {
                if (!catalog.isComplete(static_cast<size_t>(it - events.begin()))) continue;
                double dt = target.time - it->time;
                if (dt <= 0) continue;
                double dx = target.x - it->x;
                double dy = target.y - it->y;
                double lam = kernel.triggeringDensity(dt, dx * dx + dy * dy, it->magnitude);
                if (lam > 0) {
                    links.push_back({static_cast<size_t>(it - events.begin()), lam});
                    total += lam;
                }
            }

            if (!(total > 0) || !std::isfinite(total)) {
                throw InversionError("Non-finite intensity at event " +
                                     std::to_string(target.id), params, 0);
            }

            probs.background[r] = lambda_b / total;
            for (auto& link : links) link.probability /= total;
            probs.log_intensity[r] = std::log(total);
            partial_log[w] += probs.log_intensity[r];
        }
    });

    probs.sum_log_intensity = std::accumulate(partial_log.begin(), partial_log.end(), 0.0);
    probs.floored_events = std::accumulate(partial_floor.begin(), partial_floor.end(), size_t(0));
    return probs;
}

double ETASInversion::expectedTriggeredTotal(const Catalog& catalog,
                                             const TriggeringKernel& kernel) const {
    const auto& events = catalog.events();
    const TimeWindow& window = catalog.window();
    const Region& region = catalog.region();

    const int workers = resolveThreadCount(options_.n_threads, events.size());
    std::vector<double> partial(workers, 0.0);

    parallelFor(events.size(), workers, [&](size_t begin, size_t end, int w) {
        for (size_t i = begin; i < end; i++) {
            const Event& e = events[i];
            if (e.time >= window.end || !catalog.isComplete(i)) continue;

            // Share of the offspring falling in the target window and region
            double g = kernel.temporalIntegral(std::max(0.0, window.start - e.time),
                                               window.end - e.time);
            if (g <= 0) continue;
            double f = kernel.spatialFractionInside(e.x, e.y, e.magnitude, region);
            partial[w] += kernel.productivity(e.magnitude) * g * f;
        }
    });

    return std::accumulate(partial.begin(), partial.end(), 0.0);
}

std::vector<double> ETASInversion::detectionWeights(const Catalog& catalog,
                                                   const TriggeringProbabilityMatrix& probs,
                                                   double beta) {
    std::vector<double> weights(probs.rows(), 1.0);
    for (size_t r = 0; r < probs.rows(); r++) {
        double raised = catalog.completeness(probs.targets[r]) - catalog.mc();
        if (raised > 0) weights[r] = std::exp(beta * raised);
    }
    return weights;
}

double ETASInversion::completeLogLikelihood(const Catalog& catalog, const Parameters& params,
                                            const TriggeringProbabilityMatrix& probs,
                                            const std::vector<double>& weights) const {
    TriggeringKernel kernel(params, options_.kernels, catalog.referenceMagnitude());
    double sum_log = 0;
    for (size_t r = 0; r < probs.rows(); r++) sum_log += weights[r] * probs.log_intensity[r];
    return sum_log -
           params.mu * catalog.region().area() * catalog.window().length() -
           expectedTriggeredTotal(catalog, kernel);
}

double ETASInversion::logLikelihood(const Catalog& catalog, const Parameters& params,
                                    const BackgroundField& field, double beta) const {
    auto probs = computeTriggeringProbabilities(catalog, params, field);
    return completeLogLikelihood(catalog, params, probs, detectionWeights(catalog, probs, beta));
}

Parameters ETASInversion::maximize(const Parameters& start, const Catalog& catalog,
                                   const TriggeringProbabilityMatrix& probs,
                                   const std::vector<double>& weights,
                                   InversionDiagnostics& diag) const {
    std::vector<Param> free_params;
    for (Param which : TRIGGERING_PARAMS) {
        if (!Parameters::isUsed(which, options_.kernels)) continue;
        if (options_.fixed.count(which)) continue;
        free_params.push_back(which);
    }
    if (free_params.empty()) return start;

    // Flatten (source, target) pairs with their weights
    struct Pair { double dt; double r2; double m; double w; };
    std::vector<Pair> pairs;
    pairs.reserve(probs.linkCount());

    const auto& events = catalog.events();
    for (size_t r = 0; r < probs.rows(); r++) {
        const Event& target = events[probs.targets[r]];
        for (const auto& link : probs.triggers[r]) {
            if (link.probability <= 0) continue;
            const Event& source = events[link.source];
            double dx = target.x - source.x;
            double dy = target.y - source.y;
            pairs.push_back({target.time - source.time, dx * dx + dy * dy,
                             source.magnitude, weights[r] * link.probability});
        }
    }

    const int n = static_cast<int>(free_params.size());
    const ParameterBounds bounds = ParameterBounds::defaults(options_.kernels);

    Eigen::VectorXd x0(n), lower(n), upper(n);
    for (int k = 0; k < n; k++) {
        Param which = free_params[k];
        double lo = bounds.lowerOf(which);
        double hi = bounds.upperOf(which);
        double v = std::min(hi, std::max(lo, start.get(which)));
        // log(0) is not representable
        if (isLogScaled(which)) lo = std::max(lo, 1e-300);
        x0[k] = toInternal(which, v);
        lower[k] = toInternal(which, lo);
        upper[k] = toInternal(which, hi);
    }

    auto unpack = [&](const Eigen::VectorXd& x) {
        Parameters p = start;
        for (int k = 0; k < n; k++) p.set(free_params[k], fromInternal(free_params[k], x[k]));
        return p;
    };

    const double m_ref = catalog.referenceMagnitude();
    const int workers = resolveThreadCount(options_.n_threads, pairs.size());

    // Negative expected complete-data log-likelihood of the triggering part
    auto objective = [&](const Eigen::VectorXd& x) -> double {
        Parameters p = unpack(x);
        if (!p.isValid(options_.kernels)) return std::numeric_limits<double>::infinity();

        TriggeringKernel kernel(p, options_.kernels, m_ref);
        if (!std::isfinite(kernel.logTemporalDensity(0.0))) {
            return std::numeric_limits<double>::infinity();
        }

        std::vector<double> partial(workers, 0.0);
        parallelFor(pairs.size(), workers, [&](size_t begin, size_t end, int w) {
            double sum = 0;
            for (size_t k = begin; k < end; k++) {
                const Pair& pr = pairs[k];
                sum += pr.w * (kernel.logProductivity(pr.m) +
                               kernel.logTemporalDensity(pr.dt) +
                               kernel.logSpatialDensity(pr.r2, pr.m));
            }
            partial[w] = sum;
        });

        double expected = std::accumulate(partial.begin(), partial.end(), 0.0);
        return -(expected - expectedTriggeredTotal(catalog, kernel));
    };

    OptimizerOptions opt_options = options_.optimizer;
    opt_options.verbose = opt_options.verbose && options_.verbose;
    DFPOptimizer optimizer(opt_options);
    optimizer.setBounds(lower, upper);

    OptimizerResult res = optimizer.minimize(objective, x0);
    diag.optimizer_evaluations += res.evaluations;

    if (options_.verbose) {
        std::cout << "ETASInversion: M-step " << res.message
                  << " after " << res.iterations << " line searches, "
                  << res.evaluations << " evaluations" << std::endl;
    }

    return unpack(res.x);
}

EMState ETASInversion::iterate(const EMState& current, const Catalog& catalog,
                               const std::vector<double>& bandwidths,
                               InversionDiagnostics& diag) {
    const double area = catalog.region().area();
    const double duration = catalog.window().length();

    // E-step
    auto probs = computeTriggeringProbabilities(catalog, current.parameters, *current.field);
    auto weights = detectionWeights(catalog, probs, diag.beta);

    double ll = completeLogLikelihood(catalog, current.parameters, probs, weights);

    if (!std::isfinite(ll)) {
        throw InversionError("Non-finite log-likelihood", current.parameters, current.iteration);
    }
    if (probs.floored_events > 0) {
        warn(diag, "NumericalWarning: background intensity floored at " +
             std::to_string(probs.floored_events) + " event locations", current.iteration);
    }

    // M-step
    // Targets above a raised completeness stand for exp(beta dm) events
    std::vector<double> background_weights(probs.rows());
    for (size_t r = 0; r < probs.rows(); r++) {
        background_weights[r] = weights[r] * probs.background[r];
    }

    Parameters next = maximize(current.parameters, catalog, probs, weights, diag);
    if (!options_.fixed.count(Param::Mu)) {
        next.mu = std::accumulate(background_weights.begin(), background_weights.end(), 0.0) /
                  (area * duration);
    }

    std::string reason;
    if (!next.isValid(options_.kernels, &reason)) {
        throw InversionError("M-step left the model domain: " + reason,
                             current.parameters, current.iteration + 1);
    }

    // Background field from the new background probabilities
    std::vector<Point2D> points;
    points.reserve(probs.rows());
    for (size_t j : probs.targets) points.push_back(catalog[j].location());

    EMState out;
    out.iteration = current.iteration + 1;
    out.parameters = next;
    out.field = std::make_shared<const BackgroundField>(
        BackgroundField::estimate(points, background_weights, bandwidths,
                                  catalog.region(), options_.background));
    out.background_probability.assign(catalog.size(), 0.0);
    for (size_t r = 0; r < probs.rows(); r++) {
        out.background_probability[probs.targets[r]] = probs.background[r];
    }
    out.log_likelihood = ll;

    if (options_.verbose) {
        std::cout << "ETASInversion: iteration " << out.iteration
                  << " logL=" << std::setprecision(10) << ll
                  << " E[background]=" << std::setprecision(4)
                  << probs.expectedBackgroundCount() << "\n"
                  << "  " << next.toString() << std::endl;
    }

    return out;
}

InversionResult ETASInversion::run(const Catalog& catalog) {
    auto start_time = std::chrono::steady_clock::now();
    state_ = InversionState::Initializing;

    InversionResult result;
    result.kernels = options_.kernels;
    result.catalog = std::make_shared<const Catalog>(catalog);
    result.background_probability.assign(catalog.size(), 0.0);

    InversionDiagnostics& diag = result.diagnostics;
    diag.n_targets = catalog.targetCount();
    for (size_t i = 0; i < catalog.size(); i++) {
        if (catalog.isComplete(i)) diag.n_sources++;
    }

    auto finish = [&]() {
        diag.elapsed_seconds = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_time).count();
        result.state = state_;
    };

    if (diag.n_targets == 0) {
        state_ = InversionState::Failed;
        result.message = "catalog has no target events";
        result.parameters = initialParameters(catalog, options_.b_value);
        result.background = std::make_shared<const BackgroundField>(
            BackgroundField::uniform(catalog.region()));
        std::cerr << "ETASInversion: " << result.message << std::endl;
        finish();
        return result;
    }

    std::cout << "ETASInversion: " << diag.n_targets << " targets, "
              << diag.n_sources << " sources, kernels "
              << options_.kernels.toString() << std::endl;

    // Gutenberg-Richter slope
    double b_value = options_.b_value;
    if (b_value <= 0) {
        try {
            b_value = MagnitudeEstimator::estimate(catalog).b_value;
        } catch (const DataError& e) {
            b_value = 1.0;
            warn(diag, std::string("b-value estimate failed (") + e.what() +
                 "), using b = 1", 0);
        }
    }
    diag.b_value = b_value;
    diag.beta = b_value * constants::LN10;

    Parameters init = initialParameters(catalog, b_value);
    std::string reason;
    if (!init.isValid(options_.kernels, &reason)) {
        state_ = InversionState::Failed;
        throw InversionError("Invalid starting parameters: " + reason, init, 0);
    }

    // Bandwidths are fixed for the whole run
    auto targets = catalog.targetIndices();
    std::vector<Point2D> points;
    points.reserve(targets.size());
    for (size_t j : targets) points.push_back(catalog[j].location());

    auto bandwidths = BackgroundField::adaptiveBandwidths(
        points, options_.background.n_neighbors, options_.background.min_bandwidth);

    EMState current;
    current.iteration = 0;
    current.parameters = init;
    current.field = std::make_shared<const BackgroundField>(
        BackgroundField::estimate(points, std::vector<double>(points.size(), 0.5),
                                  bandwidths, catalog.region(), options_.background));
    current.background_probability.assign(catalog.size(), 0.0);
    for (size_t j : targets) current.background_probability[j] = 0.5;

    state_ = InversionState::Iterating;

    EMState best = current;
    double best_ll = -std::numeric_limits<double>::infinity();
    bool converged = false;

    for (int it = 0; it < options_.max_iterations; it++) {
        EMState next;
        try {
            next = iterate(current, catalog, bandwidths, diag);
        } catch (const InversionError& e) {
            state_ = InversionState::Failed;
            diag.iterations = current.iteration;
            std::cerr << "ETASInversion: failed at iteration " << current.iteration
                      << ": " << e.what() << std::endl;
            throw InversionError(e.what(), current.parameters, current.iteration);
        }

        diag.log_likelihood.push_back(next.log_likelihood);
        if (next.log_likelihood > best_ll) {
            best_ll = next.log_likelihood;
            best = current;
        }

        if (diag.log_likelihood.size() > 1) {
            double prev = diag.log_likelihood[diag.log_likelihood.size() - 2];
            double rel = std::abs(next.log_likelihood - prev) / std::max(std::abs(prev), 1e-12);
            double dp = maxRelativeChange(current.parameters, next.parameters, options_.kernels);
            if (rel < options_.tolerance && dp < options_.parameter_tolerance) {
                current = next;
                converged = true;
                break;
            }
        }
        current = next;
    }

    diag.iterations = current.iteration;

    const EMState& final_state = converged ? current : best;
    if (converged) {
        state_ = InversionState::Converged;
    } else {
        state_ = InversionState::MaxIterationsReached;
        result.message = "maximum iterations reached";
        warn(diag, "no convergence after " + std::to_string(options_.max_iterations) +
             " iterations, returning best parameters", current.iteration);
    }

    // Final E-step for the reported background probabilities
    auto probs = computeTriggeringProbabilities(catalog, final_state.parameters,
                                                *final_state.field);
    double ll = completeLogLikelihood(catalog, final_state.parameters, probs,
                                      detectionWeights(catalog, probs, diag.beta));
    if (!std::isfinite(ll)) {
        state_ = InversionState::Failed;
        throw InversionError("Non-finite final log-likelihood",
                             final_state.parameters, current.iteration);
    }
    diag.log_likelihood.push_back(ll);

    for (size_t r = 0; r < probs.rows(); r++) {
        result.background_probability[probs.targets[r]] = probs.background[r];
    }

    result.parameters = final_state.parameters;
    result.background = final_state.field;
    diag.expected_background = probs.expectedBackgroundCount();
    diag.branching_ratio = branchingRatio(final_state.parameters, diag.beta);
    if (!(diag.branching_ratio < 1.0)) {
        warn(diag, "branching ratio " + std::to_string(diag.branching_ratio) +
             " is not sub-critical", current.iteration);
    }

    finish();
    std::cout << "ETASInversion: " << inversionStateToString(state_)
              << " after " << diag.iterations << " iterations, logL="
              << std::setprecision(10) << ll << std::endl;
    if (options_.verbose) std::cout << result.summary();

    return result;
}

} // namespace openetas
