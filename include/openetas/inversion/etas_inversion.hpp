#pragma once

#include "../core/types.hpp"
#include "../core/event.hpp"
#include "../core/errors.hpp"
#include "../kernel/parameters.hpp"
#include "../kernel/kernels.hpp"
#include "../background/background_field.hpp"
#include "optimizer.hpp"
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace openetas {

/**
 * InversionState - Lifecycle of one inversion run
 */
enum class InversionState {
    Initializing,
    Iterating,
    Converged,
    MaxIterationsReached,
    Failed
};

std::string inversionStateToString(InversionState state);

/**
 * InversionOptions - Settings of the EM inversion
 */
struct InversionOptions {
    KernelConfig kernels;

    // Starting values; parameters not listed start from catalog heuristics
    std::map<Param, double> initial_values;

    // Parameters held at their starting value
    std::set<Param> fixed;

    int max_iterations = 100;
    double tolerance = 1e-5;            // relative log-likelihood change
    double parameter_tolerance = 1e-3;  // max relative parameter change
    double lookback_days = 3652.5;      // sources older than this are ignored

    // Gutenberg-Richter b-value; 0 = estimate from target magnitudes
    double b_value = 0.0;

    BackgroundOptions background;
    OptimizerOptions optimizer;

    int n_threads = 0;                  // 0 = hardware concurrency
    bool verbose = false;
};

/**
 * TriggeringLink - Probability that a target was triggered by a source
 */
struct TriggeringLink {
    size_t source;          // catalog index
    double probability;
};

/**
 * TriggeringProbabilityMatrix - Result of one E-step
 *
 * One row per target event. For every row, background probability plus
 * the sum of its link probabilities equals 1.
 */
struct TriggeringProbabilityMatrix {
    std::vector<size_t> targets;                        // catalog index per row
    std::vector<double> background;                     // P(background_j)
    std::vector<std::vector<TriggeringLink>> triggers;  // P(j triggered by i)
    std::vector<double> log_intensity;                  // log lambda(x_j) per row
    double sum_log_intensity = 0;                       // sum_j log lambda(x_j)
    size_t floored_events = 0;                          // nu hit its floor at x_j

    size_t rows() const { return targets.size(); }
    size_t linkCount() const;
    double rowSum(size_t row) const;

    // Expected number of background / triggered targets
    double expectedBackgroundCount() const;
    double expectedTriggeredCount() const;
};

/**
 * EMState - Snapshot handed from one EM iteration to the next
 */
struct EMState {
    int iteration = 0;
    Parameters parameters;
    BackgroundFieldPtr field;
    std::vector<double> background_probability;   // per catalog event
    double log_likelihood = 0;
};

/**
 * InversionDiagnostics - Bookkeeping of one inversion run
 */
struct InversionDiagnostics {
    int iterations = 0;
    std::vector<double> log_likelihood;     // one entry per E-step
    size_t n_targets = 0;
    size_t n_sources = 0;
    double beta = 0;
    double b_value = 0;
    double branching_ratio = 0;
    double expected_background = 0;
    int optimizer_evaluations = 0;
    double elapsed_seconds = 0;
    std::vector<NumericalWarning> warnings;
};

/**
 * InversionResult - Parameters, background field and diagnostics
 */
struct InversionResult {
    InversionState state = InversionState::Initializing;
    Parameters parameters;
    KernelConfig kernels;
    BackgroundFieldPtr background;
    std::shared_ptr<const Catalog> catalog;

    // Background probability per catalog event (0 for non-targets)
    std::vector<double> background_probability;

    InversionDiagnostics diagnostics;
    std::string message;

    bool succeeded() const {
        return state == InversionState::Converged ||
               state == InversionState::MaxIterationsReached;
    }

    // Target events whose background probability is at least threshold
    Catalog declusteredCatalog(double threshold = 0.5) const;

    std::string summary() const;
};

/**
 * ETASInversion - Expectation-maximisation estimate of ETAS parameters
 *
 * E-step: triggering probabilities from the current parameters and
 * background field. M-step: closed-form background rate, quasi-Newton
 * maximisation of the expected complete-data log-likelihood for the
 * triggering parameters, and a re-weighted background field.
 */
class ETASInversion {
public:
    explicit ETASInversion(const InversionOptions& options = InversionOptions());

    // Full run. An empty target set yields state Failed without throwing;
    // a non-finite or out-of-domain update throws InversionError.
    InversionResult run(const Catalog& catalog);

    // Single E-step for fixed parameters and field
    TriggeringProbabilityMatrix computeTriggeringProbabilities(
        const Catalog& catalog, const Parameters& params,
        const BackgroundField& field) const;

    // log L = sum_j w_j log lambda_j - mu * area * T - sum_i kappa_i G_i F_i
    // with w_j = exp(beta (mc_j - mc)) for targets above a raised local
    // completeness, 1 otherwise (and for beta = 0)
    double logLikelihood(const Catalog& catalog, const Parameters& params,
                         const BackgroundField& field, double beta = 0.0) const;

    // Inverse detection probability of each row's target relative to the
    // catalog mc
    static std::vector<double> detectionWeights(const Catalog& catalog,
                                                const TriggeringProbabilityMatrix& probs,
                                                double beta);

    // Starting parameters from options and catalog heuristics
    Parameters initialParameters(const Catalog& catalog, double b_value) const;

    InversionState state() const { return state_; }
    const InversionOptions& options() const { return options_; }

private:
    InversionOptions options_;
    InversionState state_;

    EMState iterate(const EMState& current, const Catalog& catalog,
                    const std::vector<double>& bandwidths,
                    InversionDiagnostics& diag);

    Parameters maximize(const Parameters& start, const Catalog& catalog,
                        const TriggeringProbabilityMatrix& probs,
                        const std::vector<double>& weights,
                        InversionDiagnostics& diag) const;

    double completeLogLikelihood(const Catalog& catalog, const Parameters& params,
                                 const TriggeringProbabilityMatrix& probs,
                                 const std::vector<double>& weights) const;

    // sum_i kappa(m_i) G_i F_i over all complete sources
    double expectedTriggeredTotal(const Catalog& catalog,
                                  const TriggeringKernel& kernel) const;

    void warn(InversionDiagnostics& diag, const std::string& message, int iteration) const;
};

} // namespace openetas
