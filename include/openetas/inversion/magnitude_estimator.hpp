#pragma once

#include "../core/event.hpp"
#include <vector>

namespace openetas {

/**
 * MagnitudeStatistics - Gutenberg-Richter fit of a magnitude sample
 */
struct MagnitudeStatistics {
    double beta;            // natural-log slope
    double b_value;         // beta / ln 10
    double b_error;         // Shi & Bolt (1982) standard error
    double mean_magnitude;
    size_t count;

    MagnitudeStatistics() : beta(0), b_value(0), b_error(0), mean_magnitude(0), count(0) {}
};

/**
 * MagnitudeEstimator - Maximum-likelihood b-value
 *
 * Aki-Utsu estimator for continuous magnitudes; for magnitudes binned at
 * delta_m the Tinti-Mulargia form
 *   beta = ln(1 + delta_m / (mean - mc)) / delta_m
 * with mc the centre of the lowest bin.
 */
class MagnitudeEstimator {
public:
    // Throws DataError on fewer than two magnitudes or a degenerate sample
    static MagnitudeStatistics estimate(const std::vector<double>& magnitudes,
                                        double mc, double delta_m = 0.0);

    // Target events of a catalog, each referenced to its own completeness
    static MagnitudeStatistics estimate(const Catalog& catalog);
};

} // namespace openetas
