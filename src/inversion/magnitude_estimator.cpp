#include "openetas/inversion/magnitude_estimator.hpp"
#include "openetas/core/errors.hpp"
#include <cmath>
#include <numeric>

namespace openetas {

MagnitudeStatistics MagnitudeEstimator::estimate(const std::vector<double>& magnitudes,
                                                 double mc, double delta_m) {
    const size_t n = magnitudes.size();
    if (n < 2) {
        throw DataError("MagnitudeEstimator: need at least two magnitudes");
    }

    double mean = std::accumulate(magnitudes.begin(), magnitudes.end(), 0.0) / n;

    // Continuous magnitudes are referenced to mc itself
    double excess = mean - mc;
    if (!(excess > 0)) {
        throw DataError("MagnitudeEstimator: mean magnitude does not exceed mc");
    }

    MagnitudeStatistics stats;
    stats.count = n;
    stats.mean_magnitude = mean;
    stats.beta = (delta_m > 0) ? std::log(1.0 + delta_m / excess) / delta_m
                               : 1.0 / excess;
    stats.b_value = stats.beta / constants::LN10;

    double ss = 0;
    for (double m : magnitudes) ss += (m - mean) * (m - mean);
    stats.b_error = constants::LN10 * stats.b_value * stats.b_value *
                    std::sqrt(ss / (static_cast<double>(n) * (n - 1)));
    return stats;
}

MagnitudeStatistics MagnitudeEstimator::estimate(const Catalog& catalog) {
    // Shifted onto the catalog mc: the excess above the local completeness
    // follows the same exponential law
    std::vector<double> mags;
    for (size_t i = 0; i < catalog.size(); i++) {
        if (!catalog.isTarget(i)) continue;
        mags.push_back(catalog[i].magnitude - (catalog.completeness(i) - catalog.mc()));
    }
    return estimate(mags, catalog.mc(), catalog.deltaM());
}

} // namespace openetas
