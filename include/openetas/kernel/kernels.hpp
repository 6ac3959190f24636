#pragma once

#include "parameters.hpp"
#include "../core/types.hpp"
#include "../core/region.hpp"
#include <random>
#include <limits>

namespace openetas {

using Rng = std::mt19937_64;

/**
 * Raw Omori-Utsu decay (t + c)^-p
 *
 * Zero for t < 0. c is floored at MIN_OMORI_C so that t = 0 stays finite
 * even when c = 0.
 */
double omoriDecay(double dt, double c, double p);

/**
 * TriggeringKernel - ETAS triggering functions for one parameter set
 *
 * Productivity (expected number of direct offspring):
 *   kappa(m) = k0 * 10^(alpha (m - m_ref))
 *
 * Temporal density g(t), normalized over t >= 0:
 *   OmoriUtsu:     (p - 1) c^(p-1) (t + c)^-p
 *   TaperedOmori:  exp(-t/tau) (t + c)^-p / Z,
 *                  Z = tau^(1-p) e^(c/tau) Gamma(1 - p, c/tau)
 *
 * Spatial density f(r | m), normalized over the plane, with
 *   D_m = d * exp(gamma (m - m_ref)):
 *   PowerLaw:  (q - 1) / (pi D_m) * (1 + r^2 / D_m)^-q
 *   Gaussian:  exp(-r^2 / (2 D_m)) / (2 pi D_m)
 *
 * The kernel is immutable; build a new one for new parameters.
 */
class TriggeringKernel {
public:
    TriggeringKernel(const Parameters& params, const KernelConfig& config, double m_ref);

    const Parameters& parameters() const { return params_; }
    const KernelConfig& config() const { return config_; }
    double referenceMagnitude() const { return m_ref_; }

    // Productivity
    double productivity(double m) const;
    double logProductivity(double m) const;

    // Temporal kernel
    double temporalDensity(double dt) const;
    double logTemporalDensity(double dt) const;
    double temporalCdf(double dt) const;
    double temporalIntegral(double from, double to) const {
        return temporalCdf(to) - temporalCdf(from);
    }

    // Spatial kernel
    double spatialScale(double m) const;
    double spatialDensity(double r2, double m) const;
    double logSpatialDensity(double r2, double m) const;
    double spatialRadialCdf(double r, double m) const;

    // Fraction of the spatial kernel centred at (x0, y0) that lies inside
    // the polygon. Radial integration along subdivided boundary edges.
    double spatialFractionInside(double x0, double y0, double m,
                                 const Region& region, int ndiv = 8) const;

    // kappa(m) g(dt) f(r2 | m)
    double triggeringDensity(double dt, double r2, double m) const;

    // Sampling
    double sampleTimeOffset(Rng& rng) const;
    double sampleRadius(double m, Rng& rng) const;

private:
    Parameters params_;
    KernelConfig config_;
    double m_ref_;

    double log_temporal_norm_;   // log of the temporal normalisation
    double c_eff_;

    double taperedSurvival(double dt) const;
};

/**
 * GutenbergRichter - Exponential magnitude distribution above m_ref
 *
 * Optionally truncated at m_max.
 */
class GutenbergRichter {
public:
    GutenbergRichter(double beta, double m_ref,
                     double m_max = std::numeric_limits<double>::infinity());

    static GutenbergRichter fromBValue(double b, double m_ref,
                                       double m_max = std::numeric_limits<double>::infinity()) {
        return GutenbergRichter(b * constants::LN10, m_ref, m_max);
    }

    double beta() const { return beta_; }
    double bValue() const { return beta_ / constants::LN10; }
    double referenceMagnitude() const { return m_ref_; }
    double maxMagnitude() const { return m_max_; }

    double density(double m) const;
    double logDensity(double m) const;
    double cdf(double m) const;
    double sample(Rng& rng) const;

    // Probability that one event is at least m
    double exceedance(double m) const { return 1.0 - cdf(m); }

private:
    double beta_;
    double m_ref_;
    double m_max_;
    double trunc_mass_;     // CDF mass below m_max
};

/**
 * Mean number of direct offspring per event, averaged over the magnitude
 * distribution. The process is sub-critical when this is below 1.
 * Returns infinity when the integral diverges (beta <= alpha ln 10 with
 * no upper magnitude truncation).
 */
double branchingRatio(const Parameters& params, double beta,
                      double m_ref = 0.0,
                      double m_max = std::numeric_limits<double>::infinity());

} // namespace openetas
