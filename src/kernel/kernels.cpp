#include "openetas/kernel/kernels.hpp"
#include "openetas/kernel/special_functions.hpp"
#include <algorithm>
#include <cmath>

namespace openetas {

double omoriDecay(double dt, double c, double p) {
    if (dt < 0) return 0.0;
    double c_eff = std::max(c, constants::MIN_OMORI_C);
    return std::pow(dt + c_eff, -p);
}

TriggeringKernel::TriggeringKernel(const Parameters& params, const KernelConfig& config,
                                   double m_ref)
    : params_(params)
    , config_(config)
    , m_ref_(m_ref)
    , log_temporal_norm_(0)
    , c_eff_(std::max(params.c, constants::MIN_OMORI_C))
{
    const double p = params_.p;

    if (config_.temporal == TemporalKernel::OmoriUtsu) {
        // (p - 1) c^(p - 1)
        log_temporal_norm_ = std::log(p - 1.0) + (p - 1.0) * std::log(c_eff_);
    } else {
        const double tau = params_.tau;
        double z = std::pow(tau, 1.0 - p) * std::exp(c_eff_ / tau) *
                   special::upperGammaExt(1.0 - p, c_eff_ / tau);
        log_temporal_norm_ = -std::log(z);
    }
}

// ============================================================================
// Productivity
// ============================================================================

double TriggeringKernel::productivity(double m) const {
    return params_.k0 * std::pow(10.0, params_.alpha * (m - m_ref_));
}

double TriggeringKernel::logProductivity(double m) const {
    return std::log(params_.k0) + params_.alpha * (m - m_ref_) * constants::LN10;
}

// ============================================================================
// Temporal kernel
// ============================================================================

double TriggeringKernel::temporalDensity(double dt) const {
    if (dt < 0) return 0.0;
    return std::exp(logTemporalDensity(dt));
}

double TriggeringKernel::logTemporalDensity(double dt) const {
    if (dt < 0) return -std::numeric_limits<double>::infinity();
    double lg = log_temporal_norm_ - params_.p * std::log(dt + c_eff_);
    if (config_.temporal == TemporalKernel::TaperedOmori) {
        lg -= dt / params_.tau;
    }
    return lg;
}

double TriggeringKernel::taperedSurvival(double dt) const {
    const double a = 1.0 - params_.p;
    const double tau = params_.tau;
    double num = special::upperGammaExt(a, (dt + c_eff_) / tau);
    double den = special::upperGammaExt(a, c_eff_ / tau);
    if (!(den > 0)) return 0.0;
    return std::min(1.0, std::max(0.0, num / den));
}

double TriggeringKernel::temporalCdf(double dt) const {
    if (dt <= 0) return 0.0;
    if (!std::isfinite(dt)) return 1.0;

    if (config_.temporal == TemporalKernel::OmoriUtsu) {
        return 1.0 - std::pow(c_eff_ / (dt + c_eff_), params_.p - 1.0);
    }
    return 1.0 - taperedSurvival(dt);
}

// ============================================================================
// Spatial kernel
// ============================================================================

double TriggeringKernel::spatialScale(double m) const {
    return params_.d * std::exp(params_.gamma * (m - m_ref_));
}

double TriggeringKernel::spatialDensity(double r2, double m) const {
    return std::exp(logSpatialDensity(r2, m));
}

double TriggeringKernel::logSpatialDensity(double r2, double m) const {
    double dm = spatialScale(m);
    if (config_.spatial == SpatialKernel::PowerLaw) {
        const double q = params_.q;
        return std::log(q - 1.0) - std::log(M_PI * dm) - q * std::log1p(r2 / dm);
    }
    return -r2 / (2.0 * dm) - std::log(2.0 * M_PI * dm);
}

double TriggeringKernel::spatialRadialCdf(double r, double m) const {
    if (r <= 0) return 0.0;
    double dm = spatialScale(m);
    double r2 = r * r;
    if (config_.spatial == SpatialKernel::PowerLaw) {
        return 1.0 - std::pow(1.0 + r2 / dm, 1.0 - params_.q);
    }
    return 1.0 - std::exp(-r2 / (2.0 * dm));
}

double TriggeringKernel::spatialFractionInside(double x0, double y0, double m,
                                               const Region& region, int ndiv) const {
    const auto& v = region.vertices();
    const size_t n = v.size();
    if (n < 3) return 0.0;

    double sum = 0;
    double orientation = 0;

    for (size_t k = 0; k < n; k++) {
        const Point2D& pa = v[k];
        const Point2D& pb = v[(k + 1) % n];
        orientation += pa.x * pb.y - pb.x * pa.y;

        double dpx = (pb.x - pa.x) / ndiv;
        double dpy = (pb.y - pa.y) / ndiv;

        for (int l = 0; l < ndiv; l++) {
            double x1 = pa.x + dpx * l;
            double y1 = pa.y + dpy * l;
            double x2 = pa.x + dpx * (l + 1);
            double y2 = pa.y + dpy * (l + 1);

            double det = (x1 - x0) * (y2 - y0) - (x2 - x0) * (y1 - y0);
            if (std::abs(det) < 1.0e-10) continue;

            double r1 = std::hypot(x1 - x0, y1 - y0);
            double r2 = std::hypot(x2 - x0, y2 - y0);
            if (r1 + r2 <= 1.0e-20) continue;

            double seg2 = (x2 - x1) * (x2 - x1) + (y2 - y1) * (y2 - y1);
            double cos_phi = (r1 * r1 + r2 * r2 - seg2) / (2 * r1 * r2);
            cos_phi = std::max(-1.0, std::min(1.0, cos_phi));
            double phi = std::acos(cos_phi);

            // Point on the segment split in ratio r1 : r2
            double w = r1 / (r1 + r2);
            double r0 = std::hypot(x1 + w * (x2 - x1) - x0, y1 + w * (y2 - y1) - y0);

            double simpson = spatialRadialCdf(r1, m) / 6.0 +
                             spatialRadialCdf(r0, m) * 2.0 / 3.0 +
                             spatialRadialCdf(r2, m) / 6.0;
            sum += (det > 0 ? 1.0 : -1.0) * simpson * phi;
        }
    }

    double frac = sum / (2.0 * M_PI);
    if (orientation < 0) frac = -frac;
    return std::max(0.0, std::min(1.0, frac));
}

double TriggeringKernel::triggeringDensity(double dt, double r2, double m) const {
    if (dt < 0) return 0.0;
    return productivity(m) * temporalDensity(dt) * spatialDensity(r2, m);
}

// ============================================================================
// Sampling
// ============================================================================

double TriggeringKernel::sampleTimeOffset(Rng& rng) const {
    std::uniform_real_distribution<double> uni(0.0, 1.0);
    double u = uni(rng);

    if (config_.temporal == TemporalKernel::OmoriUtsu) {
        return c_eff_ * (std::pow(1.0 - u, -1.0 / (params_.p - 1.0)) - 1.0);
    }

    // Invert the tapered CDF by bisection on log(t + c)
    double lo = std::log(c_eff_);
    double hi = std::log(c_eff_ + params_.tau);
    while (temporalCdf(std::exp(hi) - c_eff_) < u && hi < 60.0) {
        hi += 1.0;
    }
    for (int i = 0; i < 80; i++) {
        double mid = 0.5 * (lo + hi);
        if (temporalCdf(std::exp(mid) - c_eff_) < u) lo = mid;
        else hi = mid;
    }
    return std::max(0.0, std::exp(0.5 * (lo + hi)) - c_eff_);
}

double TriggeringKernel::sampleRadius(double m, Rng& rng) const {
    std::uniform_real_distribution<double> uni(0.0, 1.0);
    double u = uni(rng);
    double dm = spatialScale(m);

    if (config_.spatial == SpatialKernel::PowerLaw) {
        return std::sqrt(dm * (std::pow(1.0 - u, -1.0 / (params_.q - 1.0)) - 1.0));
    }
    return std::sqrt(-2.0 * dm * std::log(1.0 - u));
}

// ============================================================================
// GutenbergRichter
// ============================================================================

GutenbergRichter::GutenbergRichter(double beta, double m_ref, double m_max)
    : beta_(beta)
    , m_ref_(m_ref)
    , m_max_(m_max)
    , trunc_mass_(1.0)
{
    if (std::isfinite(m_max_) && m_max_ > m_ref_) {
        trunc_mass_ = 1.0 - std::exp(-beta_ * (m_max_ - m_ref_));
    }
}

double GutenbergRichter::density(double m) const {
    if (m < m_ref_ || m > m_max_) return 0.0;
    return beta_ * std::exp(-beta_ * (m - m_ref_)) / trunc_mass_;
}

double GutenbergRichter::logDensity(double m) const {
    if (m < m_ref_ || m > m_max_) return -std::numeric_limits<double>::infinity();
    return std::log(beta_) - beta_ * (m - m_ref_) - std::log(trunc_mass_);
}

double GutenbergRichter::cdf(double m) const {
    if (m <= m_ref_) return 0.0;
    if (m >= m_max_) return 1.0;
    return (1.0 - std::exp(-beta_ * (m - m_ref_))) / trunc_mass_;
}

double GutenbergRichter::sample(Rng& rng) const {
    std::uniform_real_distribution<double> uni(0.0, 1.0);
    double u = uni(rng);
    return m_ref_ - std::log(1.0 - u * trunc_mass_) / beta_;
}

double branchingRatio(const Parameters& params, double beta, double m_ref, double m_max) {
    const double a = params.alpha * constants::LN10;

    if (!std::isfinite(m_max)) {
        if (beta <= a) return std::numeric_limits<double>::infinity();
        return params.k0 * beta / (beta - a);
    }

    double span = m_max - m_ref;
    if (span <= 0) return params.k0;
    double norm = 1.0 - std::exp(-beta * span);
    double diff = beta - a;
    double integral = (std::abs(diff) < 1e-12) ? span
                      : (1.0 - std::exp(-diff * span)) / diff;
    return params.k0 * beta * integral / norm;
}

} // namespace openetas
