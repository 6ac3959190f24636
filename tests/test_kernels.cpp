/**
 * Unit tests for kernel functions
 */

#include "test_framework.hpp"
#include "openetas/kernel/parameters.hpp"
#include "openetas/kernel/special_functions.hpp"
#include "openetas/kernel/kernels.hpp"
#include "openetas/core/region.hpp"
#include <algorithm>
#include <vector>

using namespace openetas;
using namespace openetas::test;

namespace {
    const KernelConfig OMORI_POWER(TemporalKernel::OmoriUtsu, SpatialKernel::PowerLaw);
    const KernelConfig OMORI_GAUSS(TemporalKernel::OmoriUtsu, SpatialKernel::Gaussian);
    const KernelConfig TAPERED_POWER(TemporalKernel::TaperedOmori, SpatialKernel::PowerLaw);

    Parameters testParameters() {
        Parameters p;
        p.mu = 1e-4;
        p.k0 = 0.1;
        p.alpha = 0.8;
        p.c = 0.01;
        p.p = 1.2;
        p.tau = 100.0;
        p.d = 1.0;
        p.gamma = 0.5;
        p.q = 1.5;
        return p;
    }

    // Composite Simpson rule on [a, b] with n (even) intervals
    template <typename F>
    double simpson(F f, double a, double b, int n) {
        double h = (b - a) / n;
        double s = f(a) + f(b);
        for (int i = 1; i < n; i++) {
            s += (i % 2 ? 4.0 : 2.0) * f(a + i * h);
        }
        return s * h / 3.0;
    }

    // Integral of the temporal density over [0, T], in u = log(t + c)
    double integrateTemporal(const TriggeringKernel& k, double T) {
        double c = std::max(k.parameters().c, constants::MIN_OMORI_C);
        return simpson([&k, c](double u) {
            double t = std::exp(u) - c;
            return k.temporalDensity(std::max(0.0, t)) * std::exp(u);
        }, std::log(c), std::log(T + c), 20000);
    }

    // Fraction of samples at or below x
    double empiricalCdf(const std::vector<double>& sorted, double x) {
        return static_cast<double>(std::upper_bound(sorted.begin(), sorted.end(), x) -
                                   sorted.begin()) / sorted.size();
    }
}

// ============================================================================
// Parameters Tests
// ============================================================================

TEST(Parameters, NamesRoundTrip) {
    for (int i = 0; i < PARAM_COUNT; i++) {
        Param which = static_cast<Param>(i);
        Param back;
        ASSERT_TRUE(stringToParam(paramName(which), back));
        ASSERT_TRUE(back == which);
    }
    Param unused;
    ASSERT_FALSE(stringToParam("zeta", unused));
}

TEST(Parameters, GetSet) {
    Parameters p;
    p.set(Param::Gamma, 0.75);
    ASSERT_NEAR(p.gamma, 0.75, 1e-15);
    ASSERT_NEAR(p.get(Param::Gamma), 0.75, 1e-15);
}

TEST(Parameters, UsedByKernels) {
    ASSERT_FALSE(Parameters::isUsed(Param::Tau, OMORI_POWER));
    ASSERT_TRUE(Parameters::isUsed(Param::Tau, TAPERED_POWER));
    ASSERT_FALSE(Parameters::isUsed(Param::Q, OMORI_GAUSS));
    ASSERT_TRUE(Parameters::isUsed(Param::Mu, OMORI_GAUSS));
}

TEST(Parameters, Validity) {
    Parameters p = testParameters();
    ASSERT_TRUE(p.isValid(OMORI_POWER));

    std::string reason;
    p.p = 0.9;
    ASSERT_FALSE(p.isValid(OMORI_POWER, &reason));
    ASSERT_FALSE(reason.empty());
    // The taper allows p <= 1
    ASSERT_TRUE(p.isValid(TAPERED_POWER));

    p = testParameters();
    p.q = 1.0;
    ASSERT_FALSE(p.isValid(OMORI_POWER));
    ASSERT_TRUE(p.isValid(OMORI_GAUSS));

    p = testParameters();
    p.mu = std::nan("");
    ASSERT_FALSE(p.isValid(OMORI_POWER));

    // Unused parameters may hold anything
    p = testParameters();
    p.tau = -1.0;
    ASSERT_TRUE(p.isValid(OMORI_POWER));
}

TEST(Parameters, DefaultBounds) {
    ParameterBounds omori = ParameterBounds::defaults(OMORI_POWER);
    ParameterBounds tapered = ParameterBounds::defaults(TAPERED_POWER);
    ASSERT_GT(omori.lowerOf(Param::P), 1.0);
    ASSERT_LT(tapered.lowerOf(Param::P), 1.0);
    ASSERT_GE(omori.lowerOf(Param::C), constants::MIN_OMORI_C);
}

// ============================================================================
// SpecialFunctions Tests
// ============================================================================

TEST(SpecialFunctions, ExponentialIntegral) {
    ASSERT_REL_NEAR(special::expintE1(1.0), 0.21938393439552029, 1e-10);
    ASSERT_REL_NEAR(special::expintE1(0.1), 1.8229239584193906, 1e-10);
    ASSERT_REL_NEAR(special::expintE1(5.0), 0.0011482955912753257, 1e-9);
}

TEST(SpecialFunctions, UpperGammaPositive) {
    // Gamma(1, x) = exp(-x)
    ASSERT_REL_NEAR(special::upperGammaExt(1.0, 2.5), std::exp(-2.5), 1e-10);
    // Gamma(1/2, x) = sqrt(pi) erfc(sqrt(x))
    ASSERT_REL_NEAR(special::upperGammaExt(0.5, 1.0), 0.27880558528066196, 1e-9);
}

TEST(SpecialFunctions, UpperGammaZeroAndNegative) {
    ASSERT_REL_NEAR(special::upperGammaExt(0.0, 1.0), special::expintE1(1.0), 1e-12);
    ASSERT_REL_NEAR(special::upperGammaExt(-0.5, 1.0), 0.17814771178156075, 1e-8);
    ASSERT_GT(special::upperGammaExt(-2.3, 0.01), 0.0);
}

// ============================================================================
// Kernels Tests
// ============================================================================

TEST(Kernels, ProductivityMonotonic) {
    TriggeringKernel k(testParameters(), OMORI_POWER, 3.0);
    ASSERT_NEAR(k.productivity(3.0), 0.1, 1e-12);
    double prev = 0;
    for (double m = 3.0; m <= 8.0; m += 0.25) {
        double kappa = k.productivity(m);
        ASSERT_GT(kappa, prev);
        ASSERT_NEAR(std::log(kappa), k.logProductivity(m), 1e-10);
        prev = kappa;
    }
}

TEST(Kernels, TemporalCausality) {
    TriggeringKernel k(testParameters(), OMORI_POWER, 3.0);
    ASSERT_EQ(k.temporalDensity(-1e-6), 0.0);
    ASSERT_EQ(k.temporalCdf(-5.0), 0.0);
    ASSERT_EQ(k.triggeringDensity(-0.1, 0.0, 5.0), 0.0);
    ASSERT_EQ(omoriDecay(-1.0, 0.01, 1.1), 0.0);
}

TEST(Kernels, TemporalMonotonic) {
    for (const KernelConfig& cfg : {OMORI_POWER, TAPERED_POWER}) {
        TriggeringKernel k(testParameters(), cfg, 3.0);
        double prev = k.temporalDensity(0.0);
        for (double t = 1e-3; t < 1e4; t *= 1.5) {
            double g = k.temporalDensity(t);
            ASSERT_LT(g, prev);
            prev = g;
        }
    }
}

TEST(Kernels, OmoriNormalization) {
    TriggeringKernel k(testParameters(), OMORI_POWER, 3.0);
    for (double T : {0.1, 10.0, 1000.0}) {
        ASSERT_NEAR(integrateTemporal(k, T), k.temporalCdf(T), 1e-6);
    }
    ASSERT_NEAR(k.temporalCdf(std::numeric_limits<double>::infinity()), 1.0, 1e-15);
    ASSERT_NEAR(k.temporalIntegral(1.0, 10.0), k.temporalCdf(10.0) - k.temporalCdf(1.0), 1e-15);
}

TEST(Kernels, TaperedNormalization) {
    Parameters p = testParameters();
    p.p = 0.9;
    p.tau = 50.0;
    TriggeringKernel k(p, TAPERED_POWER, 3.0);
    for (double T : {1.0, 50.0, 500.0}) {
        ASSERT_NEAR(integrateTemporal(k, T), k.temporalCdf(T), 1e-5);
    }
    // Well past the taper the whole mass is in
    ASSERT_NEAR(k.temporalCdf(5000.0), 1.0, 1e-6);
}

TEST(Kernels, FiniteAtZeroOffsetWithZeroC) {
    ASSERT_REL_NEAR(omoriDecay(0.0, 0.0, 1.1), 316227.76601683795, 1e-9);

    Parameters p = testParameters();
    p.c = 0.0;
    TriggeringKernel k(p, OMORI_POWER, 3.0);
    ASSERT_FINITE(k.temporalDensity(0.0));
    ASSERT_FINITE(k.logTemporalDensity(0.0));
    ASSERT_GT(k.temporalDensity(0.0), 0.0);
    ASSERT_FINITE(k.triggeringDensity(0.0, 0.0, 5.0));
    ASSERT_GT(k.temporalCdf(1.0), 0.0);
    ASSERT_LE(k.temporalCdf(1.0), 1.0);
}

TEST(Kernels, SpatialNormalization) {
    for (const KernelConfig& cfg : {OMORI_POWER, OMORI_GAUSS}) {
        TriggeringKernel k(testParameters(), cfg, 3.0);
        const double m = 4.5;
        for (double R : {0.5, 3.0, 20.0}) {
            double integral = simpson([&k, m](double r) {
                return 2.0 * M_PI * r * k.spatialDensity(r * r, m);
            }, 0.0, R, 4000);
            ASSERT_NEAR(integral, k.spatialRadialCdf(R, m), 1e-8);
        }
        ASSERT_NEAR(k.spatialRadialCdf(1e6, m), 1.0, 1e-4);
    }
}

TEST(Kernels, SpatialScaleGrowsWithMagnitude) {
    TriggeringKernel k(testParameters(), OMORI_GAUSS, 3.0);
    ASSERT_NEAR(k.spatialScale(3.0), 1.0, 1e-12);
    ASSERT_NEAR(k.spatialScale(5.0), std::exp(1.0), 1e-12);
    ASSERT_GT(k.spatialRadialCdf(2.0, 3.0), k.spatialRadialCdf(2.0, 6.0));
}

TEST(Kernels, FractionInsideSquare) {
    TriggeringKernel k(testParameters(), OMORI_GAUSS, 3.0);
    Region square = Region::rectangle(-50.0, 50.0, -50.0, 50.0);

    ASSERT_NEAR(k.spatialFractionInside(0.0, 0.0, 3.0, square), 1.0, 1e-6);
    ASSERT_NEAR(k.spatialFractionInside(0.0, -50.0, 3.0, square), 0.5, 1e-6);
    ASSERT_NEAR(k.spatialFractionInside(50.0, 50.0, 3.0, square), 0.25, 1e-6);
    ASSERT_NEAR(k.spatialFractionInside(300.0, 0.0, 3.0, square), 0.0, 1e-6);
}

TEST(Kernels, FractionInsideMatchesRadialMass) {
    // Square much larger than the kernel: the loss is the power-law tail
    TriggeringKernel k(testParameters(), OMORI_POWER, 3.0);
    Region square = Region::rectangle(-20.0, 20.0, -20.0, 20.0);
    double frac = k.spatialFractionInside(0.0, 0.0, 3.0, square, 32);
    ASSERT_LT(frac, 1.0);
    ASSERT_GT(frac, k.spatialRadialCdf(20.0, 3.0));
    ASSERT_LT(frac, k.spatialRadialCdf(20.0 * std::sqrt(2.0), 3.0));
}

TEST(Kernels, FractionInsideOrientationIndependent) {
    TriggeringKernel k(testParameters(), OMORI_POWER, 3.0);
    Region ccw({{0, 0}, {30, 0}, {30, 10}, {0, 10}});
    Region cw({{0, 0}, {0, 10}, {30, 10}, {30, 0}});
    ASSERT_NEAR(k.spatialFractionInside(5.0, 5.0, 4.0, ccw),
                k.spatialFractionInside(5.0, 5.0, 4.0, cw), 1e-12);
}

TEST(Kernels, TimeOffsetSamplesFollowCdf) {
    Parameters tapered = testParameters();
    tapered.p = 0.9;
    tapered.tau = 50.0;
    tapered.c = 0.05;

    std::vector<std::pair<Parameters, KernelConfig>> cases = {
        {testParameters(), OMORI_POWER},
        {tapered, TAPERED_POWER},
    };

    for (const auto& entry : cases) {
        TriggeringKernel k(entry.first, entry.second, 3.0);
        Rng rng(12345);
        std::vector<double> samples(20000);
        for (auto& s : samples) s = k.sampleTimeOffset(rng);
        std::sort(samples.begin(), samples.end());

        ASSERT_GE(samples.front(), 0.0);
        for (double t : {0.01, 0.5, 10.0, 100.0}) {
            ASSERT_NEAR(empiricalCdf(samples, t), k.temporalCdf(t), 0.02);
        }
    }
}

TEST(Kernels, RadiusSamplesFollowCdf) {
    for (const KernelConfig& cfg : {OMORI_POWER, OMORI_GAUSS}) {
        TriggeringKernel k(testParameters(), cfg, 3.0);
        const double m = 5.0;
        Rng rng(777);
        std::vector<double> samples(20000);
        for (auto& s : samples) s = k.sampleRadius(m, rng);
        std::sort(samples.begin(), samples.end());

        for (double r : {0.5, 1.5, 5.0}) {
            ASSERT_NEAR(empiricalCdf(samples, r), k.spatialRadialCdf(r, m), 0.02);
        }
    }
}

TEST(Kernels, GaussianRadiusMeanSquare) {
    TriggeringKernel k(testParameters(), OMORI_GAUSS, 3.0);
    const double m = 4.0;
    Rng rng(99);
    double sum = 0;
    const int n = 40000;
    for (int i = 0; i < n; i++) {
        double r = k.sampleRadius(m, rng);
        sum += r * r;
    }
    ASSERT_REL_NEAR(sum / n, 2.0 * k.spatialScale(m), 0.03);
}

// ============================================================================
// GutenbergRichter Tests
// ============================================================================

TEST(GutenbergRichter, DensityIntegratesToOne) {
    GutenbergRichter gr = GutenbergRichter::fromBValue(1.0, 2.95, 7.0);
    double integral = simpson([&gr](double m) { return gr.density(m); }, 2.95, 7.0, 2000);
    ASSERT_NEAR(integral, 1.0, 1e-8);
    ASSERT_NEAR(gr.cdf(7.0), 1.0, 1e-15);
    ASSERT_EQ(gr.density(2.0), 0.0);
    ASSERT_NEAR(gr.bValue(), 1.0, 1e-12);
}

TEST(GutenbergRichter, Exceedance) {
    GutenbergRichter gr = GutenbergRichter::fromBValue(1.0, 3.0);
    ASSERT_NEAR(gr.exceedance(4.0), 0.1, 1e-12);
    ASSERT_NEAR(gr.exceedance(5.0), 0.01, 1e-12);
    ASSERT_NEAR(gr.logDensity(4.0), std::log(gr.density(4.0)), 1e-12);
}

TEST(GutenbergRichter, SampleMean) {
    GutenbergRichter gr(constants::LN10, 3.0);
    Rng rng(42);
    double sum = 0;
    const int n = 20000;
    for (int i = 0; i < n; i++) sum += gr.sample(rng);
    ASSERT_NEAR(sum / n, 3.0 + 1.0 / constants::LN10, 0.015);
}

TEST(GutenbergRichter, TruncatedSamplesInRange) {
    GutenbergRichter gr(constants::LN10, 3.0, 4.0);
    Rng rng(5);
    for (int i = 0; i < 5000; i++) {
        double m = gr.sample(rng);
        ASSERT_GE(m, 3.0);
        ASSERT_LE(m, 4.0);
    }
}

TEST(GutenbergRichter, BranchingRatio) {
    Parameters p = testParameters();     // k0 0.1, alpha 0.8

    // k0 beta / (beta - alpha ln10) = 0.1 / 0.2
    ASSERT_NEAR(branchingRatio(p, constants::LN10), 0.5, 1e-12);

    p.alpha = 1.0;
    ASSERT_TRUE(std::isinf(branchingRatio(p, constants::LN10)));

    // Truncation makes the integral finite
    double n_trunc = branchingRatio(p, constants::LN10, 0.0, 5.0);
    ASSERT_NEAR(n_trunc, 0.1 * constants::LN10 * 5.0 / (1.0 - 1e-5), 1e-9);
}

TEST(GutenbergRichter, BranchingRatioMatchesProductivityAverage) {
    Parameters p = testParameters();
    const double m_ref = 3.0, m_max = 7.5;
    const double beta = 0.9 * constants::LN10;

    TriggeringKernel k(p, OMORI_POWER, m_ref);
    GutenbergRichter gr(beta, m_ref, m_max);
    double average = simpson([&k, &gr](double m) {
        return k.productivity(m) * gr.density(m);
    }, m_ref, m_max, 4000);

    ASSERT_REL_NEAR(branchingRatio(p, beta, m_ref, m_max), average, 1e-8);
}
