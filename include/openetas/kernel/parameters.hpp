#pragma once

#include "../core/types.hpp"
#include <array>
#include <string>

namespace openetas {

// Index of each ETAS parameter
enum class Param {
    Mu,     // background rate (events / km^2 / day)
    K0,     // productivity scale
    Alpha,  // productivity magnitude exponent (base 10)
    C,      // Omori-Utsu offset (days)
    P,      // Omori-Utsu exponent
    Tau,    // taper time (days), TaperedOmori only
    D,      // spatial scale at mc (km^2)
    Gamma,  // spatial magnitude scaling
    Q       // spatial power-law exponent, PowerLaw only
};

constexpr int PARAM_COUNT = 9;

std::string paramName(Param p);
bool stringToParam(const std::string& s, Param& out);

/**
 * Parameters - ETAS model parameter set
 *
 * Produced once per inversion run and read-only afterwards.
 */
struct Parameters {
    double mu;
    double k0;
    double alpha;
    double c;
    double p;
    double tau;
    double d;
    double gamma;
    double q;

    Parameters()
        : mu(1e-4), k0(0.2), alpha(0.8), c(0.01), p(1.2),
          tau(1000.0), d(1.0), gamma(0.5), q(1.5) {}

    double get(Param which) const;
    void set(Param which, double value);

    // Whether the parameter takes part in the given kernel configuration
    static bool isUsed(Param which, const KernelConfig& kernels);

    // Finite and inside the model domain
    bool isValid(const KernelConfig& kernels, std::string* reason = nullptr) const;

    std::string toString() const;
};

/**
 * ParameterBounds - Box constraints used by the M-step optimizer
 */
struct ParameterBounds {
    std::array<double, PARAM_COUNT> lower;
    std::array<double, PARAM_COUNT> upper;

    ParameterBounds();

    double lowerOf(Param p) const { return lower[static_cast<int>(p)]; }
    double upperOf(Param p) const { return upper[static_cast<int>(p)]; }
    void setBounds(Param p, double lo, double hi) {
        lower[static_cast<int>(p)] = lo;
        upper[static_cast<int>(p)] = hi;
    }

    // Domain constraints tied to the kernel choice (p > 1 for pure Omori)
    static ParameterBounds defaults(const KernelConfig& kernels);
};

} // namespace openetas
