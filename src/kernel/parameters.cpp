#include "openetas/kernel/parameters.hpp"
#include <sstream>
#include <iomanip>
#include <cmath>

namespace openetas {

std::string paramName(Param p) {
    switch (p) {
        case Param::Mu: return "mu";
        case Param::K0: return "k0";
        case Param::Alpha: return "alpha";
        case Param::C: return "c";
        case Param::P: return "p";
        case Param::Tau: return "tau";
        case Param::D: return "d";
        case Param::Gamma: return "gamma";
        case Param::Q: return "q";
    }
    return "?";
}

bool stringToParam(const std::string& s, Param& out) {
    for (int i = 0; i < PARAM_COUNT; i++) {
        Param p = static_cast<Param>(i);
        if (paramName(p) == s) {
            out = p;
            return true;
        }
    }
    return false;
}

double Parameters::get(Param which) const {
    switch (which) {
        case Param::Mu: return mu;
        case Param::K0: return k0;
        case Param::Alpha: return alpha;
        case Param::C: return c;
        case Param::P: return p;
        case Param::Tau: return tau;
        case Param::D: return d;
        case Param::Gamma: return gamma;
        case Param::Q: return q;
    }
    return 0;
}

void Parameters::set(Param which, double value) {
    switch (which) {
        case Param::Mu: mu = value; break;
        case Param::K0: k0 = value; break;
        case Param::Alpha: alpha = value; break;
        case Param::C: c = value; break;
        case Param::P: p = value; break;
        case Param::Tau: tau = value; break;
        case Param::D: d = value; break;
        case Param::Gamma: gamma = value; break;
        case Param::Q: q = value; break;
    }
}

bool Parameters::isUsed(Param which, const KernelConfig& kernels) {
    if (which == Param::Tau) return kernels.temporal == TemporalKernel::TaperedOmori;
    if (which == Param::Q) return kernels.spatial == SpatialKernel::PowerLaw;
    return true;
}

bool Parameters::isValid(const KernelConfig& kernels, std::string* reason) const {
    auto fail = [reason](const std::string& msg) {
        if (reason) *reason = msg;
        return false;
    };

    for (int i = 0; i < PARAM_COUNT; i++) {
        Param which = static_cast<Param>(i);
        if (!isUsed(which, kernels)) continue;
        if (!std::isfinite(get(which))) {
            return fail(paramName(which) + " is not finite");
        }
    }

    if (mu <= 0) return fail("mu must be positive");
    if (k0 <= 0) return fail("k0 must be positive");
    if (alpha < 0) return fail("alpha must be non-negative");
    if (c < 0) return fail("c must be non-negative");
    if (d <= 0) return fail("d must be positive");
    if (gamma < 0) return fail("gamma must be non-negative");

    if (kernels.temporal == TemporalKernel::OmoriUtsu) {
        if (p <= 1) return fail("p must exceed 1 for the Omori-Utsu kernel");
    } else {
        if (p <= 0) return fail("p must be positive");
        if (tau <= 0) return fail("tau must be positive");
    }

    if (kernels.spatial == SpatialKernel::PowerLaw && q <= 1) {
        return fail("q must exceed 1 for the power-law kernel");
    }

    return true;
}

std::string Parameters::toString() const {
    std::ostringstream oss;
    oss << std::setprecision(6);
    oss << "mu=" << mu << " k0=" << k0 << " alpha=" << alpha
        << " c=" << c << " p=" << p << " tau=" << tau
        << " d=" << d << " gamma=" << gamma << " q=" << q;
    return oss.str();
}

ParameterBounds::ParameterBounds() {
    setBounds(Param::Mu, 1e-12, 1e3);
    setBounds(Param::K0, 1e-6, 50.0);
    setBounds(Param::Alpha, 0.0, 5.0);
    setBounds(Param::C, constants::MIN_OMORI_C, 10.0);
    setBounds(Param::P, 1.0 + 1e-4, 5.0);
    setBounds(Param::Tau, 1e-2, 1e6);
    setBounds(Param::D, 1e-4, 1e4);
    setBounds(Param::Gamma, 0.0, 5.0);
    setBounds(Param::Q, 1.0 + 1e-4, 10.0);
}

ParameterBounds ParameterBounds::defaults(const KernelConfig& kernels) {
    ParameterBounds b;
    if (kernels.temporal == TemporalKernel::TaperedOmori) {
        // Taper keeps the time integral finite for p <= 1
        b.setBounds(Param::P, 1e-3, 5.0);
    }
    return b;
}

} // namespace openetas
