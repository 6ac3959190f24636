#include "openetas/kernel/special_functions.hpp"
#include <unsupported/Eigen/SpecialFunctions>
#include <cmath>
#include <limits>

namespace openetas {
namespace special {

double expintE1(double x) {
    if (x <= 0) return std::numeric_limits<double>::infinity();

    constexpr double EULER = 0.5772156649015329;
    constexpr double EPS = 1e-15;
    constexpr int MAX_ITER = 500;

    if (x < 1.0) {
        // Power series
        double sum = 0;
        double term = 1;
        for (int k = 1; k <= MAX_ITER; k++) {
            term *= -x / k;
            double add = -term / k;
            sum += add;
            if (std::abs(add) < EPS * std::abs(sum)) break;
        }
        return -EULER - std::log(x) + sum;
    }

    // Continued fraction (modified Lentz)
    double b = x + 1.0;
    double c = 1.0 / std::numeric_limits<double>::min();
    double d = 1.0 / b;
    double h = d;
    for (int i = 1; i <= MAX_ITER; i++) {
        double an = -static_cast<double>(i) * i;
        b += 2.0;
        d = 1.0 / (an * d + b);
        c = b + an / c;
        double del = c * d;
        h *= del;
        if (std::abs(del - 1.0) < EPS) break;
    }
    return h * std::exp(-x);
}

double upperGammaExt(double a, double x) {
    if (x <= 0) {
        return a > 0 ? std::tgamma(a) : std::numeric_limits<double>::infinity();
    }

    if (a > 0) {
        return Eigen::numext::igammac(a, x) * std::tgamma(a);
    }
    if (a == 0) {
        return expintE1(x);
    }

    // Lift to a + 1 (recursion depth is ceil(-a))
    return (upperGammaExt(a + 1.0, x) - std::pow(x, a) * std::exp(-x)) / a;
}

} // namespace special
} // namespace openetas
