#pragma once

namespace openetas {
namespace special {

/**
 * Exponential integral E1(x) for x > 0
 */
double expintE1(double x);

/**
 * Upper incomplete gamma function Gamma(a, x) for x > 0
 *
 * Defined for any real a. Positive a uses Eigen's regularized igammac,
 * a = 0 reduces to E1, negative a is lifted by the recurrence
 *   Gamma(a, x) = (Gamma(a + 1, x) - x^a exp(-x)) / a
 */
double upperGammaExt(double a, double x);

} // namespace special
} // namespace openetas
