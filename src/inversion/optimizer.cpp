#include "openetas/inversion/optimizer.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <iomanip>
#include <limits>

namespace openetas {

namespace {

constexpr double MIN_STEP = 1.0e-16;
constexpr double MIN_CURVATURE = 1.0e-17;
constexpr int MAX_EXPANSIONS = 60;

} // anonymous namespace

DFPOptimizer::DFPOptimizer(const OptimizerOptions& options)
    : options_(options)
    , bounded_(false)
    , evaluations_(0)
{
}

void DFPOptimizer::setBounds(const Eigen::VectorXd& lower, const Eigen::VectorXd& upper) {
    lower_ = lower;
    upper_ = upper;
    bounded_ = true;
}

void DFPOptimizer::clearBounds() {
    lower_.resize(0);
    upper_.resize(0);
    bounded_ = false;
}

Eigen::VectorXd DFPOptimizer::project(const Eigen::VectorXd& x) const {
    if (!bounded_ || lower_.size() != x.size()) return x;
    return x.cwiseMax(lower_).cwiseMin(upper_);
}

double DFPOptimizer::evaluate(const Objective& f, const Eigen::VectorXd& x) {
    evaluations_++;
    double v = f(project(x));
    if (!std::isfinite(v)) return std::numeric_limits<double>::max();
    return v;
}

Eigen::VectorXd DFPOptimizer::gradient(const Objective& f, const Eigen::VectorXd& x) {
    const int n = static_cast<int>(x.size());
    Eigen::VectorXd g(n);

    for (int i = 0; i < n; i++) {
        double h = options_.gradient_step * std::max(1.0, std::abs(x[i]));
        Eigen::VectorXd xp = x;
        Eigen::VectorXd xm = x;
        xp[i] += h;
        xm[i] -= h;

        // One-sided at an active bound
        if (bounded_ && xp[i] > upper_[i]) xp[i] = x[i];
        if (bounded_ && xm[i] < lower_[i]) xm[i] = x[i];

        double span = xp[i] - xm[i];
        if (span <= 0) {
            g[i] = 0;
            continue;
        }
        g[i] = (evaluate(f, xp) - evaluate(f, xm)) / span;
    }
    return g;
}

double DFPOptimizer::lineSearch(const Objective& f, const Eigen::VectorXd& x,
                                const Eigen::VectorXd& h, double& fv, double ram) {
    if (ram <= 1.0e-30) ram = 0.1;

    double hnorm = h.norm();
    if (hnorm > 1) ram /= hnorm;

    double ram1 = 0, ram2 = ram, ram3;
    double fv1 = fv, fv2, fv3;

    fv2 = evaluate(f, x + ram2 * h);

    if (fv2 > fv1) {
        // Shrink until the step improves
        do {
            ram3 = ram2;
            fv3 = fv2;
            ram2 = ram3 * 0.1;
            if (ram2 * hnorm < MIN_STEP) {
                return 0.0;
            }
            fv2 = evaluate(f, x + ram2 * h);
        } while (fv2 > fv1);
    } else {
        // Expand until the objective rises again
        int expansions = 0;
        for (;;) {
            ram3 = ram2 * 2.0;
            fv3 = evaluate(f, x + ram3 * h);
            if (fv3 > fv2) break;
            ram1 = ram2;
            ram2 = ram3;
            fv1 = fv2;
            fv2 = fv3;
            if (++expansions >= MAX_EXPANSIONS) {
                fv = fv2;
                return ram2;
            }
        }
    }

    // Two rounds of quadratic interpolation on the bracket
    for (int round = 0; round < 2; round++) {
        double a1 = (ram3 - ram2) * fv1;
        double a2 = (ram1 - ram3) * fv2;
        double a3 = (ram2 - ram1) * fv3;
        double b2 = (a1 + a2 + a3) * 2.0;
        double b1 = a1 * (ram3 + ram2) + a2 * (ram1 + ram3) + a3 * (ram2 + ram1);

        if (b2 == 0) {
            fv = fv2;
            return ram2;
        }

        double r = b1 / b2;
        if (!std::isfinite(r) || r <= 0) {
            fv = fv2;
            return ram2;
        }

        double fr = evaluate(f, x + r * h);

        if (round == 1) {
            if (fv2 < fr) {
                fv = fv2;
                return ram2;
            }
            fv = fr;
            return r;
        }

        if (r > ram2) {
            if (fr <= fv2) {
                ram1 = ram2; fv1 = fv2;
                ram2 = r;    fv2 = fr;
            } else {
                ram3 = r;    fv3 = fr;
            }
        } else {
            if (fr >= fv2) {
                ram1 = r;    fv1 = fr;
            } else {
                ram3 = ram2; fv3 = fv2;
                ram2 = r;    fv2 = fr;
            }
        }
    }

    fv = fv2;
    return ram2;
}

OptimizerResult DFPOptimizer::minimize(const Objective& f, const Eigen::VectorXd& x0) {
    OptimizerResult result;
    evaluations_ = 0;

    const int n = static_cast<int>(x0.size());
    const double tol = options_.tolerance;

    Eigen::VectorXd x = project(x0);
    double fv = evaluate(f, x);
    Eigen::VectorXd g = gradient(f, x);

    Eigen::MatrixXd H = Eigen::MatrixXd::Identity(n, n);
    Eigen::VectorXd dx = Eigen::VectorXd::Zero(n);
    Eigen::VectorXd g0 = Eigen::VectorXd::Zero(n);
    double ramda = 0.05;

    if (options_.verbose) {
        std::cout << "DFPOptimizer: start f=" << std::setprecision(10) << fv << std::endl;
    }

    int iter = 0;
    for (; iter < options_.max_iterations; iter++) {
        if (iter > 0) {
            Eigen::VectorXd dg = g - g0;
            Eigen::VectorXd wrk = H * dg;
            double s1 = wrk.dot(dg);
            double s2 = dx.dot(dg);

            if (s1 <= MIN_CURVATURE || s2 <= MIN_CURVATURE) {
                result.converged = true;
                result.message = "curvature vanished";
                break;
            }

            if (s1 <= s2) {
                // Fletcher correction
                H -= (dx * wrk.transpose() + wrk * dx.transpose() -
                      dx * dx.transpose() * (1.0 + s1 / s2)) / s2;
            } else {
                // DFP update
                H += dx * dx.transpose() / s2 - wrk * wrk.transpose() / s1;
            }
        }

        Eigen::VectorXd s = -H * g;
        double s1 = s.dot(g);
        double gnorm = g.norm();

        if (gnorm == 0 || (std::abs(s1) / gnorm <= tol && gnorm <= tol)) {
            result.converged = true;
            result.message = "gradient vanished";
            break;
        }

        // Not a descent direction: restart from steepest descent
        if (s1 >= 0) {
            H.setIdentity();
            s = -g;
        }

        double ed = fv;
        ramda = lineSearch(f, x, s, ed, ramda);
        if (ramda <= 0) {
            result.converged = true;
            result.message = "no descent along search direction";
            break;
        }

        Eigen::VectorXd x_new = project(x + ramda * s);
        dx = x_new - x;
        x = x_new;
        g0 = g;

        double fv0 = fv;
        fv = evaluate(f, x);
        g = gradient(f, x);

        if (options_.verbose) {
            std::cout << "DFPOptimizer: iter " << iter + 1
                      << " f=" << std::setprecision(10) << fv
                      << " |g|=" << g.norm() << " step=" << ramda << std::endl;
        }

        if (std::abs(fv0 - fv) <= tol * std::max(1.0, std::abs(fv)) &&
            dx.norm() <= std::sqrt(tol)) {
            result.converged = true;
            result.message = "objective converged";
            iter++;
            break;
        }
    }

    if (!result.converged) {
        result.message = "maximum iterations reached";
    }

    result.x = x;
    result.value = fv;
    result.iterations = iter;
    result.evaluations = evaluations_;
    return result;
}

} // namespace openetas
