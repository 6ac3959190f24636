#pragma once

#include <Eigen/Dense>
#include <functional>
#include <string>

namespace openetas {

/**
 * OptimizerOptions - Settings for the quasi-Newton minimiser
 */
struct OptimizerOptions {
    int max_iterations = 200;       // line searches
    double tolerance = 1e-6;        // relative change in objective
    double gradient_step = 1e-6;    // relative finite-difference step
    bool verbose = false;
};

/**
 * OptimizerResult - Outcome of one minimisation
 */
struct OptimizerResult {
    Eigen::VectorXd x;
    double value;
    int iterations;
    int evaluations;
    bool converged;
    std::string message;

    OptimizerResult() : value(0), iterations(0), evaluations(0), converged(false) {}
};

/**
 * DFPOptimizer - Davidon-Fletcher-Powell quasi-Newton minimiser
 *
 * Inverse-Hessian updates with the Fletcher correction when the DFP
 * update would lose positive definiteness, a bracketing line search
 * refined by quadratic interpolation, and central-difference gradients.
 * Box bounds are enforced by projecting every trial point.
 *
 * Non-finite objective values are treated as +infinity so the line
 * search backs away from them.
 */
class DFPOptimizer {
public:
    using Objective = std::function<double(const Eigen::VectorXd&)>;

    explicit DFPOptimizer(const OptimizerOptions& options = OptimizerOptions());

    void setBounds(const Eigen::VectorXd& lower, const Eigen::VectorXd& upper);
    void clearBounds();

    OptimizerResult minimize(const Objective& f, const Eigen::VectorXd& x0);

    // Central-difference gradient of f at x
    Eigen::VectorXd gradient(const Objective& f, const Eigen::VectorXd& x);

    Eigen::VectorXd project(const Eigen::VectorXd& x) const;

    const OptimizerOptions& options() const { return options_; }

private:
    OptimizerOptions options_;
    Eigen::VectorXd lower_;
    Eigen::VectorXd upper_;
    bool bounded_;
    int evaluations_;

    double evaluate(const Objective& f, const Eigen::VectorXd& x);

    // Step length along h from x; fv is f(x) on entry, f at the step on exit
    double lineSearch(const Objective& f, const Eigen::VectorXd& x,
                      const Eigen::VectorXd& h, double& fv, double ram);
};

} // namespace openetas
