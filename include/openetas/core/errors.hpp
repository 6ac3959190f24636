#pragma once

#include "../kernel/parameters.hpp"
#include <stdexcept>
#include <string>
#include <cstddef>

namespace openetas {

/**
 * DataError - Catalog or region violates the data model
 */
class DataError : public std::runtime_error {
public:
    explicit DataError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * InversionError - EM update left the model domain
 *
 * Carries the last parameter set that passed validation so callers can
 * inspect where the iteration broke down.
 */
class InversionError : public std::runtime_error {
public:
    InversionError(const std::string& what, const Parameters& last_valid, int iteration)
        : std::runtime_error(what), last_valid_(last_valid), iteration_(iteration) {}

    const Parameters& lastValidParameters() const { return last_valid_; }
    int iteration() const { return iteration_; }

private:
    Parameters last_valid_;
    int iteration_;
};

/**
 * SimulationOverflow - Branching process exceeded its safety bounds
 *
 * Aborts a single realization. The partial catalog is discarded.
 */
class SimulationOverflow : public std::runtime_error {
public:
    SimulationOverflow(const std::string& what, size_t events, int generation)
        : std::runtime_error(what), events_(events), generation_(generation) {}

    size_t eventCount() const { return events_; }
    int generation() const { return generation_; }

private:
    size_t events_;
    int generation_;
};

/**
 * NumericalWarning - Recoverable numerical problem
 *
 * Never thrown. Logged to std::cerr and collected in run diagnostics;
 * the computation continues with regularised values.
 */
struct NumericalWarning {
    std::string message;
    int iteration;

    NumericalWarning() : iteration(-1) {}
    NumericalWarning(const std::string& msg, int iter) : message(msg), iteration(iter) {}
};

} // namespace openetas
