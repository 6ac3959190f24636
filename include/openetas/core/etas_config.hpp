#pragma once

#include "config.hpp"
#include "event.hpp"
#include "../inversion/etas_inversion.hpp"
#include "../simulation/etas_simulator.hpp"
#include "../forecast/forecast.hpp"
#include <string>
#include <vector>

namespace openetas {

/**
 * CatalogSettings - [catalog] section
 *
 * Window bounds left unset are taken from the event times.
 */
struct CatalogSettings {
    std::string file;
    std::string region_file;
    double mc = 2.5;
    double delta_m = 0.1;
    bool has_t_start = false;
    bool has_t_end = false;
    bool has_t_aux = false;
    TimeDays t_start = 0;
    TimeDays t_end = 0;
    TimeDays t_aux = 0;
};

/**
 * DatabaseSettings - [database] section
 */
struct DatabaseSettings {
    bool enabled = false;
    std::string file = "openetas.db";
};

/**
 * EtasConfig - Typed view of an INI configuration
 *
 * Maps [catalog], [model], [inversion], [simulation], [forecast] and
 * [database] keys onto the option structs of the engines. Unknown or
 * malformed enumerations are collected as errors.
 */
class EtasConfig {
public:
    EtasConfig() = default;
    explicit EtasConfig(const Config& config);

    bool loadFromFile(const std::string& filename);

    // Problems found while mapping keys; empty when the config is usable
    const std::vector<std::string>& errors() const { return errors_; }
    bool valid() const { return errors_.empty(); }

    const KernelConfig& kernels() const { return kernels_; }
    const CatalogSettings& catalog() const { return catalog_; }
    const InversionOptions& inversion() const { return inversion_; }
    const SimulationOptions& simulation() const { return simulation_; }
    const ForecastOptions& forecast() const { return forecast_; }
    const DatabaseSettings& database() const { return database_; }
    const Config& raw() const { return config_; }

    // Full parameter set from [inversion]; false unless every parameter
    // used by the kernels is given
    bool suppliedParameters(Parameters& params) const;

    // Load the catalog and region files; throws DataError on failure
    Catalog loadCatalog() const;

    // Default configuration with every key present
    static Config defaults();

private:
    Config config_;
    std::vector<std::string> errors_;

    KernelConfig kernels_;
    CatalogSettings catalog_;
    InversionOptions inversion_;
    SimulationOptions simulation_;
    ForecastOptions forecast_;
    DatabaseSettings database_;

    void parse();
};

} // namespace openetas
