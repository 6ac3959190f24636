#include "openetas/core/etas_config.hpp"
#include "openetas/core/errors.hpp"
#include <algorithm>
#include <iostream>
#include <limits>

namespace openetas {

EtasConfig::EtasConfig(const Config& config)
    : config_(config)
{
    parse();
}

bool EtasConfig::loadFromFile(const std::string& filename) {
    Config config;
    if (!config.loadFromFile(filename)) return false;
    config_ = config;
    parse();
    return true;
}

void EtasConfig::parse() {
    errors_.clear();
    const Config& c = config_;

    // [model]
    kernels_ = KernelConfig();
    std::string temporal = c.getString("model.temporal", "omori");
    std::string spatial = c.getString("model.spatial", "powerlaw");
    if (!stringToTemporalKernel(temporal, kernels_.temporal)) {
        errors_.push_back("Unknown temporal kernel: " + temporal);
    }
    if (!stringToSpatialKernel(spatial, kernels_.spatial)) {
        errors_.push_back("Unknown spatial kernel: " + spatial);
    }

    // [catalog]
    catalog_ = CatalogSettings();
    catalog_.file = c.getString("catalog.file");
    catalog_.region_file = c.getString("catalog.region_file");
    catalog_.mc = c.getDouble("catalog.mc", catalog_.mc);
    catalog_.delta_m = c.getDouble("catalog.delta_m", catalog_.delta_m);
    catalog_.has_t_start = c.has("catalog.t_start");
    catalog_.has_t_end = c.has("catalog.t_end");
    catalog_.has_t_aux = c.has("catalog.t_aux");
    catalog_.t_start = c.getDouble("catalog.t_start");
    catalog_.t_end = c.getDouble("catalog.t_end");
    catalog_.t_aux = c.getDouble("catalog.t_aux");

    // [inversion]
    inversion_ = InversionOptions();
    inversion_.kernels = kernels_;
    inversion_.max_iterations = c.getInt("inversion.max_iterations", inversion_.max_iterations);
    inversion_.tolerance = c.getDouble("inversion.tolerance", inversion_.tolerance);
    inversion_.parameter_tolerance = c.getDouble("inversion.parameter_tolerance",
                                                 inversion_.parameter_tolerance);
    inversion_.lookback_days = c.getDouble("inversion.lookback_days", inversion_.lookback_days);
    inversion_.background.n_neighbors = c.getInt("inversion.n_neighbors",
                                                 inversion_.background.n_neighbors);
    inversion_.background.min_bandwidth = c.getDouble("inversion.min_bandwidth",
                                                      inversion_.background.min_bandwidth);
    inversion_.background.grid_resolution = c.getInt("inversion.grid_resolution",
                                                     inversion_.background.grid_resolution);
    inversion_.n_threads = c.getInt("inversion.n_threads", inversion_.n_threads);
    inversion_.b_value = c.getDouble("inversion.b", inversion_.b_value);
    inversion_.verbose = c.getBool("inversion.verbose", false);

    for (int i = 0; i < PARAM_COUNT; i++) {
        Param which = static_cast<Param>(i);
        std::string key = "inversion." + paramName(which);
        if (c.has(key)) {
            inversion_.initial_values[which] = c.getDouble(key);
        }
    }

    for (const auto& name : c.getStringList("inversion.fixed")) {
        Param which;
        if (stringToParam(name, which)) {
            inversion_.fixed.insert(which);
        } else {
            errors_.push_back("Unknown parameter in inversion.fixed: " + name);
        }
    }

    if (inversion_.max_iterations < 1) errors_.push_back("inversion.max_iterations must be >= 1");
    if (inversion_.lookback_days <= 0) errors_.push_back("inversion.lookback_days must be positive");
    if (inversion_.background.n_neighbors < 1) errors_.push_back("inversion.n_neighbors must be >= 1");

    // [simulation]
    simulation_ = SimulationOptions();
    simulation_.kernels = kernels_;
    simulation_.mc = catalog_.mc;
    simulation_.delta_m = catalog_.delta_m;
    if (inversion_.b_value > 0) simulation_.beta = inversion_.b_value * constants::LN10;
    simulation_.seed = static_cast<uint64_t>(c.getDouble("simulation.seed", 42));
    simulation_.max_generations = c.getInt("simulation.max_generations",
                                           simulation_.max_generations);
    simulation_.max_events = static_cast<size_t>(
        c.getDouble("simulation.max_events", static_cast<double>(simulation_.max_events)));
    simulation_.m_max = c.getDouble("simulation.m_max", std::numeric_limits<double>::infinity());
    simulation_.depth = c.getDouble("simulation.depth", simulation_.depth);
    simulation_.burn_in_days = c.getDouble("simulation.burn_in_days", simulation_.burn_in_days);
    simulation_.horizon = TimeWindow(c.getDouble("simulation.t_start", 0.0),
                                     c.getDouble("simulation.t_end", 365.25));
    simulation_.verbose = c.getBool("simulation.verbose", false);

    std::string policy = c.getString("simulation.out_of_region", "discard");
    if (!stringToOutOfRegionPolicy(policy, simulation_.out_of_region)) {
        errors_.push_back("Unknown out_of_region policy: " + policy);
    }
    std::string sim_mode = c.getString("simulation.mode", "fresh");
    if (!stringToSimulationMode(sim_mode, simulation_.mode)) {
        errors_.push_back("Unknown simulation mode: " + sim_mode);
    }

    // [forecast]
    forecast_ = ForecastOptions();
    forecast_.simulation = simulation_;
    forecast_.n_simulations = c.getInt("forecast.n_simulations", forecast_.n_simulations);
    forecast_.forecast_days = c.getDouble("forecast.forecast_days", forecast_.forecast_days);
    forecast_.burn_in_days = c.getDouble("forecast.burn_in_days", forecast_.burn_in_days);
    forecast_.m_threshold = c.getDouble("forecast.m_threshold", forecast_.m_threshold);
    forecast_.grid_nx = c.getInt("forecast.grid_nx", forecast_.grid_nx);
    forecast_.grid_ny = c.getInt("forecast.grid_ny", forecast_.grid_ny);
    forecast_.keep_catalogs = c.getBool("forecast.keep_catalogs", false);
    forecast_.n_threads = inversion_.n_threads;
    forecast_.verbose = c.getBool("forecast.verbose", false);

    std::string mode = c.getString("forecast.mode", "continuation");
    if (!stringToSimulationMode(mode, forecast_.mode)) {
        errors_.push_back("Unknown forecast mode: " + mode);
    }
    if (forecast_.n_simulations < 1) errors_.push_back("forecast.n_simulations must be >= 1");
    if (forecast_.forecast_days <= 0) errors_.push_back("forecast.forecast_days must be positive");

    // [database]
    database_ = DatabaseSettings();
    database_.enabled = c.getBool("database.enabled", false);
    database_.file = c.getString("database.file", database_.file);
}

bool EtasConfig::suppliedParameters(Parameters& params) const {
    Parameters p;
    for (int i = 0; i < PARAM_COUNT; i++) {
        Param which = static_cast<Param>(i);
        auto it = inversion_.initial_values.find(which);
        if (it == inversion_.initial_values.end()) {
            if (Parameters::isUsed(which, kernels_)) return false;
            continue;
        }
        p.set(which, it->second);
    }
    params = p;
    return true;
}

Catalog EtasConfig::loadCatalog() const {
    std::vector<Event> events;
    if (catalog_.file.empty() || !loadEventsFromFile(catalog_.file, events)) {
        throw DataError("Cannot load catalog '" + catalog_.file + "'");
    }

    Region region;
    if (!catalog_.region_file.empty()) {
        if (!region.loadFromFile(catalog_.region_file)) {
            throw DataError("Cannot load region '" + catalog_.region_file + "'");
        }
    } else {
        // Padded bounding box of the epicentres
        double min_x = events[0].x, max_x = events[0].x;
        double min_y = events[0].y, max_y = events[0].y;
        for (const auto& e : events) {
            min_x = std::min(min_x, e.x); max_x = std::max(max_x, e.x);
            min_y = std::min(min_y, e.y); max_y = std::max(max_y, e.y);
        }
        region = Region::rectangle(min_x - 1.0, max_x + 1.0, min_y - 1.0, max_y + 1.0);
        std::cerr << "EtasConfig: no region file, using the catalog bounding box" << std::endl;
    }

    double t_min = events[0].time, t_max = events[0].time;
    for (const auto& e : events) {
        t_min = std::min(t_min, e.time);
        t_max = std::max(t_max, e.time);
    }

    TimeWindow window(catalog_.has_t_start ? catalog_.t_start : t_min,
                      catalog_.has_t_end ? catalog_.t_end : t_max);
    TimeDays t_aux = catalog_.has_t_aux ? catalog_.t_aux : std::min(window.start, t_min);

    // Events outside [t_aux, t_end] or below mc are not part of the model
    double m_min = catalog_.mc - catalog_.delta_m / 2.0 - 1e-9;
    std::vector<Event> kept;
    for (const auto& e : events) {
        if (e.time < t_aux || e.time > window.end || e.magnitude < m_min) continue;
        kept.push_back(e);
    }
    if (kept.size() < events.size()) {
        std::cout << "EtasConfig: " << events.size() - kept.size()
                  << " events outside the time window or below mc dropped" << std::endl;
    }

    return Catalog(kept, region, window, catalog_.mc, catalog_.delta_m, t_aux);
}

Config EtasConfig::defaults() {
    Config c;
    c.set("catalog.file", "catalog.txt");
    c.set("catalog.region_file", "region.txt");
    c.set("catalog.mc", 2.5);
    c.set("catalog.delta_m", 0.1);

    c.set("model.temporal", "omori");
    c.set("model.spatial", "powerlaw");

    InversionOptions inv;
    c.set("inversion.max_iterations", inv.max_iterations);
    c.set("inversion.tolerance", inv.tolerance);
    c.set("inversion.parameter_tolerance", inv.parameter_tolerance);
    c.set("inversion.lookback_days", inv.lookback_days);
    c.set("inversion.n_neighbors", inv.background.n_neighbors);
    c.set("inversion.min_bandwidth", inv.background.min_bandwidth);
    c.set("inversion.grid_resolution", inv.background.grid_resolution);
    c.set("inversion.n_threads", inv.n_threads);
    c.set("inversion.fixed", "");

    SimulationOptions sim;
    c.set("simulation.seed", 42);
    c.set("simulation.mode", "fresh");
    c.set("simulation.t_start", 0.0);
    c.set("simulation.t_end", 365.25);
    c.set("simulation.burn_in_days", sim.burn_in_days);
    c.set("simulation.max_generations", sim.max_generations);
    c.set("simulation.max_events", static_cast<int>(sim.max_events));
    c.set("simulation.out_of_region", outOfRegionPolicyToString(sim.out_of_region));

    ForecastOptions fc;
    c.set("forecast.n_simulations", fc.n_simulations);
    c.set("forecast.forecast_days", fc.forecast_days);
    c.set("forecast.burn_in_days", fc.burn_in_days);
    c.set("forecast.mode", simulationModeToString(fc.mode));
    c.set("forecast.m_threshold", fc.m_threshold);

    c.set("database.enabled", false);
    c.set("database.file", "openetas.db");
    return c;
}

} // namespace openetas
