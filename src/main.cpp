/**
 * OpenETAS - ETAS inversion, simulation and forecasting
 *
 * Command line front end that:
 * 1. Loads a projected catalog and region described by an INI file
 * 2. Inverts ETAS parameters and a background field by EM
 * 3. Simulates synthetic catalogs from fitted or supplied parameters
 * 4. Forecasts with an ensemble of continuation or fresh-start runs
 * 5. Optionally stores catalogs and runs in an SQLite database
 */

#include <iostream>
#include <fstream>
#include <iomanip>
#include <string>
#include <stdexcept>

#include "openetas/core/types.hpp"
#include "openetas/core/config.hpp"
#include "openetas/core/errors.hpp"
#include "openetas/core/etas_config.hpp"
#include "openetas/database/catalog_database.hpp"
#include "openetas/inversion/etas_inversion.hpp"
#include "openetas/simulation/etas_simulator.hpp"
#include "openetas/forecast/forecast.hpp"

using namespace openetas;

void printUsage(const char* progname) {
    std::cout << "Usage: " << progname << " <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  invert                 Fit ETAS parameters and background to the catalog\n";
    std::cout << "  simulate               Generate one synthetic catalog\n";
    std::cout << "  forecast               Invert (unless parameters are given) and simulate an ensemble\n";
    std::cout << "  write-config <file>    Write a configuration file with all default keys\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <file>    Configuration file (default: openetas.conf)\n";
    std::cout << "  -o, --output <file>    Output catalog (simulate) or declustered catalog (invert)\n";
    std::cout << "  -d, --database <file>  SQLite result database (overrides [database])\n";
    std::cout << "  -r, --run <id>         Take parameters and background from a stored inversion run\n";
    std::cout << "  -s, --seed <n>         Random seed (overrides [simulation] seed)\n";
    std::cout << "  --rate-map <file>      Write the forecast expected-rate grid\n";
    std::cout << "  --threshold <p>        Background probability threshold for declustering (default: 0.5)\n";
    std::cout << "  -v, --verbose          Per-iteration progress output\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "\n";
    std::cout << "Catalog format:\n";
    std::cout << "  One event per line: time(days) x(km) y(km) depth(km) magnitude\n";
    std::cout << "  Region file: one 'x y' vertex per line\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progname << " write-config openetas.conf\n";
    std::cout << "  " << progname << " invert -c openetas.conf -o declustered.txt\n";
    std::cout << "  " << progname << " forecast -c openetas.conf -d results.db --rate-map rates.txt\n";
}

/**
 * OpenETAS Application
 */
class OpenETASApp {
public:
    OpenETASApp()
        : db_enabled_(false)
        , run_id_(schema::NULL_INT)
        , decluster_threshold_(0.5)
    {
    }

    bool loadConfig(const std::string& filename) {
        if (!config_.loadFromFile(filename)) {
            std::cerr << "Failed to load config: " << filename << std::endl;
            return false;
        }
        return applyConfig();
    }

    bool applyConfig() {
        for (const auto& error : config_.errors()) {
            std::cerr << "Config error: " << error << std::endl;
        }
        if (!config_.valid()) return false;

        inversion_ = config_.inversion();
        simulation_ = config_.simulation();
        forecast_ = config_.forecast();

        if (config_.database().enabled) {
            return openDatabase(config_.database().file);
        }
        return true;
    }

    bool openDatabase(const std::string& filename) {
        if (!database_.open(filename)) {
            std::cerr << "Failed to open database: " << filename
                      << " (" << database_.lastError() << ")" << std::endl;
            return false;
        }
        db_enabled_ = true;
        std::cout << "Result database opened: " << filename
                  << " (schema " << database_.schemaVersion() << ")" << std::endl;
        return true;
    }

    void setVerbose(bool verbose) {
        inversion_.verbose = verbose;
        simulation_.verbose = verbose;
        forecast_.verbose = verbose;
        forecast_.simulation.verbose = verbose;
    }

    void setSeed(uint64_t seed) {
        simulation_.seed = seed;
        forecast_.simulation.seed = seed;
    }

    void setRunId(int64_t run_id) { run_id_ = run_id; }
    void setOutputFile(const std::string& filename) { output_file_ = filename; }
    void setRateMapFile(const std::string& filename) { rate_map_file_ = filename; }
    void setDeclusterThreshold(double threshold) { decluster_threshold_ = threshold; }

    int invert() {
        Catalog catalog = config_.loadCatalog();
        std::cout << catalog.summary() << std::endl;

        int64_t catalog_id = storeObservedCatalog(catalog);

        ETASInversion inversion(inversion_);
        InversionResult result;
        try {
            result = inversion.run(catalog);
        } catch (const InversionError& e) {
            std::cerr << "Inversion failed at iteration " << e.iteration() << ": "
                      << e.what() << std::endl;
            std::cerr << "Last valid parameters: "
                      << e.lastValidParameters().toString() << std::endl;
            return 1;
        }

        std::cout << result.summary() << std::endl;
        if (!result.succeeded()) return 1;

        if (db_enabled_) {
            int64_t run_id = database_.storeInversion(result, catalog_id);
            if (run_id < 0) {
                std::cerr << "Failed to store inversion run: " << database_.lastError() << std::endl;
            } else {
                std::cout << "Inversion stored in database (run_id: " << run_id << ")" << std::endl;
            }
        }

        if (!output_file_.empty()) {
            Catalog declustered = result.declusteredCatalog(decluster_threshold_);
            if (!writeCatalog(output_file_, declustered)) return 1;
            std::cout << "Declustered catalog (" << declustered.size() << " events, p_b >= "
                      << decluster_threshold_ << ") written to " << output_file_ << std::endl;
        }
        return 0;
    }

    int simulate() {
        Parameters params;
        BackgroundFieldPtr field;
        if (!resolveParameters(params, field)) return 1;

        Region region;
        std::vector<Event> seeds;
        if (!config_.catalog().file.empty()) {
            Catalog catalog = config_.loadCatalog();
            region = catalog.region();
            seeds = catalog.events();
        } else if (!region.loadFromFile(config_.catalog().region_file)) {
            std::cerr << "Simulation needs [catalog] region_file or file" << std::endl;
            return 1;
        }

        std::cout << "Parameters: " << params.toString() << std::endl;

        SimulationResult result;
        try {
            ETASSimulator simulator(params, simulation_, region, field);
            std::cout << "Expected background events: "
                      << simulator.expectedBackgroundCount() << std::endl;
            result = simulator.simulate(seeds);
        } catch (const SimulationOverflow& e) {
            std::cerr << "Simulation aborted: " << e.what() << " (" << e.eventCount()
                      << " events, generation " << e.generation() << ")" << std::endl;
            return 1;
        } catch (const std::invalid_argument& e) {
            std::cerr << e.what() << std::endl;
            return 1;
        }

        std::cout << "Simulated " << result.catalog.size() << " events ("
                  << result.background_count << " background, "
                  << result.triggered_count << " triggered, "
                  << result.generations << " generations)" << std::endl;

        if (db_enabled_) {
            int64_t id = database_.storeSimulation(result, "simulation");
            if (id < 0) {
                std::cerr << "Failed to store simulation: " << database_.lastError() << std::endl;
            } else {
                std::cout << "Synthetic catalog stored in database (catalog_id: " << id << ")"
                          << std::endl;
            }
        }

        if (!output_file_.empty()) {
            if (!writeCatalog(output_file_, result.catalog)) return 1;
            std::cout << "Catalog written to " << output_file_ << std::endl;
        }
        return 0;
    }

    int forecast() {
        Catalog catalog = config_.loadCatalog();
        std::cout << catalog.summary() << std::endl;
        int64_t catalog_id = storeObservedCatalog(catalog);

        ForecastEngine engine(forecast_, inversion_);
        ForecastResult result;

        Parameters params;
        BackgroundFieldPtr field;
        bool supplied = run_id_ >= 0 || config_.suppliedParameters(params);

        try {
            if (supplied) {
                if (!resolveParameters(params, field)) return 1;
                result = engine.run(catalog, params, field);
            } else {
                result = engine.run(catalog);
            }
        } catch (const InversionError& e) {
            std::cerr << "Inversion failed at iteration " << e.iteration() << ": "
                      << e.what() << std::endl;
            return 1;
        } catch (const std::invalid_argument& e) {
            std::cerr << e.what() << std::endl;
            return 1;
        }

        if (result.inverted) {
            std::cout << result.inversion.summary() << std::endl;
            if (!result.inversion.succeeded()) return 1;

            if (db_enabled_) {
                int64_t run_id = database_.storeInversion(result.inversion, catalog_id);
                if (run_id >= 0) {
                    std::cout << "Inversion stored in database (run_id: " << run_id << ")"
                              << std::endl;
                }
            }
        }

        std::cout << result.ensemble.summary() << std::endl;

        if (db_enabled_ && !result.ensemble.catalogs.empty()) {
            database_.beginTransaction();
            for (size_t r = 0; r < result.ensemble.catalogs.size(); r++) {
                if (database_.storeCatalog(result.ensemble.catalogs[r], "forecast",
                                           "synthetic", static_cast<int64_t>(r)) < 0) {
                    std::cerr << "Failed to store realisation " << r << ": "
                              << database_.lastError() << std::endl;
                    database_.rollbackTransaction();
                    return 1;
                }
            }
            database_.commitTransaction();
            std::cout << result.ensemble.catalogs.size()
                      << " realisations stored in database" << std::endl;
        }

        if (!rate_map_file_.empty()) {
            if (!writeRateMap(rate_map_file_, result.ensemble)) return 1;
            std::cout << "Expected-rate map written to " << rate_map_file_ << std::endl;
        }

        return result.ensemble.succeeded() > 0 ? 0 : 1;
    }

private:
    EtasConfig config_;
    InversionOptions inversion_;
    SimulationOptions simulation_;
    ForecastOptions forecast_;

    CatalogDatabase database_;
    bool db_enabled_;
    int64_t run_id_;

    std::string output_file_;
    std::string rate_map_file_;
    double decluster_threshold_;

    // Parameters from a stored run or from the [inversion] section
    bool resolveParameters(Parameters& params, BackgroundFieldPtr& field) {
        if (run_id_ >= 0) {
            if (!db_enabled_) {
                std::cerr << "--run needs a database" << std::endl;
                return false;
            }
            KernelConfig kernels;
            if (!database_.loadParameters(run_id_, params, kernels)) {
                std::cerr << "Failed to load run " << run_id_ << ": "
                          << database_.lastError() << std::endl;
                return false;
            }
            simulation_.kernels = kernels;
            forecast_.simulation.kernels = kernels;

            BackgroundField loaded;
            if (database_.loadBackgroundField(run_id_, loaded, inversion_.background)) {
                field = std::make_shared<const BackgroundField>(loaded);
            } else {
                std::cerr << "No background field for run " << run_id_
                          << ", using a uniform field" << std::endl;
            }
            return true;
        }

        if (!config_.suppliedParameters(params)) {
            std::cerr << "Parameters missing: set mu, k0, alpha, c, p, d, gamma, q "
                         "(and tau for the tapered kernel) in [inversion] or use --run" << std::endl;
            return false;
        }
        return true;
    }

    int64_t storeObservedCatalog(const Catalog& catalog) {
        if (!db_enabled_) return schema::NULL_INT;

        int64_t id = database_.storeCatalog(catalog, config_.catalog().file);
        if (id < 0) {
            std::cerr << "Failed to store catalog: " << database_.lastError() << std::endl;
        } else {
            std::cout << "Catalog stored in database (catalog_id: " << id << ")" << std::endl;
        }
        return id;
    }

    static bool writeCatalog(const std::string& filename, const Catalog& catalog) {
        std::ofstream file(filename);
        if (!file.is_open()) {
            std::cerr << "Cannot write " << filename << std::endl;
            return false;
        }

        const bool variable_mc = catalog.hasVariableCompleteness();
        file << (variable_mc ? "# time x y depth magnitude mc_current\n"
                             : "# time x y depth magnitude\n");
        file << std::fixed;
        for (size_t i = 0; i < catalog.size(); i++) {
            const Event& e = catalog[i];
            file << std::setprecision(6) << e.time << " "
                 << std::setprecision(3) << e.x << " " << e.y << " " << e.depth << " "
                 << std::setprecision(2) << e.magnitude;
            if (variable_mc) file << " " << catalog.completeness(i);
            file << "\n";
        }
        return true;
    }

    static bool writeRateMap(const std::string& filename, const EnsembleResult& ensemble) {
        std::ofstream file(filename);
        if (!file.is_open()) {
            std::cerr << "Cannot write " << filename << std::endl;
            return false;
        }
        if (ensemble.grid_nx <= 0 || ensemble.grid_ny <= 0) return true;

        const Bounds& b = ensemble.grid_bounds;
        double dx = (b.max_x - b.min_x) / ensemble.grid_nx;
        double dy = (b.max_y - b.min_y) / ensemble.grid_ny;

        file << "# x y expected_events\n";
        for (int iy = 0; iy < ensemble.grid_ny; iy++) {
            for (int ix = 0; ix < ensemble.grid_nx; ix++) {
                file << b.min_x + (ix + 0.5) * dx << " "
                     << b.min_y + (iy + 0.5) * dy << " "
                     << ensemble.rate_map[static_cast<size_t>(iy) * ensemble.grid_nx + ix] << "\n";
            }
        }
        return true;
    }
};

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        printUsage(argv[0]);
        return 0;
    }

    // Parse command line arguments
    std::string config_file = "openetas.conf";
    std::string database_file;
    std::string output_file;
    std::string rate_map_file;
    std::string positional;
    int64_t run_id = schema::NULL_INT;
    long long seed = -1;
    double threshold = 0.5;
    bool verbose = false;

    try {
        for (int i = 2; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                config_file = argv[++i];
            } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
                output_file = argv[++i];
            } else if ((arg == "-d" || arg == "--database") && i + 1 < argc) {
                database_file = argv[++i];
            } else if ((arg == "-r" || arg == "--run") && i + 1 < argc) {
                run_id = std::stoll(argv[++i]);
            } else if ((arg == "-s" || arg == "--seed") && i + 1 < argc) {
                seed = std::stoll(argv[++i]);
            } else if (arg == "--rate-map" && i + 1 < argc) {
                rate_map_file = argv[++i];
            } else if (arg == "--threshold" && i + 1 < argc) {
                threshold = std::stod(argv[++i]);
            } else if (arg == "-v" || arg == "--verbose") {
                verbose = true;
            } else if (positional.empty() && arg[0] != '-') {
                positional = arg;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                return 1;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Invalid numeric argument (" << e.what() << ")" << std::endl;
        return 1;
    }

    if (command == "write-config") {
        std::string target = positional.empty() ? config_file : positional;
        if (!EtasConfig::defaults().saveToFile(target)) {
            std::cerr << "Cannot write " << target << std::endl;
            return 1;
        }
        std::cout << "Default configuration written to " << target << std::endl;
        return 0;
    }

    if (command != "invert" && command != "simulate" && command != "forecast") {
        std::cerr << "Unknown command: " << command << "\n" << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    std::cout << "==========================================\n";
    std::cout << "OpenETAS - ETAS inversion and simulation\n";
    std::cout << "==========================================\n\n";

    OpenETASApp app;

    if (!app.loadConfig(config_file)) {
        return 1;
    }

    // Database from the command line overrides the config
    if (!database_file.empty() && !app.openDatabase(database_file)) {
        return 1;
    }

    if (verbose) app.setVerbose(true);
    if (seed >= 0) app.setSeed(static_cast<uint64_t>(seed));
    app.setRunId(run_id);
    app.setOutputFile(output_file);
    app.setRateMapFile(rate_map_file);
    app.setDeclusterThreshold(threshold);

    try {
        if (command == "invert") return app.invert();
        if (command == "simulate") return app.simulate();
        return app.forecast();
    } catch (const DataError& e) {
        std::cerr << "Data error: " << e.what() << std::endl;
        return 1;
    }
}
