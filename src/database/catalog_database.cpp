/**
 * Catalog Database Implementation
 *
 * SQLite-based store for catalogs, inversion runs and background fields.
 */

#include "openetas/database/catalog_database.hpp"
#include "openetas/core/errors.hpp"
#include <sqlite3.h>
#include <chrono>
#include <iostream>
#include <sstream>

namespace openetas {

namespace {

std::string columnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

} // namespace

CatalogDatabase::CatalogDatabase()
    : db_(nullptr)
    , stmt_insert_catalog_(nullptr)
    , stmt_insert_vertex_(nullptr)
    , stmt_insert_event_(nullptr)
    , stmt_insert_run_(nullptr)
    , stmt_insert_source_(nullptr)
{
}

CatalogDatabase::~CatalogDatabase() {
    close();
}

bool CatalogDatabase::open(const std::string& filename) {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (db_) {
            finalizeStatements();
            sqlite3_close(db_);
            db_ = nullptr;
        }

        int rc = sqlite3_open(filename.c_str(), &db_);
        if (rc != SQLITE_OK) {
            setError("Failed to open database");
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }

        executeSQL("PRAGMA foreign_keys = ON;");
        executeSQL("PRAGMA journal_mode = WAL;");
        executeSQL("PRAGMA synchronous = NORMAL;");
    }

    // Creates missing tables and prepares the insert statements
    if (!createSchema()) {
        close();
        return false;
    }

    return true;
}

void CatalogDatabase::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        finalizeStatements();
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool CatalogDatabase::createSchema() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) return false;

    if (!executeSQL(schema::CatalogRow::CREATE_SQL)) return false;
    if (!executeSQL(schema::RegionVertexRow::CREATE_SQL)) return false;
    if (!executeSQL(schema::EventRow::CREATE_SQL)) return false;
    if (!executeSQL(schema::InversionRunRow::CREATE_SQL)) return false;
    if (!executeSQL(schema::BackgroundSourceRow::CREATE_SQL)) return false;

    if (!executeSQL(schema::CREATE_INDICES_SQL)) return false;

    // Schema version
    if (!executeSQL(R"(
        CREATE TABLE IF NOT EXISTS openetas_meta (
            key TEXT PRIMARY KEY,
            value TEXT
        )
    )")) return false;

    std::string version_sql = "INSERT OR REPLACE INTO openetas_meta VALUES ('schema_version', '" +
                              std::string(schema::SCHEMA_VERSION) + "')";
    if (!executeSQL(version_sql.c_str())) return false;
    executeSQL("INSERT OR IGNORE INTO openetas_meta VALUES ('created', datetime('now'))");

    if (!stmt_insert_catalog_ && !prepareStatements()) {
        setError("Failed to prepare statements");
        finalizeStatements();
        return false;
    }

    return true;
}

bool CatalogDatabase::dropSchema() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) return false;

    finalizeStatements();

    // Children first for the foreign keys
    const char* tables[] = {
        "background_source", "inversion_run", "event", "region_vertex",
        "catalog", "openetas_meta"
    };

    bool ok = true;
    for (const auto& table : tables) {
        std::string sql = "DROP TABLE IF EXISTS " + std::string(table);
        ok = executeSQL(sql.c_str()) && ok;
    }
    return ok;
}

std::string CatalogDatabase::schemaVersion() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return "";

    sqlite3_stmt* stmt;
    std::string version;

    if (sqlite3_prepare_v2(db_,
            "SELECT value FROM openetas_meta WHERE key = 'schema_version'",
            -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            version = columnText(stmt, 0);
        }
        sqlite3_finalize(stmt);
    }

    return version;
}

int64_t CatalogDatabase::insertCatalog(const Catalog& catalog, const std::string& name,
                                       const std::string& kind, int64_t realization) {
    if (!db_ || !stmt_insert_catalog_) return -1;

    sqlite3_reset(stmt_insert_catalog_);
    sqlite3_bind_text(stmt_insert_catalog_, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_catalog_, 2, kind.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_insert_catalog_, 3, realization);
    sqlite3_bind_double(stmt_insert_catalog_, 4, catalog.mc());
    sqlite3_bind_double(stmt_insert_catalog_, 5, catalog.deltaM());
    sqlite3_bind_double(stmt_insert_catalog_, 6, catalog.auxiliaryStart());
    sqlite3_bind_double(stmt_insert_catalog_, 7, catalog.window().start);
    sqlite3_bind_double(stmt_insert_catalog_, 8, catalog.window().end);
    sqlite3_bind_int64(stmt_insert_catalog_, 9, static_cast<int64_t>(catalog.size()));
    sqlite3_bind_double(stmt_insert_catalog_, 10, currentLddate());

    if (sqlite3_step(stmt_insert_catalog_) != SQLITE_DONE) {
        setError("Failed to insert catalog");
        return -1;
    }
    int64_t catalog_id = sqlite3_last_insert_rowid(db_);

    const auto& vertices = catalog.region().vertices();
    for (size_t i = 0; i < vertices.size(); i++) {
        sqlite3_reset(stmt_insert_vertex_);
        sqlite3_bind_int64(stmt_insert_vertex_, 1, catalog_id);
        sqlite3_bind_int64(stmt_insert_vertex_, 2, static_cast<int64_t>(i));
        sqlite3_bind_double(stmt_insert_vertex_, 3, vertices[i].x);
        sqlite3_bind_double(stmt_insert_vertex_, 4, vertices[i].y);
        if (sqlite3_step(stmt_insert_vertex_) != SQLITE_DONE) {
            setError("Failed to insert region vertex");
            return -1;
        }
    }

    return catalog_id;
}

bool CatalogDatabase::insertEvent(int64_t catalog_id, const Event& event, int64_t parent,
                                  int generation, bool is_background) {
    sqlite3_reset(stmt_insert_event_);
    sqlite3_bind_int64(stmt_insert_event_, 1, catalog_id);
    sqlite3_bind_int64(stmt_insert_event_, 2, event.id);
    sqlite3_bind_double(stmt_insert_event_, 3, event.time);
    sqlite3_bind_double(stmt_insert_event_, 4, event.x);
    sqlite3_bind_double(stmt_insert_event_, 5, event.y);
    sqlite3_bind_double(stmt_insert_event_, 6, event.depth);
    sqlite3_bind_double(stmt_insert_event_, 7, event.magnitude);
    sqlite3_bind_int64(stmt_insert_event_, 8, parent);
    sqlite3_bind_int64(stmt_insert_event_, 9, generation);
    sqlite3_bind_int64(stmt_insert_event_, 10, is_background ? 1 : 0);
    if (event.hasLocalCompleteness()) {
        sqlite3_bind_double(stmt_insert_event_, 11, event.mc_current);
    } else {
        sqlite3_bind_null(stmt_insert_event_, 11);
    }

    if (sqlite3_step(stmt_insert_event_) != SQLITE_DONE) {
        setError("Failed to insert event");
        return false;
    }
    return true;
}

int64_t CatalogDatabase::storeCatalog(const Catalog& catalog, const std::string& name,
                                      const std::string& kind, int64_t realization) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) return -1;

    // Joins a transaction opened by the caller
    bool own_txn = sqlite3_get_autocommit(db_) != 0;
    if (own_txn) executeSQL("BEGIN TRANSACTION");

    int64_t catalog_id = insertCatalog(catalog, name, kind, realization);
    if (catalog_id < 0) {
        if (own_txn) executeSQL("ROLLBACK");
        return -1;
    }

    // Observed events carry no ids of their own; number them by position
    const auto& events = catalog.events();
    for (size_t i = 0; i < events.size(); i++) {
        Event e = events[i];
        if (e.id <= 0) e.id = static_cast<int64_t>(i + 1);
        if (!insertEvent(catalog_id, e, schema::NULL_INT, 0, true)) {
            if (own_txn) executeSQL("ROLLBACK");
            return -1;
        }
    }

    if (own_txn) executeSQL("COMMIT");
    return catalog_id;
}

int64_t CatalogDatabase::storeSimulation(const SimulationResult& result, const std::string& name,
                                         int64_t realization) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) return -1;

    // Joins a transaction opened by the caller
    bool own_txn = sqlite3_get_autocommit(db_) != 0;
    if (own_txn) executeSQL("BEGIN TRANSACTION");

    int64_t catalog_id = insertCatalog(result.catalog, name, "synthetic", realization);
    if (catalog_id < 0) {
        if (own_txn) executeSQL("ROLLBACK");
        return -1;
    }

    // Emitted arena entries carry their catalog id; links to seeds or
    // to events that were not emitted are stored as -1
    for (const auto& se : result.events) {
        if (se.is_seed || se.event.id <= 0) continue;

        int64_t parent = schema::NULL_INT;
        if (se.parent >= 0) {
            const SimulatedEvent& p = result.events[static_cast<size_t>(se.parent)];
            if (!p.is_seed && p.event.id > 0) parent = p.event.id;
        }

        if (!insertEvent(catalog_id, se.event, parent, se.generation, se.is_background)) {
            if (own_txn) executeSQL("ROLLBACK");
            return -1;
        }
    }

    if (own_txn) executeSQL("COMMIT");
    return catalog_id;
}

int64_t CatalogDatabase::storeInversion(const InversionResult& result, int64_t catalog_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_ || !stmt_insert_run_) return -1;

    const Parameters& p = result.parameters;
    const InversionDiagnostics& d = result.diagnostics;
    double log_lik = d.log_likelihood.empty() ? schema::NULL_DOUBLE : d.log_likelihood.back();

    // Joins a transaction opened by the caller
    bool own_txn = sqlite3_get_autocommit(db_) != 0;
    if (own_txn) executeSQL("BEGIN TRANSACTION");

    sqlite3_reset(stmt_insert_run_);
    if (catalog_id >= 0) {
        sqlite3_bind_int64(stmt_insert_run_, 1, catalog_id);
    } else {
        sqlite3_bind_null(stmt_insert_run_, 1);
    }
    std::string temporal = temporalKernelToString(result.kernels.temporal);
    std::string spatial = spatialKernelToString(result.kernels.spatial);
    std::string state = inversionStateToString(result.state);
    sqlite3_bind_text(stmt_insert_run_, 2, temporal.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_run_, 3, spatial.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_run_, 4, state.c_str(), -1, SQLITE_TRANSIENT);
    for (int i = 0; i < PARAM_COUNT; i++) {
        sqlite3_bind_double(stmt_insert_run_, 5 + i, p.get(static_cast<Param>(i)));
    }
    sqlite3_bind_double(stmt_insert_run_, 14, d.b_value);
    sqlite3_bind_double(stmt_insert_run_, 15, d.branching_ratio);
    sqlite3_bind_double(stmt_insert_run_, 16, log_lik);
    sqlite3_bind_int64(stmt_insert_run_, 17, d.iterations);
    sqlite3_bind_int64(stmt_insert_run_, 18, static_cast<int64_t>(d.n_targets));
    sqlite3_bind_double(stmt_insert_run_, 19, d.expected_background);
    sqlite3_bind_double(stmt_insert_run_, 20, d.elapsed_seconds);
    sqlite3_bind_double(stmt_insert_run_, 21, currentLddate());

    if (sqlite3_step(stmt_insert_run_) != SQLITE_DONE) {
        setError("Failed to insert inversion run");
        if (own_txn) executeSQL("ROLLBACK");
        return -1;
    }
    int64_t run_id = sqlite3_last_insert_rowid(db_);

    if (result.background && !result.background->isUniform()) {
        const BackgroundField& field = *result.background;
        for (size_t i = 0; i < field.sources().size(); i++) {
            sqlite3_reset(stmt_insert_source_);
            sqlite3_bind_int64(stmt_insert_source_, 1, run_id);
            sqlite3_bind_int64(stmt_insert_source_, 2, static_cast<int64_t>(i));
            sqlite3_bind_double(stmt_insert_source_, 3, field.sources()[i].x);
            sqlite3_bind_double(stmt_insert_source_, 4, field.sources()[i].y);
            sqlite3_bind_double(stmt_insert_source_, 5, field.weights()[i]);
            sqlite3_bind_double(stmt_insert_source_, 6, field.bandwidths()[i]);
            if (sqlite3_step(stmt_insert_source_) != SQLITE_DONE) {
                setError("Failed to insert background source");
                if (own_txn) executeSQL("ROLLBACK");
                return -1;
            }
        }
    }

    if (own_txn) executeSQL("COMMIT");
    return run_id;
}

bool CatalogDatabase::loadCatalog(int64_t catalog_id, Catalog& catalog) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) return false;

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_,
            "SELECT name, mc, delta_m, t_aux, t_start, t_end FROM catalog WHERE catalog_id = ?",
            -1, &stmt, nullptr) != SQLITE_OK) {
        setError("Failed to query catalog");
        return false;
    }
    sqlite3_bind_int64(stmt, 1, catalog_id);

    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        last_error_ = "No catalog with id " + std::to_string(catalog_id);
        return false;
    }
    std::string name = columnText(stmt, 0);
    double mc = sqlite3_column_double(stmt, 1);
    double delta_m = sqlite3_column_double(stmt, 2);
    double t_aux = sqlite3_column_double(stmt, 3);
    TimeWindow window(sqlite3_column_double(stmt, 4), sqlite3_column_double(stmt, 5));
    sqlite3_finalize(stmt);

    std::vector<Point2D> vertices;
    if (sqlite3_prepare_v2(db_,
            "SELECT x, y FROM region_vertex WHERE catalog_id = ? ORDER BY seq",
            -1, &stmt, nullptr) != SQLITE_OK) {
        setError("Failed to query region");
        return false;
    }
    sqlite3_bind_int64(stmt, 1, catalog_id);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        vertices.emplace_back(sqlite3_column_double(stmt, 0), sqlite3_column_double(stmt, 1));
    }
    sqlite3_finalize(stmt);

    std::vector<Event> events;
    if (sqlite3_prepare_v2(db_,
            "SELECT evid, time, x, y, depth, magnitude, mc_current FROM event "
            "WHERE catalog_id = ? ORDER BY time, evid",
            -1, &stmt, nullptr) != SQLITE_OK) {
        setError("Failed to query events");
        return false;
    }
    sqlite3_bind_int64(stmt, 1, catalog_id);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        events.emplace_back(sqlite3_column_double(stmt, 1),
                            sqlite3_column_double(stmt, 2),
                            sqlite3_column_double(stmt, 3),
                            sqlite3_column_double(stmt, 4),
                            sqlite3_column_double(stmt, 5),
                            sqlite3_column_int64(stmt, 0));
        if (sqlite3_column_type(stmt, 6) != SQLITE_NULL) {
            events.back().mc_current = sqlite3_column_double(stmt, 6);
        }
    }
    sqlite3_finalize(stmt);

    try {
        catalog = Catalog(std::move(events), Region(vertices, name), window, mc, delta_m, t_aux);
    } catch (const DataError& e) {
        last_error_ = std::string("Stored catalog is invalid: ") + e.what();
        return false;
    }
    return true;
}

bool CatalogDatabase::loadParameters(int64_t run_id, Parameters& params, KernelConfig& kernels) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) return false;

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_,
            "SELECT temporal, spatial, mu, k0, alpha, c, p, tau, d, gamma, q "
            "FROM inversion_run WHERE run_id = ?",
            -1, &stmt, nullptr) != SQLITE_OK) {
        setError("Failed to query inversion run");
        return false;
    }
    sqlite3_bind_int64(stmt, 1, run_id);

    bool found = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        KernelConfig k;
        if (stringToTemporalKernel(columnText(stmt, 0), k.temporal) &&
            stringToSpatialKernel(columnText(stmt, 1), k.spatial)) {
            Parameters p;
            for (int i = 0; i < PARAM_COUNT; i++) {
                p.set(static_cast<Param>(i), sqlite3_column_double(stmt, 2 + i));
            }
            params = p;
            kernels = k;
            found = true;
        } else {
            last_error_ = "Unknown kernel names in run " + std::to_string(run_id);
        }
    } else {
        last_error_ = "No inversion run with id " + std::to_string(run_id);
    }

    sqlite3_finalize(stmt);
    return found;
}

bool CatalogDatabase::loadBackgroundField(int64_t run_id, BackgroundField& field,
                                          const BackgroundOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) return false;

    sqlite3_stmt* stmt;

    // Region of the inverted catalog
    std::vector<Point2D> vertices;
    if (sqlite3_prepare_v2(db_,
            "SELECT v.x, v.y FROM region_vertex v "
            "JOIN inversion_run r ON r.catalog_id = v.catalog_id "
            "WHERE r.run_id = ? ORDER BY v.seq",
            -1, &stmt, nullptr) != SQLITE_OK) {
        setError("Failed to query region");
        return false;
    }
    sqlite3_bind_int64(stmt, 1, run_id);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        vertices.emplace_back(sqlite3_column_double(stmt, 0), sqlite3_column_double(stmt, 1));
    }
    sqlite3_finalize(stmt);

    if (vertices.size() < 3) {
        last_error_ = "No region stored for run " + std::to_string(run_id);
        return false;
    }
    Region region(vertices);

    std::vector<Point2D> sources;
    std::vector<double> weights;
    std::vector<double> bandwidths;
    if (sqlite3_prepare_v2(db_,
            "SELECT x, y, weight, bandwidth FROM background_source "
            "WHERE run_id = ? ORDER BY seq",
            -1, &stmt, nullptr) != SQLITE_OK) {
        setError("Failed to query background sources");
        return false;
    }
    sqlite3_bind_int64(stmt, 1, run_id);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        sources.emplace_back(sqlite3_column_double(stmt, 0), sqlite3_column_double(stmt, 1));
        weights.push_back(sqlite3_column_double(stmt, 2));
        bandwidths.push_back(sqlite3_column_double(stmt, 3));
    }
    sqlite3_finalize(stmt);

    if (sources.empty()) {
        field = BackgroundField::uniform(region);
        return true;
    }

    try {
        field = BackgroundField::estimate(sources, weights, bandwidths, region, options);
    } catch (const DataError& e) {
        last_error_ = std::string("Stored background field is invalid: ") + e.what();
        return false;
    }
    return true;
}

std::vector<schema::CatalogRow> CatalogDatabase::queryCatalogs(const std::string& kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<schema::CatalogRow> results;

    if (!db_) return results;

    std::string sql = "SELECT catalog_id, name, kind, realization, mc, delta_m, "
                      "t_aux, t_start, t_end, nevents, lddate FROM catalog";
    if (!kind.empty()) sql += " WHERE kind = ?";
    sql += " ORDER BY catalog_id";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        setError("Failed to query catalogs");
        return results;
    }
    if (!kind.empty()) sqlite3_bind_text(stmt, 1, kind.c_str(), -1, SQLITE_TRANSIENT);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        schema::CatalogRow row;
        row.catalog_id = sqlite3_column_int64(stmt, 0);
        row.name = columnText(stmt, 1);
        row.kind = columnText(stmt, 2);
        row.realization = sqlite3_column_int64(stmt, 3);
        row.mc = sqlite3_column_double(stmt, 4);
        row.delta_m = sqlite3_column_double(stmt, 5);
        row.t_aux = sqlite3_column_double(stmt, 6);
        row.t_start = sqlite3_column_double(stmt, 7);
        row.t_end = sqlite3_column_double(stmt, 8);
        row.nevents = sqlite3_column_int64(stmt, 9);
        row.lddate = sqlite3_column_double(stmt, 10);
        results.push_back(row);
    }

    sqlite3_finalize(stmt);
    return results;
}

std::vector<schema::EventRow> CatalogDatabase::queryEvents(int64_t catalog_id,
                                                           double starttime, double endtime,
                                                           double minmag) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<schema::EventRow> results;

    if (!db_) return results;

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, R"(
            SELECT catalog_id, evid, time, x, y, depth, magnitude, parent, generation,
                   is_background, mc_current
            FROM event
            WHERE catalog_id = ?
            AND time BETWEEN ? AND ?
            AND magnitude >= ?
            ORDER BY time, evid
        )", -1, &stmt, nullptr) != SQLITE_OK) {
        setError("Failed to query events");
        return results;
    }

    sqlite3_bind_int64(stmt, 1, catalog_id);
    sqlite3_bind_double(stmt, 2, starttime);
    sqlite3_bind_double(stmt, 3, endtime);
    sqlite3_bind_double(stmt, 4, minmag);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        schema::EventRow row;
        row.catalog_id = sqlite3_column_int64(stmt, 0);
        row.evid = sqlite3_column_int64(stmt, 1);
        row.time = sqlite3_column_double(stmt, 2);
        row.x = sqlite3_column_double(stmt, 3);
        row.y = sqlite3_column_double(stmt, 4);
        row.depth = sqlite3_column_double(stmt, 5);
        row.magnitude = sqlite3_column_double(stmt, 6);
        row.parent = sqlite3_column_int64(stmt, 7);
        row.generation = sqlite3_column_int64(stmt, 8);
        row.is_background = sqlite3_column_int64(stmt, 9);
        if (sqlite3_column_type(stmt, 10) != SQLITE_NULL) {
            row.mc_current = sqlite3_column_double(stmt, 10);
        }
        results.push_back(row);
    }

    sqlite3_finalize(stmt);
    return results;
}

std::vector<schema::InversionRunRow> CatalogDatabase::queryInversionRuns(int64_t catalog_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<schema::InversionRunRow> results;

    if (!db_) return results;

    std::string sql = "SELECT run_id, catalog_id, temporal, spatial, state, "
                      "mu, k0, alpha, c, p, tau, d, gamma, q, b_value, branching_ratio, "
                      "log_likelihood, iterations, n_targets, expected_background, elapsed, lddate "
                      "FROM inversion_run";
    if (catalog_id >= 0) sql += " WHERE catalog_id = ?";
    sql += " ORDER BY run_id";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        setError("Failed to query inversion runs");
        return results;
    }
    if (catalog_id >= 0) sqlite3_bind_int64(stmt, 1, catalog_id);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        schema::InversionRunRow row;
        row.run_id = sqlite3_column_int64(stmt, 0);
        row.catalog_id = sqlite3_column_type(stmt, 1) == SQLITE_NULL
                             ? schema::NULL_INT : sqlite3_column_int64(stmt, 1);
        row.temporal = columnText(stmt, 2);
        row.spatial = columnText(stmt, 3);
        row.state = columnText(stmt, 4);
        row.mu = sqlite3_column_double(stmt, 5);
        row.k0 = sqlite3_column_double(stmt, 6);
        row.alpha = sqlite3_column_double(stmt, 7);
        row.c = sqlite3_column_double(stmt, 8);
        row.p = sqlite3_column_double(stmt, 9);
        row.tau = sqlite3_column_double(stmt, 10);
        row.d = sqlite3_column_double(stmt, 11);
        row.gamma = sqlite3_column_double(stmt, 12);
        row.q = sqlite3_column_double(stmt, 13);
        row.b_value = sqlite3_column_double(stmt, 14);
        row.branching_ratio = sqlite3_column_double(stmt, 15);
        row.log_likelihood = sqlite3_column_double(stmt, 16);
        row.iterations = sqlite3_column_int64(stmt, 17);
        row.n_targets = sqlite3_column_int64(stmt, 18);
        row.expected_background = sqlite3_column_double(stmt, 19);
        row.elapsed = sqlite3_column_double(stmt, 20);
        row.lddate = sqlite3_column_double(stmt, 21);
        results.push_back(row);
    }

    sqlite3_finalize(stmt);
    return results;
}

int64_t CatalogDatabase::latestInversionRun() const {
    int64_t latest = countQuery("SELECT MAX(run_id) FROM inversion_run");
    return latest > 0 ? latest : schema::NULL_INT;
}

int64_t CatalogDatabase::countCatalogs() const {
    return countQuery("SELECT COUNT(*) FROM catalog");
}

int64_t CatalogDatabase::countEvents(int64_t catalog_id) const {
    if (catalog_id >= 0) {
        return countQuery("SELECT COUNT(*) FROM event WHERE catalog_id = " +
                          std::to_string(catalog_id));
    }
    return countQuery("SELECT COUNT(*) FROM event");
}

int64_t CatalogDatabase::countInversionRuns() const {
    return countQuery("SELECT COUNT(*) FROM inversion_run");
}

void CatalogDatabase::beginTransaction() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        executeSQL("BEGIN TRANSACTION");
    }
}

void CatalogDatabase::commitTransaction() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        executeSQL("COMMIT");
    }
}

void CatalogDatabase::rollbackTransaction() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        executeSQL("ROLLBACK");
    }
}

int64_t CatalogDatabase::countQuery(const std::string& sql) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) return 0;

    sqlite3_stmt* stmt;
    int64_t count = 0;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_type(stmt, 0) != SQLITE_NULL) {
            count = sqlite3_column_int64(stmt, 0);
        }
        sqlite3_finalize(stmt);
    }

    return count;
}

bool CatalogDatabase::prepareStatements() {
    int rc;

    rc = sqlite3_prepare_v2(db_,
        "INSERT INTO catalog (name, kind, realization, mc, delta_m, t_aux, t_start, t_end, "
        "nevents, lddate) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        -1, &stmt_insert_catalog_, nullptr);
    if (rc != SQLITE_OK) return false;

    rc = sqlite3_prepare_v2(db_,
        "INSERT INTO region_vertex (catalog_id, seq, x, y) VALUES (?, ?, ?, ?)",
        -1, &stmt_insert_vertex_, nullptr);
    if (rc != SQLITE_OK) return false;

    rc = sqlite3_prepare_v2(db_,
        "INSERT INTO event (catalog_id, evid, time, x, y, depth, magnitude, parent, "
        "generation, is_background, mc_current) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        -1, &stmt_insert_event_, nullptr);
    if (rc != SQLITE_OK) return false;

    rc = sqlite3_prepare_v2(db_,
        "INSERT INTO inversion_run (catalog_id, temporal, spatial, state, "
        "mu, k0, alpha, c, p, tau, d, gamma, q, b_value, branching_ratio, log_likelihood, "
        "iterations, n_targets, expected_background, elapsed, lddate) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        -1, &stmt_insert_run_, nullptr);
    if (rc != SQLITE_OK) return false;

    rc = sqlite3_prepare_v2(db_,
        "INSERT INTO background_source (run_id, seq, x, y, weight, bandwidth) "
        "VALUES (?, ?, ?, ?, ?, ?)",
        -1, &stmt_insert_source_, nullptr);
    if (rc != SQLITE_OK) return false;

    return true;
}

void CatalogDatabase::finalizeStatements() {
    if (stmt_insert_catalog_) sqlite3_finalize(stmt_insert_catalog_);
    if (stmt_insert_vertex_) sqlite3_finalize(stmt_insert_vertex_);
    if (stmt_insert_event_) sqlite3_finalize(stmt_insert_event_);
    if (stmt_insert_run_) sqlite3_finalize(stmt_insert_run_);
    if (stmt_insert_source_) sqlite3_finalize(stmt_insert_source_);

    stmt_insert_catalog_ = nullptr;
    stmt_insert_vertex_ = nullptr;
    stmt_insert_event_ = nullptr;
    stmt_insert_run_ = nullptr;
    stmt_insert_source_ = nullptr;
}

double CatalogDatabase::currentLddate() const {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();
}

bool CatalogDatabase::executeSQL(const char* sql) {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        if (errmsg) {
            last_error_ = errmsg;
            sqlite3_free(errmsg);
        }
        return false;
    }
    return true;
}

void CatalogDatabase::setError(const std::string& context) {
    last_error_ = context + ": " + sqlite3_errmsg(db_);
    std::cerr << "CatalogDatabase error: " << last_error_ << std::endl;
}

} // namespace openetas
