#pragma once

/**
 * OpenETAS result store schema
 *
 * Observed and synthetic catalogs, inversion runs with their parameters
 * and diagnostics, and the background field source table of each run.
 */

#include <string>
#include <cstdint>

namespace openetas {
namespace schema {

constexpr const char* SCHEMA_VERSION = "1.1";

constexpr int64_t NULL_INT = -1;
constexpr double NULL_DOUBLE = -999.0;

/**
 * CATALOG table - One observed or synthetic catalog
 */
struct CatalogRow {
    int64_t catalog_id;
    std::string name;
    std::string kind;       // "observed" | "synthetic"
    int64_t realization;    // ensemble index, -1 for observed
    double mc;
    double delta_m;
    double t_aux;
    double t_start;
    double t_end;
    int64_t nevents;
    double lddate;

    CatalogRow() : catalog_id(NULL_INT), kind("observed"), realization(NULL_INT),
                   mc(NULL_DOUBLE), delta_m(0), t_aux(0), t_start(0), t_end(0),
                   nevents(0), lddate(0) {}

    static constexpr const char* CREATE_SQL = R"(
        CREATE TABLE IF NOT EXISTS catalog (
            catalog_id  INTEGER PRIMARY KEY,
            name        TEXT,
            kind        TEXT DEFAULT 'observed',
            realization INTEGER DEFAULT -1,
            mc          REAL NOT NULL,
            delta_m     REAL DEFAULT 0,
            t_aux       REAL NOT NULL,
            t_start     REAL NOT NULL,
            t_end       REAL NOT NULL,
            nevents     INTEGER DEFAULT 0,
            lddate      REAL
        )
    )";
};

/**
 * REGION_VERTEX table - Polygon of a catalog, in vertex order
 */
struct RegionVertexRow {
    int64_t catalog_id;
    int64_t seq;
    double x;
    double y;

    static constexpr const char* CREATE_SQL = R"(
        CREATE TABLE IF NOT EXISTS region_vertex (
            catalog_id  INTEGER NOT NULL REFERENCES catalog(catalog_id) ON DELETE CASCADE,
            seq         INTEGER NOT NULL,
            x           REAL NOT NULL,
            y           REAL NOT NULL,
            PRIMARY KEY (catalog_id, seq)
        )
    )";
};

/**
 * EVENT table - Catalog entries; parent links for synthetic catalogs
 */
struct EventRow {
    int64_t catalog_id;
    int64_t evid;
    double time;
    double x;
    double y;
    double depth;
    double magnitude;
    double mc_current;      // NULL_DOUBLE when the catalog mc applies
    int64_t parent;         // evid of the triggering event, -1 if none
    int64_t generation;
    int64_t is_background;

    EventRow() : catalog_id(NULL_INT), evid(NULL_INT), time(0), x(0), y(0),
                 depth(0), magnitude(0), mc_current(NULL_DOUBLE), parent(NULL_INT),
                 generation(0), is_background(1) {}

    static constexpr const char* CREATE_SQL = R"(
        CREATE TABLE IF NOT EXISTS event (
            catalog_id    INTEGER NOT NULL REFERENCES catalog(catalog_id) ON DELETE CASCADE,
            evid          INTEGER NOT NULL,
            time          REAL NOT NULL,
            x             REAL NOT NULL,
            y             REAL NOT NULL,
            depth         REAL DEFAULT 0,
            magnitude     REAL NOT NULL,
            mc_current    REAL,
            parent        INTEGER DEFAULT -1,
            generation    INTEGER DEFAULT 0,
            is_background INTEGER DEFAULT 1,
            PRIMARY KEY (catalog_id, evid)
        )
    )";
};

/**
 * INVERSION_RUN table - Parameters and diagnostics of one inversion
 */
struct InversionRunRow {
    int64_t run_id;
    int64_t catalog_id;
    std::string temporal;
    std::string spatial;
    std::string state;
    double mu, k0, alpha, c, p, tau, d, gamma, q;
    double b_value;
    double branching_ratio;
    double log_likelihood;
    int64_t iterations;
    int64_t n_targets;
    double expected_background;
    double elapsed;
    double lddate;

    static constexpr const char* CREATE_SQL = R"(
        CREATE TABLE IF NOT EXISTS inversion_run (
            run_id              INTEGER PRIMARY KEY,
            catalog_id          INTEGER REFERENCES catalog(catalog_id),
            temporal            TEXT NOT NULL,
            spatial             TEXT NOT NULL,
            state               TEXT NOT NULL,
            mu                  REAL, k0 REAL, alpha REAL, c REAL, p REAL,
            tau                 REAL, d REAL, gamma REAL, q REAL,
            b_value             REAL,
            branching_ratio     REAL,
            log_likelihood      REAL,
            iterations          INTEGER,
            n_targets           INTEGER,
            expected_background REAL,
            elapsed             REAL,
            lddate              REAL
        )
    )";
};

/**
 * BACKGROUND_SOURCE table - Kernel sources of a run's background field
 */
struct BackgroundSourceRow {
    int64_t run_id;
    int64_t seq;
    double x;
    double y;
    double weight;
    double bandwidth;

    static constexpr const char* CREATE_SQL = R"(
        CREATE TABLE IF NOT EXISTS background_source (
            run_id      INTEGER NOT NULL REFERENCES inversion_run(run_id) ON DELETE CASCADE,
            seq         INTEGER NOT NULL,
            x           REAL NOT NULL,
            y           REAL NOT NULL,
            weight      REAL NOT NULL,
            bandwidth   REAL NOT NULL,
            PRIMARY KEY (run_id, seq)
        )
    )";
};

constexpr const char* CREATE_INDICES_SQL = R"(
    CREATE INDEX IF NOT EXISTS event_time_idx ON event(catalog_id, time);
    CREATE INDEX IF NOT EXISTS event_mag_idx ON event(catalog_id, magnitude);
    CREATE INDEX IF NOT EXISTS run_catalog_idx ON inversion_run(catalog_id);
)";

} // namespace schema
} // namespace openetas
