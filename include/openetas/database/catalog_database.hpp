#pragma once

/**
 * Catalog Database Interface
 *
 * SQLite storage for observed and synthetic catalogs, inversion results
 * and background fields.
 */

#include "catalog_schema.hpp"
#include "../core/event.hpp"
#include "../kernel/parameters.hpp"
#include "../background/background_field.hpp"
#include "../inversion/etas_inversion.hpp"
#include "../simulation/etas_simulator.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Forward declare sqlite3 types
struct sqlite3;
struct sqlite3_stmt;

namespace openetas {

/**
 * CatalogDatabase - SQLite result store
 *
 * Methods report failure through their return value (-1 ids, false) and
 * keep the SQLite message in lastError().
 */
class CatalogDatabase {
public:
    CatalogDatabase();
    ~CatalogDatabase();

    // Prevent copying
    CatalogDatabase(const CatalogDatabase&) = delete;
    CatalogDatabase& operator=(const CatalogDatabase&) = delete;

    // Connection management; open() creates missing tables
    bool open(const std::string& filename);
    bool isOpen() const { return db_ != nullptr; }
    void close();

    // Schema management
    bool createSchema();
    bool dropSchema();
    std::string schemaVersion() const;

    // Storage
    int64_t storeCatalog(const Catalog& catalog, const std::string& name,
                         const std::string& kind = "observed",
                         int64_t realization = schema::NULL_INT);
    int64_t storeSimulation(const SimulationResult& result, const std::string& name,
                            int64_t realization = schema::NULL_INT);
    int64_t storeInversion(const InversionResult& result, int64_t catalog_id);

    // Loading
    bool loadCatalog(int64_t catalog_id, Catalog& catalog);
    bool loadParameters(int64_t run_id, Parameters& params, KernelConfig& kernels);
    bool loadBackgroundField(int64_t run_id, BackgroundField& field,
                             const BackgroundOptions& options = BackgroundOptions());

    // Queries
    std::vector<schema::CatalogRow> queryCatalogs(const std::string& kind = "");
    std::vector<schema::EventRow> queryEvents(int64_t catalog_id,
                                              double starttime = -1e300,
                                              double endtime = 1e300,
                                              double minmag = -10);
    std::vector<schema::InversionRunRow> queryInversionRuns(int64_t catalog_id = schema::NULL_INT);
    int64_t latestInversionRun() const;

    // Statistics
    int64_t countCatalogs() const;
    int64_t countEvents(int64_t catalog_id = schema::NULL_INT) const;
    int64_t countInversionRuns() const;

    // Transaction support
    void beginTransaction();
    void commitTransaction();
    void rollbackTransaction();

    // Last error message
    std::string lastError() const { return last_error_; }

private:
    sqlite3* db_;
    std::string last_error_;
    mutable std::mutex mutex_;

    // Prepared statements
    sqlite3_stmt* stmt_insert_catalog_;
    sqlite3_stmt* stmt_insert_vertex_;
    sqlite3_stmt* stmt_insert_event_;
    sqlite3_stmt* stmt_insert_run_;
    sqlite3_stmt* stmt_insert_source_;

    // Internal helpers
    bool prepareStatements();
    void finalizeStatements();
    double currentLddate() const;
    bool executeSQL(const char* sql);
    void setError(const std::string& context);
    int64_t countQuery(const std::string& sql) const;

    // Unlocked parts of the store operations
    int64_t insertCatalog(const Catalog& catalog, const std::string& name,
                          const std::string& kind, int64_t realization);
    bool insertEvent(int64_t catalog_id, const Event& event, int64_t parent,
                     int generation, bool is_background);
};

} // namespace openetas
