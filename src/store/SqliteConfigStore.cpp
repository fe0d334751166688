#include "store/SqliteConfigStore.h"
#include <sqlite3.h>
#include <ctime>
#include <filesystem>
#include <memory>
#include "core/Errors.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

namespace {
    using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

    StmtPtr prepare(sqlite3* db, const char* sql) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw PersistenceError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
        }
        return StmtPtr(stmt, &sqlite3_finalize);
    }

    void bindText(sqlite3* db, sqlite3_stmt* stmt, int index, const std::string& value) {
        if (sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
            throw PersistenceError(std::string("sqlite bind failed: ") + sqlite3_errmsg(db));
        }
    }

    std::string columnText(sqlite3_stmt* stmt, int col) {
        const unsigned char* text = sqlite3_column_text(stmt, col);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

    template <typename Record>
    Record decodeBody(const std::string& body, const std::string& what) {
        try {
            return Record::fromJson(nlohmann::json::parse(body));
        } catch (const nlohmann::json::exception& e) {
            throw PersistenceError("Corrupt " + what + " record: " + e.what());
        } catch (const UtsError& e) {
            throw PersistenceError("Corrupt " + what + " record: " + e.what());
        }
    }
}

SqliteConfigStore::SqliteConfigStore(const std::string& dbPath) : dbPath(dbPath) {
    initDb();
}

SqliteConfigStore::~SqliteConfigStore() {
    closeDb();
}

void SqliteConfigStore::initDb() {
    if (dbPath != ":memory:") {
        fs::path path(dbPath);
        if (path.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(path.parent_path(), ec);
            if (ec) {
                throw PersistenceError("Cannot create directory for " + dbPath + ": " + ec.message());
            }
        }
    }

    if (sqlite3_open(dbPath.c_str(), &db) != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        closeDb();
        throw PersistenceError("Cannot open config store " + dbPath + ": " + msg);
    }
    // Lock waits are bounded; a busy database surfaces as PersistenceError.
    sqlite3_busy_timeout(db, 5000);

    const char* createSql =
        "CREATE TABLE IF NOT EXISTS global_config ("
        "version INTEGER PRIMARY KEY,"
        "body TEXT NOT NULL,"
        "committed_at INTEGER NOT NULL"
        ");"
        "CREATE TABLE IF NOT EXISTS project_config ("
        "project_id TEXT NOT NULL,"
        "version INTEGER NOT NULL,"
        "body TEXT NOT NULL,"
        "committed_at INTEGER NOT NULL,"
        "PRIMARY KEY(project_id, version)"
        ");";
    try {
        exec(createSql);
        if (dbPath != ":memory:") {
            exec("PRAGMA journal_mode=WAL;");
        }
        exec("PRAGMA synchronous=FULL;");
    } catch (const PersistenceError&) {
        closeDb();
        throw;
    }
}

void SqliteConfigStore::closeDb() {
    if (db) {
        sqlite3_close(db);
        db = nullptr;
    }
}

void SqliteConfigStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db);
        sqlite3_free(err);
        throw PersistenceError("sqlite: " + msg);
    }
}

long long SqliteConfigStore::latestGlobalVersion() {
    auto stmt = prepare(db, "SELECT COALESCE(MAX(version), 0) FROM global_config;");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw PersistenceError(std::string("sqlite step failed: ") + sqlite3_errmsg(db));
    }
    return sqlite3_column_int64(stmt.get(), 0);
}

long long SqliteConfigStore::latestProjectVersion(const std::string& projectId) {
    auto stmt = prepare(db, "SELECT COALESCE(MAX(version), 0) FROM project_config WHERE project_id = ?;");
    bindText(db, stmt.get(), 1, projectId);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw PersistenceError(std::string("sqlite step failed: ") + sqlite3_errmsg(db));
    }
    return sqlite3_column_int64(stmt.get(), 0);
}

std::optional<GlobalConfiguration> SqliteConfigStore::readGlobal(long long version) {
    auto stmt = prepare(db, "SELECT body FROM global_config WHERE version = ?;");
    sqlite3_bind_int64(stmt.get(), 1, version);
    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        throw PersistenceError(std::string("sqlite step failed: ") + sqlite3_errmsg(db));
    }
    GlobalConfiguration cfg = decodeBody<GlobalConfiguration>(columnText(stmt.get(), 0), "global");
    cfg.version = version;
    return cfg;
}

GlobalConfiguration SqliteConfigStore::loadGlobal() {
    std::lock_guard<std::mutex> lock(mtx);
    long long latest = latestGlobalVersion();
    if (latest == 0) {
        return GlobalConfiguration{};
    }
    auto cfg = readGlobal(latest);
    return cfg ? *cfg : GlobalConfiguration{};
}

std::optional<GlobalConfiguration> SqliteConfigStore::loadGlobalVersion(long long version) {
    std::lock_guard<std::mutex> lock(mtx);
    return readGlobal(version);
}

std::vector<long long> SqliteConfigStore::globalVersions() {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<long long> versions;
    auto stmt = prepare(db, "SELECT version FROM global_config ORDER BY version ASC;");
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        versions.push_back(sqlite3_column_int64(stmt.get(), 0));
    }
    return versions;
}

ProjectConfiguration SqliteConfigStore::loadProject(const std::string& projectId) {
    std::lock_guard<std::mutex> lock(mtx);
    auto stmt = prepare(db,
        "SELECT version, body FROM project_config WHERE project_id = ? "
        "ORDER BY version DESC LIMIT 1;");
    bindText(db, stmt.get(), 1, projectId);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        ProjectConfiguration empty;
        empty.projectId = projectId;
        return empty;
    }
    if (rc != SQLITE_ROW) {
        throw PersistenceError(std::string("sqlite step failed: ") + sqlite3_errmsg(db));
    }
    ProjectConfiguration cfg = decodeBody<ProjectConfiguration>(columnText(stmt.get(), 1), "project " + projectId);
    cfg.projectId = projectId;
    cfg.version = sqlite3_column_int64(stmt.get(), 0);
    return cfg;
}

std::vector<std::string> SqliteConfigStore::listProjects() {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<std::string> ids;
    auto stmt = prepare(db, "SELECT DISTINCT project_id FROM project_config ORDER BY project_id ASC;");
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        ids.push_back(columnText(stmt.get(), 0));
    }
    return ids;
}

void SqliteConfigStore::insertGlobal(long long version, const GlobalConfiguration& cfg) {
    auto stmt = prepare(db, "INSERT INTO global_config (version, body, committed_at) VALUES (?, ?, ?);");
    sqlite3_bind_int64(stmt.get(), 1, version);
    bindText(db, stmt.get(), 2, cfg.toJson().dump());
    sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(std::time(nullptr)));
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw PersistenceError(std::string("global insert failed: ") + sqlite3_errmsg(db));
    }
}

void SqliteConfigStore::insertProject(long long version, const ProjectConfiguration& cfg) {
    auto stmt = prepare(db,
        "INSERT INTO project_config (project_id, version, body, committed_at) VALUES (?, ?, ?, ?);");
    bindText(db, stmt.get(), 1, cfg.projectId);
    sqlite3_bind_int64(stmt.get(), 2, version);
    bindText(db, stmt.get(), 3, cfg.toJson().dump());
    sqlite3_bind_int64(stmt.get(), 4, static_cast<sqlite3_int64>(std::time(nullptr)));
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw PersistenceError("project insert failed for " + cfg.projectId + ": " + sqlite3_errmsg(db));
    }
}

CommitResult SqliteConfigStore::commit(const CommitRequest& request) {
    std::lock_guard<std::mutex> lock(mtx);
    exec("BEGIN IMMEDIATE;");
    try {
        CommitResult result = commitLocked(request);
        if (result.ok()) {
            exec("COMMIT;");
        } else {
            exec("ROLLBACK;");
        }
        return result;
    } catch (const PersistenceError&) {
        rollback();
        throw;
    } catch (const std::exception& e) {
        rollback();
        throw PersistenceError(std::string("commit failed: ") + e.what());
    }
}

void SqliteConfigStore::rollback() {
    char* err = nullptr;
    if (sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
        Logger::getInstance().error(std::string("Rollback failed: ") + (err ? err : sqlite3_errmsg(db)));
        sqlite3_free(err);
    }
}

CommitResult SqliteConfigStore::commitLocked(const CommitRequest& request) {
    CommitResult result;

    if (request.global) {
        const GlobalConfiguration& next = *request.global;
        long long latest = latestGlobalVersion();
        if (latest != next.version) {
            result.status = CommitStatus::VersionConflict;
            result.message = "Global configuration moved from version " + std::to_string(next.version) +
                             " to " + std::to_string(latest);
            return result;
        }
        if (latest > 0) {
            auto prior = readGlobal(latest);
            if (prior && !next.isAdditiveSuccessorOf(*prior)) {
                result.status = CommitStatus::AdditivityViolation;
                result.message = "Global configuration record would remove or retype existing entries";
                return result;
            }
        }
        insertGlobal(latest + 1, next);
        result.globalVersion = latest + 1;
    }

    for (const auto& project : request.projects) {
        long long latest = latestProjectVersion(project.projectId);
        if (latest != project.version) {
            result.status = CommitStatus::VersionConflict;
            result.message = "Project " + project.projectId + " moved from version " +
                             std::to_string(project.version) + " to " + std::to_string(latest);
            result.globalVersion = 0;
            result.projectVersions.clear();
            return result;
        }
        insertProject(latest + 1, project);
        result.projectVersions[project.projectId] = latest + 1;
    }
    return result;
}
