#pragma once
#include <mutex>
#include <string>
#include "store/ConfigStore.h"

struct sqlite3;

/**
 * @brief ConfigStore backed by one SQLite database.
 *
 * Schema (append-only, one row per committed version):
 *   global_config(version PK, body, committed_at)
 *   project_config(project_id, version, body, committed_at, PK(project_id, version))
 *
 * Bodies are the records' JSON. Every commit runs inside BEGIN IMMEDIATE, so checks and
 * appends are atomic against other connections too. ":memory:" opens a private database.
 */
class SqliteConfigStore : public ConfigStore {
public:
    explicit SqliteConfigStore(const std::string& dbPath);
    ~SqliteConfigStore() override;

    SqliteConfigStore(const SqliteConfigStore&) = delete;
    SqliteConfigStore& operator=(const SqliteConfigStore&) = delete;

    GlobalConfiguration loadGlobal() override;
    std::optional<GlobalConfiguration> loadGlobalVersion(long long version) override;
    std::vector<long long> globalVersions() override;
    ProjectConfiguration loadProject(const std::string& projectId) override;
    std::vector<std::string> listProjects() override;
    CommitResult commit(const CommitRequest& request) override;

    const std::string& getPath() const { return dbPath; }

private:
    std::string dbPath;
    sqlite3* db = nullptr;
    std::mutex mtx;

    void initDb();
    void closeDb();
    void exec(const char* sql);
    void rollback();

    long long latestGlobalVersion();
    long long latestProjectVersion(const std::string& projectId);
    std::optional<GlobalConfiguration> readGlobal(long long version);
    void insertGlobal(long long version, const GlobalConfiguration& cfg);
    void insertProject(long long version, const ProjectConfiguration& cfg);
    CommitResult commitLocked(const CommitRequest& request);
};
