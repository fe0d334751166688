#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "config/GlobalConfiguration.h"
#include "config/ProjectConfiguration.h"

/**
 * @brief A set of records to append in one atomic step.
 *
 * Each record carries, in its `version` field, the version it was derived from. The store
 * appends it as version + 1 only if that is still the latest version (compare-and-append).
 */
struct CommitRequest {
    std::optional<GlobalConfiguration> global;
    std::vector<ProjectConfiguration> projects;
};

enum class CommitStatus {
    Committed,
    VersionConflict,      // someone appended since the record was read
    AdditivityViolation   // global record would drop or retype an entry
};

struct CommitResult {
    CommitStatus status = CommitStatus::Committed;
    long long globalVersion = 0;                       // new version, when a global record was written
    std::map<std::string, long long> projectVersions;  // new versions per project
    std::string message;

    bool ok() const { return status == CommitStatus::Committed; }
};

/**
 * @brief Versioned, append-only persistence for Global and Project Configuration.
 *
 * Implementations throw PersistenceError on storage failure and leave the last
 * committed state untouched.
 */
class ConfigStore {
public:
    virtual ~ConfigStore() = default;

    /** @brief Latest global record (version 0 and empty if none was committed). */
    virtual GlobalConfiguration loadGlobal() = 0;

    virtual std::optional<GlobalConfiguration> loadGlobalVersion(long long version) = 0;

    /** @brief Ascending list of committed global versions. */
    virtual std::vector<long long> globalVersions() = 0;

    /** @brief Latest record for a project (version 0 and empty if none). */
    virtual ProjectConfiguration loadProject(const std::string& projectId) = 0;

    virtual std::vector<std::string> listProjects() = 0;

    virtual CommitResult commit(const CommitRequest& request) = 0;
};
