#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Exclusive locks on project configurations plus one process-wide global lock.
 *
 * Locks are always taken in sorted project-id order, then the global lock, so two
 * batches touching overlapping project sets cannot deadlock.
 */
class LockTable {
public:
    /** @brief Holds the acquired locks; releases them on destruction. */
    class Guard {
    public:
        Guard() = default;
        Guard(Guard&&) = default;
        Guard& operator=(Guard&&) = default;

    private:
        friend class LockTable;
        std::vector<std::unique_lock<std::mutex>> locks;
    };

    Guard acquire(const std::set<std::string>& projectIds, bool global);

private:
    std::mutex tableMtx;
    std::map<std::string, std::unique_ptr<std::mutex>> projectMutexes;
    std::mutex globalMtx;

    std::mutex& projectMutex(const std::string& projectId);
};
