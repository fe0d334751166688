#include "sync/LockTable.h"

std::mutex& LockTable::projectMutex(const std::string& projectId) {
    std::lock_guard<std::mutex> lock(tableMtx);
    auto& slot = projectMutexes[projectId];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

LockTable::Guard LockTable::acquire(const std::set<std::string>& projectIds, bool global) {
    Guard guard;
    guard.locks.reserve(projectIds.size() + 1);
    for (const auto& id : projectIds) {
        guard.locks.emplace_back(projectMutex(id));
    }
    if (global) {
        guard.locks.emplace_back(globalMtx);
    }
    return guard;
}
