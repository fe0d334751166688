#include "sync/DecisionApplicator.h"
#include <ctime>
#include "core/Errors.h"
#include "utils/Logger.h"

std::string applyErrorToString(ApplyError error) {
    switch (error) {
        case ApplyError::None: return "None";
        case ApplyError::RoleConflict: return "RoleConflict";
        case ApplyError::ConfigConflict: return "ConfigConflict";
        case ApplyError::UnknownEntity: return "UnknownEntity";
        case ApplyError::UnknownProposal: return "UnknownProposal";
        case ApplyError::AlreadyDecided: return "AlreadyDecided";
        case ApplyError::InvalidDecision: return "InvalidDecision";
        case ApplyError::PersistenceError: return "PersistenceError";
        case ApplyError::Cancelled: return "Cancelled";
    }
    return "None";
}

namespace {
    std::optional<ApplyResult> fromCommit(const CommitResult& commit) {
        switch (commit.status) {
            case CommitStatus::Committed: {
                ApplyResult r;
                r.committedGlobalVersion = commit.globalVersion;
                r.committedProjectVersions = commit.projectVersions;
                return r;
            }
            case CommitStatus::VersionConflict:
                return std::nullopt;
            case CommitStatus::AdditivityViolation:
                return ApplyResult::failure(ApplyError::ConfigConflict, commit.message);
        }
        return std::nullopt;
    }

    std::string describeCommit(const ApplyResult& r) {
        std::string s;
        if (r.committedGlobalVersion > 0) {
            s += "global v" + std::to_string(r.committedGlobalVersion);
        }
        for (const auto& [project, version] : r.committedProjectVersions) {
            if (!s.empty()) s += ", ";
            s += project + " v" + std::to_string(version);
        }
        return s.empty() ? "unchanged" : s;
    }
}

ApplyResult DecisionApplicator::apply(const Proposal& proposal, const Decision& decision) {
    auto& logger = Logger::getInstance();

    if (decision.proposalId != proposal.id) {
        return ApplyResult::failure(ApplyError::UnknownProposal,
                                    "Decision for '" + decision.proposalId + "' does not answer proposal '" +
                                    proposal.id + "'");
    }

    std::set<std::string> targets;
    if (decision.projects.empty()) {
        targets = proposal.affectedProjects;
    } else {
        for (const auto& project : decision.projects) {
            if (proposal.affectedProjects.count(project) == 0) {
                return ApplyResult::failure(ApplyError::InvalidDecision,
                                            "Project '" + project + "' is not affected by " + proposal.id);
            }
            targets.insert(project);
        }
    }
    if (targets.empty()) {
        return ApplyResult::failure(ApplyError::InvalidDecision, "No project to apply " + proposal.id + " to");
    }
    if (decision.outcome == DecisionOutcome::Accept && decision.entityId.empty()) {
        return ApplyResult::failure(ApplyError::InvalidDecision, "Accept without an entity id");
    }
    if (decision.outcome == DecisionOutcome::CreateNew && (!decision.newEntity || decision.newEntity->id.empty())) {
        return ApplyResult::failure(ApplyError::InvalidDecision, "CreateNew without an entity");
    }

    bool touchesGlobal = decision.outcome == DecisionOutcome::CreateNew;
    LockTable::Guard guard = locks.acquire(targets, touchesGlobal);

    try {
        std::optional<ApplyResult> result = attempt(proposal, decision, targets);
        if (!result) {
            logger.warn("Configuration changed while applying " + proposal.id + ", retrying");
            result = attempt(proposal, decision, targets);
        }
        if (!result) {
            result = ApplyResult::failure(ApplyError::ConfigConflict,
                                          "Concurrent modification while applying " + proposal.id);
        }
        if (result->ok) {
            logger.success("Applied " + outcomeToString(decision.outcome) + " for " + proposal.id +
                           " (" + describeCommit(*result) + ")");
        } else {
            logger.warn("Rejected " + outcomeToString(decision.outcome) + " for " + proposal.id + ": " +
                        applyErrorToString(result->error) + " - " + result->message);
        }
        return *result;
    } catch (const PersistenceError& e) {
        logger.error("Persistence failure applying " + proposal.id + ": " + e.what());
        ApplyResult r = ApplyResult::failure(ApplyError::PersistenceError, e.what());
        r.globalFailure = touchesGlobal;
        return r;
    }
}

std::optional<ApplyResult> DecisionApplicator::attempt(const Proposal& proposal, const Decision& decision,
                                                       const std::set<std::string>& projects) {
    Decision recorded = decision;
    recorded.tool = proposal.tool;
    recorded.rawConceptId = proposal.rawConceptId;
    recorded.projects.assign(projects.begin(), projects.end());
    if (recorded.decidedAt == 0) {
        recorded.decidedAt = std::time(nullptr);
    }

    CommitRequest request;

    if (decision.outcome == DecisionOutcome::Accept) {
        GlobalConfiguration global = store.loadGlobal();
        auto entity = global.registry.lookup(decision.entityId);
        if (!entity) {
            return ApplyResult::failure(ApplyError::UnknownEntity, "Unknown entity '" + decision.entityId + "'");
        }
        if (proposal.candidateRole && *proposal.candidateRole != entity->role) {
            return ApplyResult::failure(ApplyError::RoleConflict,
                                        "Entity '" + entity->id + "' has role " + roleToString(entity->role) +
                                        ", concept is used as " + roleToString(*proposal.candidateRole));
        }
    } else if (decision.outcome == DecisionOutcome::CreateNew) {
        GlobalConfiguration global = store.loadGlobal();
        const SemanticEntity& entity = *decision.newEntity;
        auto existing = global.registry.lookup(entity.id);
        if (existing) {
            if (existing->role != entity.role) {
                return ApplyResult::failure(ApplyError::RoleConflict,
                                            "Entity '" + entity.id + "' already exists with role " +
                                            roleToString(existing->role));
            }
            return ApplyResult::failure(ApplyError::ConfigConflict,
                                        "Entity '" + entity.id + "' is already registered");
        }
        RegisterResult reg = global.registry.registerEntity(entity);
        if (!reg.ok) {
            return ApplyResult::failure(ApplyError::RoleConflict, reg.error);
        }
        request.global = global;
    }

    MappingKey key = proposal.key();
    std::optional<MappingTarget> target = recorded.target();
    for (const auto& projectId : projects) {
        ProjectConfiguration project = store.loadProject(projectId);
        if (decision.outcome == DecisionOutcome::Defer) {
            // Repeating the latest entry would only grow the log.
            auto last = project.lastDecisionFor(key);
            if (last && last->outcome == DecisionOutcome::Defer) {
                continue;
            }
        }
        if (target) {
            auto current = project.overrideFor(key);
            if (current && proposal.kind == ChangeKind::New) {
                return ApplyResult::failure(ApplyError::AlreadyDecided,
                                            "Project '" + projectId + "' already decided " + proposal.id);
            }
            project.overrides[key] = *target;
        }
        project.decisions.push_back(recorded);
        request.projects.push_back(std::move(project));
    }

    if (!request.global && request.projects.empty()) {
        return ApplyResult{};
    }
    return fromCommit(store.commit(request));
}

ApplyResult DecisionApplicator::clearOverride(const std::string& projectId, const MappingKey& key) {
    auto& logger = Logger::getInstance();
    LockTable::Guard guard = locks.acquire({projectId}, false);
    try {
        std::optional<ApplyResult> result = attemptClear(projectId, key);
        if (!result) {
            result = attemptClear(projectId, key);
        }
        if (!result) {
            return ApplyResult::failure(ApplyError::ConfigConflict, "Concurrent modification of " + projectId);
        }
        if (result->ok) {
            logger.success("Cleared override " + key.toString() + " in " + projectId);
        }
        return *result;
    } catch (const PersistenceError& e) {
        logger.error("Persistence failure clearing " + key.toString() + ": " + e.what());
        return ApplyResult::failure(ApplyError::PersistenceError, e.what());
    }
}

std::optional<ApplyResult> DecisionApplicator::attemptClear(const std::string& projectId, const MappingKey& key) {
    ProjectConfiguration project = store.loadProject(projectId);
    if (!project.clearOverride(key)) {
        return ApplyResult::failure(ApplyError::InvalidDecision,
                                    "Project '" + projectId + "' has no override for " + key.toString());
    }
    CommitRequest request;
    request.projects.push_back(std::move(project));
    return fromCommit(store.commit(request));
}

ApplyResult DecisionApplicator::importVocabulary(const GlobalConfiguration& vocabulary) {
    auto& logger = Logger::getInstance();
    LockTable::Guard guard = locks.acquire({}, true);
    try {
        std::optional<ApplyResult> result = attemptImport(vocabulary);
        if (!result) {
            result = attemptImport(vocabulary);
        }
        if (!result) {
            return ApplyResult::failure(ApplyError::ConfigConflict, "Concurrent modification of global configuration");
        }
        if (!result->ok) {
            logger.warn("Vocabulary import rejected: " + result->message);
        } else if (result->committedGlobalVersion > 0) {
            logger.success("Vocabulary imported (global v" + std::to_string(result->committedGlobalVersion) + ")");
        } else {
            logger.info("Vocabulary already present, nothing imported");
        }
        return *result;
    } catch (const PersistenceError& e) {
        logger.error(std::string("Persistence failure importing vocabulary: ") + e.what());
        ApplyResult r = ApplyResult::failure(ApplyError::PersistenceError, e.what());
        r.globalFailure = true;
        return r;
    }
}

std::optional<ApplyResult> DecisionApplicator::attemptImport(const GlobalConfiguration& vocabulary) {
    GlobalConfiguration global = store.loadGlobal();
    bool changed = false;

    for (const auto& entity : vocabulary.registry.list()) {
        RegisterResult reg = global.registry.registerEntity(entity);
        if (!reg.ok) {
            return ApplyResult::failure(ApplyError::RoleConflict,
                                        "Entity '" + entity.id + "' would change role to " + roleToString(entity.role));
        }
        changed = changed || !reg.alreadyPresent;
    }
    for (const auto& [key, entityId] : vocabulary.defaultMappings) {
        if (!global.registry.contains(entityId)) {
            return ApplyResult::failure(ApplyError::UnknownEntity,
                                        "Default mapping " + key.toString() + " names unknown entity '" + entityId + "'");
        }
        bool present = global.defaultFor(key).has_value();
        if (!global.addDefaultMapping(key, entityId)) {
            return ApplyResult::failure(ApplyError::ConfigConflict,
                                        "Default mapping " + key.toString() + " already targets '" +
                                        *global.defaultFor(key) + "'");
        }
        changed = changed || !present;
    }

    if (!changed) {
        return ApplyResult{};
    }
    CommitRequest request;
    request.global = global;
    return fromCommit(store.commit(request));
}
