#include "engine/SyncEngine.h"
#include "cif/CifNormalizer.h"
#include "config/MergeResolver.h"
#include "core/Errors.h"
#include "sync/ChangeDetector.h"
#include "sync/ProposalGenerator.h"
#include "utils/Logger.h"

nlohmann::json DecisionReport::toJson() const {
    nlohmann::json j;
    j["proposal_id"] = proposalId;
    j["outcome"] = outcomeToString(outcome);
    j["implicit"] = implicit;
    j["ok"] = ok;
    if (!ok) {
        j["error"] = applyErrorToString(error);
        j["message"] = message;
    }
    return j;
}

size_t SyncReport::applied() const {
    size_t n = 0;
    for (const auto& d : decisions) {
        if (d.ok && !d.implicit && d.outcome != DecisionOutcome::Defer) ++n;
    }
    return n;
}

size_t SyncReport::failed() const {
    size_t n = 0;
    for (const auto& d : decisions) {
        if (!d.ok) ++n;
    }
    return n;
}

size_t SyncReport::deferred() const {
    size_t n = 0;
    for (const auto& d : decisions) {
        if (d.ok && d.outcome == DecisionOutcome::Defer) ++n;
    }
    return n;
}

nlohmann::json SyncReport::toJson() const {
    nlohmann::json j;
    j["projects"] = projects;
    j["observations"] = observations;
    j["tasks"] = tasks;
    j["changes"] = changes;
    nlohmann::json props = nlohmann::json::array();
    for (const auto& p : proposals) props.push_back(p.toJson());
    j["proposals"] = props;
    nlohmann::json decs = nlohmann::json::array();
    for (const auto& d : decisions) decs.push_back(d.toJson());
    j["decisions"] = decs;
    j["applied"] = applied();
    j["failed"] = failed();
    j["deferred"] = deferred();
    nlohmann::json failures = nlohmann::json::array();
    for (const auto& f : pluginFailures) {
        failures.push_back({{"plugin", f.plugin}, {"tool", f.tool}, {"project", f.projectId}, {"message", f.message}});
    }
    j["plugin_failures"] = failures;
    j["partial_projects"] = partialProjects;
    if (!decisionSourceError.empty()) {
        j["decision_source_error"] = decisionSourceError;
    }
    j["cancelled"] = cancelled;
    j["aborted"] = aborted;
    return j;
}

std::map<std::string, ProjectConfiguration> SyncEngine::loadProjects(const std::set<std::string>& extra) {
    std::set<std::string> ids(extra.begin(), extra.end());
    for (const auto& id : store.listProjects()) {
        ids.insert(id);
    }
    std::map<std::string, ProjectConfiguration> out;
    for (const auto& id : ids) {
        out.emplace(id, store.loadProject(id));
    }
    return out;
}

SyncEngine::Detection SyncEngine::detect(const std::set<std::string>& projects) {
    auto& logger = Logger::getInstance();

    Detection result;
    result.snapshot = discovery.run(projects);

    GlobalConfiguration global = store.loadGlobal();
    std::set<std::string> seen = result.snapshot.projects();
    seen.insert(projects.begin(), projects.end());
    auto configs = loadProjects(seen);

    result.changes = ChangeDetector().detect(result.snapshot, global, configs);
    for (const auto& change : result.changes.entries) {
        logger.info("Detected " + changeKindToString(change.kind) + " concept " + change.key().toString() +
                    " in " + std::to_string(change.affectedProjects.size()) + " project(s)");
    }

    result.proposals = ProposalGenerator(global.registry).generate(result.changes);
    return result;
}

SyncReport SyncEngine::sync(IDecisionSource& source, std::chrono::seconds timeout,
                            const std::set<std::string>& projects) {
    auto& logger = Logger::getInstance();
    SyncReport report;

    if (cancelled.load()) {
        report.cancelled = true;
        logger.warn("Sync cancelled before discovery");
        return report;
    }

    Detection detection = detect(projects);
    report.projects = detection.snapshot.projects();
    report.projects.insert(projects.begin(), projects.end());
    report.observations = detection.snapshot.observations.size();
    report.tasks = detection.snapshot.tasks.size();
    report.changes = detection.changes.entries.size();
    report.proposals = detection.proposals;
    report.pluginFailures = detection.snapshot.failures;
    report.partialProjects = detection.snapshot.partialProjects;

    if (detection.proposals.empty()) {
        logger.success("No semantic changes detected");
        return report;
    }

    for (const auto& p : detection.proposals) {
        std::string line = "Proposal " + p.id + " (" + changeKindToString(p.kind) + ")";
        if (p.suggestedEntityId) line += ", suggested entity '" + *p.suggestedEntityId + "'";
        if (p.previouslyDeferred) line += ", previously deferred";
        logger.info(line);
    }

    std::vector<Decision> decisions;
    try {
        decisions = source.collect(detection.proposals, timeout, cancelled);
    } catch (const DecisionFormatError& e) {
        report.decisionSourceError = e.what();
        logger.error(std::string("Decision source ") + source.getName() + " failed: " + e.what());
    } catch (const std::exception& e) {
        // Nothing was decided; every proposal stays open.
        report.decisionSourceError = e.what();
        logger.error(std::string("Decision source ") + source.getName() + " failed, deferring all proposals: " +
                     e.what());
    }

    applyDecisions(detection.proposals, decisions, report);

    logger.info("Sync finished: " + std::to_string(report.applied()) + " applied, " +
                std::to_string(report.failed()) + " failed, " + std::to_string(report.deferred()) + " deferred");
    return report;
}

void SyncEngine::applyDecisions(const std::vector<Proposal>& proposals, const std::vector<Decision>& decisions,
                                SyncReport& report) {
    auto& logger = Logger::getInstance();

    std::map<std::string, const Proposal*> byId;
    for (const auto& p : proposals) {
        byId[p.id] = &p;
    }

    std::map<std::string, const Decision*> chosen;
    for (const auto& d : decisions) {
        if (byId.count(d.proposalId) == 0) {
            DecisionReport r{d.proposalId, d.outcome, false, false, ApplyError::UnknownProposal,
                             "No open proposal with this id"};
            logger.warn("Decision for unknown proposal " + d.proposalId);
            report.decisions.push_back(r);
            continue;
        }
        if (!chosen.emplace(d.proposalId, &d).second) {
            DecisionReport r{d.proposalId, d.outcome, false, false, ApplyError::InvalidDecision,
                             "Duplicate decision, the first one is used"};
            logger.warn("Duplicate decision for " + d.proposalId);
            report.decisions.push_back(r);
        }
    }

    for (const auto& p : proposals) {
        auto it = chosen.find(p.id);
        if (it == chosen.end()) {
            report.decisions.push_back({p.id, DecisionOutcome::Defer, true, true, ApplyError::None, ""});
            continue;
        }
        const Decision& d = *it->second;

        if (report.aborted) {
            report.decisions.push_back({p.id, d.outcome, false, false, ApplyError::Cancelled,
                                        "Batch aborted after a global persistence failure"});
            continue;
        }
        if (cancelled.load()) {
            report.cancelled = true;
            report.decisions.push_back({p.id, d.outcome, false, false, ApplyError::Cancelled,
                                        "Sync cancelled"});
            continue;
        }

        ApplyResult result = applicator.apply(p, d);
        DecisionReport r{p.id, d.outcome, false, result.ok, result.error, result.message};
        report.decisions.push_back(r);
        if (!result.ok && result.globalFailure) {
            logger.error("Global configuration could not be written, aborting the batch");
            report.aborted = true;
        }
    }
}

std::vector<CifTask> SyncEngine::normalize(const std::string& projectId) {
    DiscoverySnapshot snapshot = discovery.run({projectId});
    for (const auto& failure : snapshot.failures) {
        Logger::getInstance().warn("Normalizing " + projectId + " with partial data: " + failure.message);
    }

    GlobalConfiguration global = store.loadGlobal();
    ProjectConfiguration project = store.loadProject(projectId);
    EffectiveMapping mapping(global, &project, projectId);

    std::vector<RawTask> tasks;
    for (auto& t : snapshot.tasks) {
        if (t.projectId == projectId) tasks.push_back(std::move(t));
    }
    return CifNormalizer().normalizeAll(tasks, mapping);
}

Resolution SyncEngine::resolve(const std::string& projectId, const std::string& tool,
                               const std::string& rawConceptId) {
    GlobalConfiguration global = store.loadGlobal();
    ProjectConfiguration project = store.loadProject(projectId);
    return MergeResolver::resolve(global, &project, projectId, MappingKey{tool, rawConceptId});
}
