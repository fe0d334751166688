#include "sync/ProposalGenerator.h"
#include <algorithm>
#include <cctype>

std::vector<Proposal> ProposalGenerator::generate(const ChangeSet& changeSet) const {
    std::vector<Proposal> out;
    out.reserve(changeSet.entries.size());

    for (const auto& change : changeSet.entries) {
        Proposal p;
        p.id = Proposal::makeId(change.key());
        p.tool = change.entity.tool;
        p.rawConceptId = change.entity.rawConceptId;
        p.rawLabel = change.entity.rawLabel.empty() ? change.entity.rawConceptId : change.entity.rawLabel;
        p.kind = change.kind;
        p.candidateRole = change.roleHint;
        p.currentEntityId = change.currentEntityId;
        p.affectedProjects = change.affectedProjects;
        p.previouslyDeferred = change.previouslyDeferred;
        p.suggestedEntityId = suggestEntity(change);
        out.push_back(std::move(p));
    }
    return out;
}

std::string ProposalGenerator::canonicalLabel(const std::string& rawLabel) {
    std::string s = rawLabel;
    size_t colon = s.find(':');
    if (colon != std::string::npos && colon + 1 < s.size()) {
        s = s.substr(colon + 1);
    }
    while (!s.empty() && (s.front() == '+' || s.front() == '#' || s.front() == '@')) {
        s.erase(s.begin());
    }
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<std::string> ProposalGenerator::suggestEntity(const DetectedChange& change) const {
    if (change.kind == ChangeKind::Changed) {
        return std::nullopt;
    }
    std::string label = change.entity.rawLabel.empty() ? change.entity.rawConceptId : change.entity.rawLabel;
    std::string candidate = canonicalLabel(label);
    if (candidate.empty()) return std::nullopt;

    auto entity = registry.lookup(candidate);
    if (!entity) return std::nullopt;
    if (change.roleHint && *change.roleHint != entity->role) {
        return std::nullopt;
    }
    return entity->id;
}
