#include "decision/NonInteractiveDecisionSource.h"
#include "core/Errors.h"

NonInteractiveDecisionSource::NonInteractiveDecisionSource(DecisionOutcome outcome) : outcome(outcome) {
    if (outcome != DecisionOutcome::Defer && outcome != DecisionOutcome::Ignore) {
        throw ConfigError("Non-interactive default outcome must be defer or ignore, got " + outcomeToString(outcome));
    }
}

std::vector<Decision> NonInteractiveDecisionSource::collect(const std::vector<Proposal>& proposals,
                                                            std::chrono::seconds /*timeout*/,
                                                            const std::atomic<bool>& cancel) {
    std::vector<Decision> out;
    if (cancel.load()) return out;

    out.reserve(proposals.size());
    for (const auto& p : proposals) {
        if (outcome == DecisionOutcome::Ignore) {
            out.push_back(Decision::ignore(p.id));
        } else {
            out.push_back(Decision::defer(p.id, "non-interactive"));
        }
    }
    return out;
}
