#pragma once
#include "decision/IDecisionSource.h"

/**
 * @brief Answers every proposal with a configured default outcome.
 *
 * Only Defer and Ignore are allowed; a default that would map something is refused.
 */
class NonInteractiveDecisionSource : public IDecisionSource {
public:
    /** @throws ConfigError if @p outcome is Accept or CreateNew. */
    explicit NonInteractiveDecisionSource(DecisionOutcome outcome = DecisionOutcome::Defer);

    std::string getName() const override { return "non-interactive"; }

    std::vector<Decision> collect(const std::vector<Proposal>& proposals,
                                  std::chrono::seconds timeout,
                                  const std::atomic<bool>& cancel) override;

private:
    DecisionOutcome outcome;
};
