#pragma once
#include <atomic>
#include <chrono>
#include <string>
#include <vector>
#include "sync/Decision.h"
#include "sync/Proposal.h"

/**
 * @brief Boundary to whoever answers proposals (a human in an editor, a script, a default).
 *
 * The engine hands over a batch of proposals and resumes with at most one decision per
 * proposal. Proposals left unanswered, and every proposal when the source times out or
 * observes @p cancel, are treated as Defer by the caller. Implementations must return
 * within roughly @p timeout.
 */
class IDecisionSource {
public:
    virtual ~IDecisionSource() = default;

    virtual std::string getName() const = 0;

    virtual std::vector<Decision> collect(const std::vector<Proposal>& proposals,
                                          std::chrono::seconds timeout,
                                          const std::atomic<bool>& cancel) = 0;
};
