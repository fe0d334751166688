#pragma once
#include <string>
#include "decision/IDecisionSource.h"

/**
 * @brief Reads scripted decisions from a JSON document (either codec form).
 *
 * Decisions for proposals that are not in the current batch are passed through; the
 * engine reports them as UnknownProposal.
 */
class FileDecisionSource : public IDecisionSource {
public:
    explicit FileDecisionSource(const std::string& path) : path(path) {}

    std::string getName() const override { return "file:" + path; }

    /** @throws DecisionFormatError if the document cannot be read. */
    std::vector<Decision> collect(const std::vector<Proposal>& proposals,
                                  std::chrono::seconds timeout,
                                  const std::atomic<bool>& cancel) override;

private:
    std::string path;
};
