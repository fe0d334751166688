#include "decision/FileDecisionSource.h"
#include "decision/DecisionCodec.h"

std::vector<Decision> FileDecisionSource::collect(const std::vector<Proposal>& /*proposals*/,
                                                  std::chrono::seconds /*timeout*/,
                                                  const std::atomic<bool>& cancel) {
    if (cancel.load()) return {};
    return DecisionCodec::readFile(path);
}
