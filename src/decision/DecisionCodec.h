#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "sync/Decision.h"
#include "sync/Proposal.h"

/**
 * @brief The proposal/decision document exchanged with decision sources.
 *
 * Session form, written for a human to edit:
 * {
 *   "instructions": "...",
 *   "items": [ { "proposal": {...}, "decision": { "proposal_id": "...", "outcome": "defer" } } ]
 * }
 *
 * Scripted form, accepted on input only:
 * { "decisions": [ { "proposal_id": "...", "outcome": "accept", "entity_id": "bug" } ] }
 */
namespace DecisionCodec {

    /** @brief Session document with every decision pre-filled as defer. */
    nlohmann::json encode(const std::vector<Proposal>& proposals);

    /**
     * @brief Extract decisions from either form.
     * @throws DecisionFormatError on malformed documents or decisions.
     */
    std::vector<Decision> decode(const nlohmann::json& doc);

    /**
     * @brief Read and decode a document from disk.
     * @throws DecisionFormatError if the file is unreadable or malformed.
     */
    std::vector<Decision> readFile(const std::string& path);

    void writeFile(const std::string& path, const nlohmann::json& doc);
}
