#pragma once
#include <string>
#include <sys/types.h>
#include "decision/IDecisionSource.h"

/**
 * @brief Collects decisions by letting a human edit a session document.
 *
 * Writes <sessionDir>/decisions.json with every outcome pre-filled as defer, launches the
 * editor on it and parses the saved file once the editor exits. If the editor outlives
 * the timeout, or the run is cancelled, it is terminated and no decisions are returned
 * (everything resolves to Defer).
 */
class EditorDecisionSource : public IDecisionSource {
public:
    EditorDecisionSource(const std::string& editor, const std::string& sessionDir)
        : editor(editor), sessionDir(sessionDir) {}

    std::string getName() const override { return "editor:" + editor; }

    std::vector<Decision> collect(const std::vector<Proposal>& proposals,
                                  std::chrono::seconds timeout,
                                  const std::atomic<bool>& cancel) override;

    std::string sessionFile() const;

    /** @brief $VISUAL, then $EDITOR, then "vi". */
    static std::string defaultEditor();

private:
    std::string editor;
    std::string sessionDir;

    pid_t launch(const std::string& file) const;
    static void terminate(pid_t pid);
};
