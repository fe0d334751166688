#include "decision/EditorDecisionSource.h"
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <thread>
#include <sys/wait.h>
#include <unistd.h>
#include "core/Errors.h"
#include "decision/DecisionCodec.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

std::string EditorDecisionSource::defaultEditor() {
    for (const char* var : {"VISUAL", "EDITOR"}) {
        const char* value = std::getenv(var);
        if (value && *value) return value;
    }
    return "vi";
}

std::string EditorDecisionSource::sessionFile() const {
    return (fs::path(sessionDir) / "decisions.json").string();
}

pid_t EditorDecisionSource::launch(const std::string& file) const {
    // Through the shell so editor settings like "code --wait" work.
    std::string command = editor + " \"$1\"";
    pid_t pid = fork();
    if (pid == 0) {
        execl("/bin/sh", "sh", "-c", command.c_str(), "uts-editor", file.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }
    return pid;
}

void EditorDecisionSource::terminate(pid_t pid) {
    kill(pid, SIGTERM);
    for (int i = 0; i < 20; ++i) {
        int status = 0;
        if (waitpid(pid, &status, WNOHANG) == pid) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    kill(pid, SIGKILL);
    int status = 0;
    waitpid(pid, &status, 0);
}

std::vector<Decision> EditorDecisionSource::collect(const std::vector<Proposal>& proposals,
                                                    std::chrono::seconds timeout,
                                                    const std::atomic<bool>& cancel) {
    auto& logger = Logger::getInstance();
    if (proposals.empty() || cancel.load()) return {};

    std::string file = sessionFile();
    try {
        DecisionCodec::writeFile(file, DecisionCodec::encode(proposals));
    } catch (const UtsError& e) {
        logger.error(std::string("Cannot prepare decision session, deferring all proposals: ") + e.what());
        return {};
    }
    logger.info("Waiting for decisions in " + file + " (" + editor + ")");

    pid_t pid = launch(file);
    if (pid < 0) {
        logger.error(std::string("Cannot start editor: ") + std::strerror(errno));
        return {};
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    int status = 0;
    while (true) {
        pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) break;
        if (done < 0 && errno != EINTR) {
            logger.error(std::string("Lost track of editor: ") + std::strerror(errno));
            return {};
        }
        if (cancel.load()) {
            logger.warn("Decision session cancelled, deferring all proposals");
            terminate(pid);
            return {};
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            logger.warn("Decision session timed out, deferring all proposals");
            terminate(pid);
            return {};
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        logger.warn("Editor exited abnormally, deferring all proposals");
        return {};
    }

    try {
        return DecisionCodec::readFile(file);
    } catch (const DecisionFormatError& e) {
        logger.error(std::string("Cannot read edited decisions, deferring all proposals: ") + e.what());
        return {};
    }
}
