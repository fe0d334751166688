#include "engine/InterruptHandler.h"
#include <atomic>
#include <signal.h>
#include <cerrno>
#include <cstring>
#include <string>
#include "core/Errors.h"
#include "engine/SyncEngine.h"

namespace {
    std::atomic<SyncEngine*> target{nullptr};

    static_assert(std::atomic<SyncEngine*>::is_always_lock_free, "SIGINT handler needs a lock-free pointer");
    static_assert(std::atomic<bool>::is_always_lock_free, "SIGINT handler needs a lock-free flag");

    void onInterrupt(int) {
        SyncEngine* engine = target.load();
        if (engine) engine->cancel();
    }
}

namespace InterruptHandler {
    void install() {
        struct sigaction action;
        std::memset(&action, 0, sizeof(action));
        action.sa_handler = onInterrupt;
        sigemptyset(&action.sa_mask);
        if (sigaction(SIGINT, &action, nullptr) != 0) {
            throw UtsError(std::string("Cannot install SIGINT handler: ") + std::strerror(errno));
        }
    }

    void setTarget(SyncEngine* engine) {
        target.store(engine);
    }
}
