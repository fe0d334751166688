#pragma once

class SyncEngine;

/**
 * @brief Routes SIGINT to the cancel flag of the engine currently running.
 *
 * The handler only loads an atomic pointer and sets the engine's atomic flag, both
 * lock-free. Decision collection and the apply loop observe the flag.
 */
namespace InterruptHandler {
    void install();

    /** @brief nullptr detaches; a later SIGINT is then ignored. */
    void setTarget(SyncEngine* engine);
}
