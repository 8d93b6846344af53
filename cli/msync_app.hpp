#pragma once

// ============================================================
// msync_app.hpp -- msync: startup checks, then the round loop
// ============================================================

#include "options.hpp"
#include "../common/logger.hpp"
#include "../sync/sync_orchestrator.hpp"
#include <atomic>

class MsyncApp {
public:
    MsyncApp(AppOptions opts, Logger& log);

    // Checks the toolchain, builds the roster and paths, runs the sync.
    // Returns 0 when every host was synced, 1 otherwise.
    // Startup problems are thrown as exceptions.
    int run();

    // Signal stop from a signal handler
    void stop();

private:
    AppOptions                      opts_;
    Logger&                         log_;
    std::atomic<bool>               stop_{false};
    std::atomic<SyncOrchestrator*>  active_{nullptr};
};
