#pragma once

// ============================================================
// sync_orchestrator.hpp -- Round loop
//
//   plan round -> fresh WorkerPool(min(limit, pairs)) -> submit
//   units -> finish (barrier) -> next round | failed | done
//
// A round starts only after the previous pool has fully drained,
// so no host is used as a source before its own copy finished.
// Any failed copy ends the run after the current round; nothing
// is retried or rolled back.
// ============================================================

#include "host_roster.hpp"
#include "round_planner.hpp"
#include "source_path.hpp"
#include "worker_pool.hpp"
#include "../common/logger.hpp"
#include <atomic>
#include <string>
#include <utility>
#include <vector>

enum class SyncStatus {
    DONE,
    FAILED,   // a pairwise copy failed
    ABORTED,  // stop() was requested between rounds
};

const char* sync_status_str(SyncStatus s);

struct RoundRecord {
    u32 iteration;  // 1-based
    std::vector<std::pair<std::string, std::string>> pairs; // (source, dest)
    RoundResult result;
};

struct SyncReport {
    SyncStatus               status{SyncStatus::DONE};
    size_t                   hosts_total{0};
    size_t                   hosts_synced{0};  // source included
    std::vector<RoundRecord> rounds;
    std::vector<std::pair<std::string, std::string>> failed_pairs;
    u64                      elapsed_ms{0};

    bool ok() const { return status == SyncStatus::DONE; }
};

class SyncOrchestrator {
public:
    // worker_limit: upper bound on concurrent copies per round
    SyncOrchestrator(const HostRoster& roster,
                     TransferPaths paths,
                     size_t worker_limit,
                     CopyPrimitive& copier,
                     Logger& log);

    // Runs rounds until every host is synced, a copy fails, or stop()
    // is seen between rounds. Throws std::logic_error if the planner
    // produces no work while hosts remain.
    SyncReport run();

    // Async-signal-safe; the running round still drains
    void stop() { stop_.store(true); }

private:
    RoundResult dispatch(const std::vector<PlannedPair>& pairs, RoundRecord& record);

    const HostRoster& roster_;
    TransferPaths     paths_;
    size_t            worker_limit_;
    CopyPrimitive&    copier_;
    Logger&           log_;
    std::atomic<bool> stop_{false};
};
