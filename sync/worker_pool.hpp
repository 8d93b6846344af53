#pragma once

// ============================================================
// worker_pool.hpp -- Fixed set of worker threads for one round
//
// Workers take units from a shared TaskQueue until they get a
// sentinel (empty optional), one per worker. A worker that has
// seen a failed copy keeps acknowledging units without running
// them so the queue still drains and the pool can be joined.
// ============================================================

#include "dispatch_unit.hpp"
#include "../common/task_queue.hpp"
#include "../common/logger.hpp"
#include <vector>
#include <thread>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

struct RoundResult {
    size_t executed{0};  // units whose copy was attempted
    size_t failed{0};
    size_t skipped{0};   // acknowledged without running after a failure
    std::vector<std::pair<std::string, std::string>> failed_pairs; // (source, dest)

    bool ok() const { return failed == 0 && skipped == 0; }
};

class WorkerPool {
public:
    // Starts num_workers threads (at least 1)
    WorkerPool(size_t num_workers, CopyPrimitive& copier, Logger& log);
    ~WorkerPool();

    // Threads to start for a round: min(limit, pairs), at least 1
    static size_t size_for(size_t worker_limit, size_t pairs);

    void submit(DispatchUnit unit);

    // Enqueue one sentinel per worker, wait until every entry has been
    // acknowledged and every worker has exited. Call once.
    RoundResult finish();

    size_t size() const { return workers_.size(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

private:
    using Entry = std::optional<DispatchUnit>;

    void worker_loop(size_t worker_id);
    void stop_workers();

    CopyPrimitive&           copier_;
    Logger&                  log_;
    TaskQueue<Entry>         queue_;
    std::vector<std::thread> workers_;
    std::mutex               result_mutex_;
    RoundResult              result_;
    bool                     finished_{false};
};
