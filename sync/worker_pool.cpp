// ============================================================
// worker_pool.cpp
// ============================================================

#include "worker_pool.hpp"
#include <algorithm>
#include <stdexcept>

WorkerPool::WorkerPool(size_t num_workers, CopyPrimitive& copier, Logger& log)
    : copier_(copier)
    , log_(log)
{
    if (num_workers == 0) num_workers = 1;
    workers_.reserve(num_workers);
    try {
        for (size_t i = 0; i < num_workers; ++i) {
            workers_.emplace_back([this, i] { worker_loop(i); });
        }
    } catch (...) {
        // Release the threads that did start before reporting
        stop_workers();
        throw;
    }
    log_.debug("worker pool: started " + std::to_string(workers_.size()) + " workers");
}

WorkerPool::~WorkerPool() {
    if (!finished_) stop_workers();
}

size_t WorkerPool::size_for(size_t worker_limit, size_t pairs) {
    return std::max<size_t>(1, std::min(worker_limit, pairs));
}

void WorkerPool::submit(DispatchUnit unit) {
    if (finished_) {
        throw std::logic_error("WorkerPool::submit() after finish()");
    }
    queue_.put(Entry(std::move(unit)));
}

RoundResult WorkerPool::finish() {
    if (finished_) {
        throw std::logic_error("WorkerPool::finish() called twice");
    }
    stop_workers();
    finished_ = true;

    std::lock_guard<std::mutex> lk(result_mutex_);
    return result_;
}

void WorkerPool::stop_workers() {
    for (size_t i = 0; i < workers_.size(); ++i) {
        queue_.put(Entry());
    }
    queue_.join();
    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
}

void WorkerPool::worker_loop(size_t worker_id) {
    const std::string name = "worker " + std::to_string(worker_id);
    bool ok = true;

    for (;;) {
        Entry entry = queue_.get();
        if (!entry) {
            log_.debug(name + ": exiting...");
            queue_.task_done();
            break;
        }

        if (ok) {
            bool success = entry->run(copier_, log_);
            std::lock_guard<std::mutex> lk(result_mutex_);
            ++result_.executed;
            if (!success) {
                ok = false;
                ++result_.failed;
                result_.failed_pairs.emplace_back(entry->source_host(), entry->dest_host());
                log_.error(name + ": aborting tasks, failed to copy " + entry->label());
            }
        } else {
            log_.debug(name + ": skipping " + entry->label() + " after earlier failure");
            std::lock_guard<std::mutex> lk(result_mutex_);
            ++result_.skipped;
        }
        queue_.task_done();
    }
}
