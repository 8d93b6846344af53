// ============================================================
// sync_orchestrator.cpp
// ============================================================

#include "sync_orchestrator.hpp"
#include "../common/utils.hpp"
#include <stdexcept>

const char* sync_status_str(SyncStatus s) {
    switch (s) {
        case SyncStatus::DONE:    return "done";
        case SyncStatus::FAILED:  return "failed";
        case SyncStatus::ABORTED: return "aborted";
    }
    return "unknown";
}

SyncOrchestrator::SyncOrchestrator(const HostRoster& roster,
                                   TransferPaths paths,
                                   size_t worker_limit,
                                   CopyPrimitive& copier,
                                   Logger& log)
    : roster_(roster)
    , paths_(std::move(paths))
    , worker_limit_(worker_limit > 0 ? worker_limit : 1)
    , copier_(copier)
    , log_(log)
{
}

SyncReport SyncOrchestrator::run() {
    u64 start_ms = utils::now_ms();
    const size_t total = roster_.size();

    SyncReport report;
    report.hosts_total  = total;
    report.hosts_synced = 1;

    log_.debug("source path: " + paths_.source);
    log_.debug("destination path: " + paths_.dest);
    log_.info("syncing " + std::to_string(total - 1) + " destination host(s) from " +
              roster_.source() + " using up to " + std::to_string(worker_limit_) +
              " workers per round");

    SyncState state;
    while (round_planner::remaining(state, total) > 0) {
        if (stop_.load()) {
            log_.warn("stop requested, not starting round " +
                      std::to_string(state.iteration + 1));
            report.status = SyncStatus::ABORTED;
            break;
        }

        size_t before = state.hosts_copied_to;
        auto pairs = round_planner::plan(state, total);
        if (pairs.empty()) {
            throw std::logic_error("round planner scheduled no copies with " +
                                   std::to_string(total - before) +
                                   " host(s) left (step " +
                                   std::to_string(state.step_size) + ")");
        }

        RoundRecord record;
        record.iteration = state.iteration + 1;
        log_.info("iteration " + std::to_string(record.iteration) +
                  ", copies required: " + std::to_string(pairs.size()));

        record.result = dispatch(pairs, record);
        report.hosts_synced += record.result.executed - record.result.failed;
        report.rounds.push_back(record);

        if (!record.result.ok()) {
            for (auto& fp : record.result.failed_pairs) {
                log_.error("copy failed: " + fp.first + " -> " + fp.second);
            }
            report.failed_pairs = record.result.failed_pairs;
            report.status = SyncStatus::FAILED;
            break;
        }
        round_planner::advance(state);
    }

    report.elapsed_ms = utils::now_ms() - start_ms;
    std::string summary = std::to_string(report.hosts_synced) + "/" +
                          std::to_string(total) + " hosts synced in " +
                          std::to_string(report.rounds.size()) + " round(s), " +
                          utils::format_duration_s(report.elapsed_ms / 1000);
    if (report.ok()) {
        log_.info("done: " + summary);
    } else {
        log_.error(std::string(sync_status_str(report.status)) + ": " + summary);
    }
    return report;
}

RoundResult SyncOrchestrator::dispatch(const std::vector<PlannedPair>& pairs,
                                       RoundRecord& record) {
    WorkerPool pool(WorkerPool::size_for(worker_limit_, pairs.size()), copier_, log_);
    log_.debug("using " + std::to_string(pool.size()) + " workers");

    for (const auto& p : pairs) {
        const std::string& src = roster_.at(p.source);
        const std::string& dst = roster_.at(p.dest);
        log_.debug(src + " copies to " + dst);
        record.pairs.emplace_back(src, dst);
        pool.submit(DispatchUnit(src, dst, paths_.source, paths_.dest));
    }
    return pool.finish();
}
