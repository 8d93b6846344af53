// ============================================================
// msync_app.cpp
// ============================================================

#include "msync_app.hpp"
#include "../sync/host_roster.hpp"
#include "../sync/source_path.hpp"

MsyncApp::MsyncApp(AppOptions opts, Logger& log)
    : opts_(std::move(opts))
    , log_(log)
{
}

void MsyncApp::stop() {
    stop_.store(true);
    SyncOrchestrator* orch = active_.load();
    if (orch) orch->stop();
}

int MsyncApp::run() {
    opts_.tools.check();

    std::string source_host = opts_.source_host.empty()
                            ? platform::local_hostname()
                            : opts_.source_host;
    log_.debug("our hostname: " + source_host);

    HostRoster roster = HostRoster::parse(source_host, opts_.destinations);
    std::string listing;
    for (auto& h : roster.hosts()) {
        if (!listing.empty()) listing += ", ";
        listing += h;
    }
    log_.debug("destinations: [" + listing + "]");

    TransferPaths paths = resolve_transfer_paths(opts_.path);

    size_t worker_limit = (size_t)platform::hardware_threads() * (size_t)opts_.multiplier;
    log_.info("using up to " + std::to_string(worker_limit) + " concurrent copies");

    RsyncCopy copier(opts_.tools, opts_.timeout_secs);
    SyncOrchestrator orch(roster, paths, worker_limit, copier, log_);

    active_.store(&orch);
    if (stop_.load()) orch.stop();
    SyncReport report;
    try {
        report = orch.run();
    } catch (...) {
        active_.store(nullptr);
        throw;
    }
    active_.store(nullptr);

    return report.ok() ? 0 : 1;
}
