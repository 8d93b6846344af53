// ============================================================
// cli/main.cpp -- msync entry point
// ============================================================

#include "../common/logger.hpp"
#include "msync_app.hpp"
#include "options.hpp"
#include <iostream>
#include <string>
#include <csignal>

static MsyncApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

int main(int argc, char* argv[]) {
    AppOptions opts;
    std::string error;

    switch (parse_options(argc, argv, opts, error)) {
        case ParseResult::HELP:
            print_usage(std::cout, argv[0]);
            return 0;
        case ParseResult::ERROR:
            std::cerr << "ERROR: " << error << "\n";
            print_usage(std::cerr, argv[0]);
            return 1;
        case ParseResult::OK:
            break;
    }

    Logger log(opts.verbose ? LogLevel::DEBUG : LogLevel::INFO);

    try {
        if (!opts.log_file.empty()) log.set_log_file(opts.log_file);

        MsyncApp app(std::move(opts), log);
        g_app = &app;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        int rc = app.run();
        g_app = nullptr;
        return rc;
    } catch (const std::exception& e) {
        g_app = nullptr;
        log.error(std::string("FATAL: ") + e.what());
        return 1;
    }
}
