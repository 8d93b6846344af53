// ============================================================
// options.cpp
// ============================================================

#include "options.hpp"
#include "../common/utils.hpp"
#include <cstring>
#include <ostream>

void print_usage(std::ostream& os, const char* prog) {
    os
        << "Usage: " << prog << " -d host1,host2,... -p /path/to/sync [options]\n"
        << "\n"
        << "Copies a file or directory from this host to every destination\n"
        << "with rsync over ssh. Each synced host copies to one new host per\n"
        << "round, so N hosts are covered in log2(N) rounds.\n"
        << "\nRequired:\n"
        << "  -d, --destinations LIST  comma separated list of destination hosts\n"
        << "  -p, --path PATH          source path to copy via rsync\n"
        << "\nOptions:\n"
        << "  -v, --verbose            enable debug logging\n"
        << "  --multiplier N           workers per hardware thread (default: "
        << DEFAULT_WORKER_MULTIPLIER << ")\n"
        << "  --timeout SECS           give up on a single copy after SECS (default: none)\n"
        << "  --source-host NAME       name of this host in the list (default: hostname)\n"
        << "  --ssh PATH               ssh client (default: " << DEFAULT_SSH_EXE << ")\n"
        << "  --rsync PATH             rsync client (default: " << DEFAULT_RSYNC_EXE << ")\n"
        << "  --log-file PATH          also append log lines to PATH\n"
        << "  -h, --help               show this help\n"
        << "\nA path ending in / or /* copies the directory contents into the same\n"
        << "path on each destination; otherwise the item is placed in its parent.\n"
        << "Every host must reach every other host over ssh without a password.\n"
        << "\nExamples:\n"
        << "  " << prog << " -d node1,node2,node3 -p /opt/data\n"
        << "  " << prog << " -d node1,node2 -p /opt/data/ --timeout 600 -v\n";
}

static bool is_opt(const char* arg, const char* short_name, const char* long_name) {
    return (short_name && std::strcmp(arg, short_name) == 0) ||
           std::strcmp(arg, long_name) == 0;
}

ParseResult parse_options(int argc, const char* const argv[],
                          AppOptions& out, std::string& error) {
    bool have_dest = false;
    bool have_path = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;

        if (is_opt(arg, "-h", "--help")) {
            return ParseResult::HELP;
        } else if (is_opt(arg, "-v", "--verbose")) {
            out.verbose = true;
        } else if (is_opt(arg, "-d", "--destinations") && has_value) {
            out.destinations = argv[++i];
            have_dest = true;
        } else if (is_opt(arg, "-p", "--path") && has_value) {
            out.path = argv[++i];
            have_path = true;
        } else if (is_opt(arg, nullptr, "--multiplier") && has_value) {
            if (!utils::parse_int(argv[++i], 1, MAX_WORKER_MULTIPLIER, out.multiplier)) {
                error = "--multiplier must be 1-" + std::to_string(MAX_WORKER_MULTIPLIER);
                return ParseResult::ERROR;
            }
        } else if (is_opt(arg, nullptr, "--timeout") && has_value) {
            if (!utils::parse_int(argv[++i], 0, 7 * 24 * 3600, out.timeout_secs)) {
                error = "--timeout must be a number of seconds (0 = none)";
                return ParseResult::ERROR;
            }
        } else if (is_opt(arg, nullptr, "--source-host") && has_value) {
            out.source_host = utils::trim(argv[++i]);
        } else if (is_opt(arg, nullptr, "--ssh") && has_value) {
            out.tools.ssh_exe = argv[++i];
        } else if (is_opt(arg, nullptr, "--rsync") && has_value) {
            out.tools.rsync_exe = argv[++i];
        } else if (is_opt(arg, nullptr, "--log-file") && has_value) {
            out.log_file = argv[++i];
        } else {
            error = std::string("Unknown option or missing value: ") + arg;
            return ParseResult::ERROR;
        }
    }

    if (!have_dest) {
        error = "-d/--destinations is required";
        return ParseResult::ERROR;
    }
    if (!have_path) {
        error = "-p/--path is required";
        return ParseResult::ERROR;
    }
    if (!utils::validate_path(out.path)) {
        error = "Invalid source path";
        return ParseResult::ERROR;
    }
    return ParseResult::OK;
}
