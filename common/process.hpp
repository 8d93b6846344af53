#pragma once

// ============================================================
// process.hpp -- Run an external program, capture its output
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>

// Exit status reported when the child was stopped by the timeout
static constexpr int PROCESS_TIMEOUT_STATUS = 124;
// Exit status of a child whose execv() failed
static constexpr int PROCESS_EXEC_FAILED_STATUS = 127;

struct ProcessResult {
    int         exit_status{-1};  // 128+N when killed by signal N
    std::string out;
    std::string err;
    bool        timed_out{false};

    bool ok() const { return exit_status == 0; }
};

namespace process {

// Run argv[0] (absolute path, no PATH search) with argv as arguments.
// stdin is /dev/null; stdout and stderr are captured separately.
// timeout_secs <= 0 waits indefinitely; on expiry the child gets
// SIGTERM, then SIGKILL after a grace period.
// Throws std::runtime_error if the child could not be started.
ProcessResult run(const std::vector<std::string>& argv, int timeout_secs = 0);

} // namespace process
