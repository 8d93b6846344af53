#pragma once

// ============================================================
// copy_primitive.hpp -- One host-to-host copy
//   CopyPrimitive is the seam the scheduler talks to;
//   RsyncCopy runs "ssh <src> rsync -av <path> <dst>:<path>".
// ============================================================

#include "../common/platform.hpp"
#include "../common/process.hpp"
#include <string>
#include <vector>

static constexpr const char* DEFAULT_SSH_EXE   = "/usr/bin/ssh";
static constexpr const char* DEFAULT_RSYNC_EXE = "/usr/bin/rsync";

// Same shape as a finished child process: status 0 is success
using CopyResult = ProcessResult;

class CopyPrimitive {
public:
    virtual ~CopyPrimitive() = default;

    // Must be safe to call from several worker threads at once
    virtual CopyResult copy(const std::string& source_host,
                            const std::string& source_path,
                            const std::string& dest_host,
                            const std::string& dest_path) = 0;
};

struct Toolchain {
    std::string ssh_exe{DEFAULT_SSH_EXE};
    std::string rsync_exe{DEFAULT_RSYNC_EXE};

    // Throws std::runtime_error naming the first executable that is missing
    void check() const;
};

class RsyncCopy : public CopyPrimitive {
public:
    // timeout_secs <= 0: wait for each copy indefinitely
    explicit RsyncCopy(Toolchain tools, int timeout_secs = 0);

    CopyResult copy(const std::string& source_host,
                    const std::string& source_path,
                    const std::string& dest_host,
                    const std::string& dest_path) override;

    // Command line for one copy; paths are quoted for the remote shell
    std::vector<std::string> build_argv(const std::string& source_host,
                                        const std::string& source_path,
                                        const std::string& dest_host,
                                        const std::string& dest_path) const;

private:
    Toolchain tools_;
    int       timeout_secs_;
};
