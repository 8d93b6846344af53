// ============================================================
// copy_primitive.cpp -- rsync-over-ssh copier
// ============================================================

#include "copy_primitive.hpp"
#include "../common/utils.hpp"
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

static void check_exe(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || !platform::is_executable(path)) {
        throw std::runtime_error(path + " does not exist or is not executable");
    }
}

void Toolchain::check() const {
    check_exe(rsync_exe);
    check_exe(ssh_exe);
}

RsyncCopy::RsyncCopy(Toolchain tools, int timeout_secs)
    : tools_(std::move(tools))
    , timeout_secs_(timeout_secs > 0 ? timeout_secs : 0)
{
}

std::vector<std::string> RsyncCopy::build_argv(const std::string& source_host,
                                               const std::string& source_path,
                                               const std::string& dest_host,
                                               const std::string& dest_path) const {
    // ssh joins its trailing arguments into one remote shell command line
    return {
        tools_.ssh_exe,
        source_host,
        tools_.rsync_exe,
        "-av",
        utils::shell_quote(source_path),
        utils::shell_quote(dest_host + ":" + dest_path),
    };
}

CopyResult RsyncCopy::copy(const std::string& source_host,
                           const std::string& source_path,
                           const std::string& dest_host,
                           const std::string& dest_path) {
    return process::run(build_argv(source_host, source_path, dest_host, dest_path),
                        timeout_secs_);
}
