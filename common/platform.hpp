#pragma once

// ============================================================
// platform.hpp -- POSIX host abstraction
// ============================================================

#include <string>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <thread>

#include <sys/types.h>
#include <unistd.h>
#include <errno.h>
#include <limits.h>

#ifndef HOST_NAME_MAX
#  define HOST_NAME_MAX 255
#endif

inline int last_os_error() { return errno; }

inline std::string os_error_str(int err) {
    return std::string(strerror(err)) + " (errno=" + std::to_string(err) + ")";
}

namespace platform {

// Name this machine reports for itself (uname nodename)
inline std::string local_hostname() {
    char buf[HOST_NAME_MAX + 1] = {0};
    if (::gethostname(buf, sizeof(buf) - 1) != 0) {
        throw std::runtime_error("gethostname() failed: " +
                                 os_error_str(last_os_error()));
    }
    return std::string(buf);
}

// Parallel execution units; never 0
inline unsigned hardware_threads() {
    unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 1u : n;
}

// True if path names a regular file this process may execute
inline bool is_executable(const std::string& path) {
    return !path.empty() && ::access(path.c_str(), X_OK) == 0;
}

} // namespace platform

// ---- Portable types ----
using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i8  = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;
