#pragma once

// ============================================================
// dispatch_unit.hpp -- One pairwise copy, run exactly once
// ============================================================

#include "copy_primitive.hpp"
#include "../common/logger.hpp"
#include <string>

class DispatchUnit {
public:
    DispatchUnit(std::string source_host,
                 std::string dest_host,
                 std::string source_path,
                 std::string dest_path);

    // Runs the copy and logs its output. Returns true on exit status 0.
    // Exceptions from the copier count as failure and are not rethrown.
    bool run(CopyPrimitive& copier, Logger& log) const;

    const std::string& source_host() const { return source_host_; }
    const std::string& dest_host() const { return dest_host_; }
    const std::string& source_path() const { return source_path_; }
    const std::string& dest_path() const { return dest_path_; }

    // "src -> dst" for log lines
    std::string label() const;

private:
    std::string source_host_;
    std::string dest_host_;
    std::string source_path_;
    std::string dest_path_;
};
