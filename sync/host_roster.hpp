#pragma once

// ============================================================
// host_roster.hpp -- Ordered host list; index 0 is the source
// ============================================================

#include "../common/platform.hpp"
#include <string>
#include <vector>
#include <stdexcept>

class HostRoster {
public:
    // Source host alone; synced by construction
    explicit HostRoster(const std::string& source_host);

    // Source plus destinations parsed from a comma-separated list.
    // Entries are trimmed; entries equal to the source are dropped.
    // Throws std::invalid_argument on an empty list or an empty entry.
    static HostRoster parse(const std::string& source_host,
                            const std::string& destinations_csv);

    // Appends a destination unless it names the source; returns true if added
    bool add_destination(const std::string& host);

    const std::string& source() const { return hosts_.front(); }
    const std::string& at(size_t index) const { return hosts_.at(index); }
    size_t size() const { return hosts_.size(); }
    const std::vector<std::string>& hosts() const { return hosts_; }

private:
    std::vector<std::string> hosts_;
};
