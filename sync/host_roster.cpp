// ============================================================
// host_roster.cpp
// ============================================================

#include "host_roster.hpp"
#include "../common/utils.hpp"

HostRoster::HostRoster(const std::string& source_host) {
    if (source_host.empty()) {
        throw std::invalid_argument("source host name is empty");
    }
    hosts_.push_back(source_host);
}

HostRoster HostRoster::parse(const std::string& source_host,
                             const std::string& destinations_csv) {
    HostRoster roster(source_host);

    if (utils::trim(destinations_csv).empty()) {
        throw std::invalid_argument("destination list is empty");
    }

    auto fields = utils::split(destinations_csv, ',');
    for (size_t i = 0; i < fields.size(); ++i) {
        std::string host = utils::trim(fields[i]);
        if (host.empty()) {
            throw std::invalid_argument("destination list is malformed: entry " +
                                        std::to_string(i + 1) + " is empty");
        }
        roster.add_destination(host);
    }
    return roster;
}

bool HostRoster::add_destination(const std::string& host) {
    if (host == source()) return false;
    hosts_.push_back(host);
    return true;
}
