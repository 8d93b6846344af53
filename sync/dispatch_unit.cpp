// ============================================================
// dispatch_unit.cpp
// ============================================================

#include "dispatch_unit.hpp"
#include <exception>

DispatchUnit::DispatchUnit(std::string source_host,
                           std::string dest_host,
                           std::string source_path,
                           std::string dest_path)
    : source_host_(std::move(source_host))
    , dest_host_(std::move(dest_host))
    , source_path_(std::move(source_path))
    , dest_path_(std::move(dest_path))
{
}

std::string DispatchUnit::label() const {
    return source_host_ + " -> " + dest_host_;
}

bool DispatchUnit::run(CopyPrimitive& copier, Logger& log) const {
    log.debug("copy " + label() + ": " + source_path_ + " -> " + dest_path_);

    CopyResult res;
    try {
        res = copier.copy(source_host_, source_path_, dest_host_, dest_path_);
    } catch (const std::exception& e) {
        log.transfer_error(label() + ": could not start copy: " + e.what());
        return false;
    }

    log.debug("copy " + label() + " return code: " + std::to_string(res.exit_status));
    if (!res.out.empty()) log.debug("stdout (" + label() + "):\n" + res.out);
    if (!res.err.empty()) log.debug("stderr (" + label() + "):\n" + res.err);

    if (!res.ok()) {
        std::string msg = label() + ": exit status " + std::to_string(res.exit_status);
        if (!res.err.empty()) msg += "\n" + res.err;
        log.transfer_error(msg);
        return false;
    }
    return true;
}
