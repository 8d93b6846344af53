#pragma once

// ============================================================
// round_planner.hpp -- Recursive doubling schedule
//
// Round k pairs every synced host h (h < 2^(k-1)) with the
// host 2^(k-1) places further down the roster, so the synced
// prefix at least doubles per round and N hosts are covered
// in ceil(log2(N)) rounds. Each synced host sources at most
// one copy per round.
// ============================================================

#include "host_roster.hpp"
#include <vector>
#include <cstddef>

struct SyncState {
    size_t hosts_copied_to{1};  // roster[0 .. hosts_copied_to) are synced
    u32    iteration{0};        // completed rounds
    size_t step_size{1};        // pairing offset, 2^iteration
};

// Indices into the roster
struct PlannedPair {
    size_t source;
    size_t dest;
};

namespace round_planner {

// Hosts still waiting for a copy
size_t remaining(const SyncState& state, size_t total);

// Pairs for the next round; advances state.hosts_copied_to by the
// number of pairs returned. Empty when nothing remains.
std::vector<PlannedPair> plan(SyncState& state, size_t total);

// Move to the next round after a successful one
void advance(SyncState& state);

} // namespace round_planner
