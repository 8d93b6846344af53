// ============================================================
// round_planner.cpp
// ============================================================

#include "round_planner.hpp"
#include <algorithm>

namespace round_planner {

size_t remaining(const SyncState& state, size_t total) {
    return state.hosts_copied_to < total ? total - state.hosts_copied_to : 0;
}

std::vector<PlannedPair> plan(SyncState& state, size_t total) {
    std::vector<PlannedPair> pairs;
    size_t left = remaining(state, total);
    if (left == 0) return pairs;

    size_t copies = std::min(state.step_size, left);
    pairs.reserve(copies);

    for (size_t h = 0; h < copies; ++h) {
        // Fewer hosts than this offset needs: stop, a later round covers the rest
        if (h + state.step_size >= total) break;
        pairs.push_back(PlannedPair{h, h + state.step_size});
        ++state.hosts_copied_to;
    }
    return pairs;
}

void advance(SyncState& state) {
    ++state.iteration;
    state.step_size = (size_t)1 << state.iteration;
}

} // namespace round_planner
