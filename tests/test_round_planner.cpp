#include "sync/round_planner.hpp"
#include <gtest/gtest.h>
#include <set>

namespace {

size_t ceil_log2(size_t n) {
    size_t r = 0;
    while (((size_t)1 << r) < n) ++r;
    return r;
}

std::vector<std::vector<PlannedPair>> plan_all(size_t total) {
    std::vector<std::vector<PlannedPair>> rounds;
    SyncState state;
    while (round_planner::remaining(state, total) > 0) {
        auto pairs = round_planner::plan(state, total);
        if (pairs.empty()) break;
        rounds.push_back(pairs);
        round_planner::advance(state);
    }
    return rounds;
}

} // namespace

TEST(RoundPlanner, FiveHostSchedule) {
    auto rounds = plan_all(5);
    ASSERT_EQ(rounds.size(), 3u);

    ASSERT_EQ(rounds[0].size(), 1u);
    EXPECT_EQ(rounds[0][0].source, 0u);
    EXPECT_EQ(rounds[0][0].dest, 1u);

    ASSERT_EQ(rounds[1].size(), 2u);
    EXPECT_EQ(rounds[1][0].source, 0u);
    EXPECT_EQ(rounds[1][0].dest, 2u);
    EXPECT_EQ(rounds[1][1].source, 1u);
    EXPECT_EQ(rounds[1][1].dest, 3u);

    ASSERT_EQ(rounds[2].size(), 1u);
    EXPECT_EQ(rounds[2][0].source, 0u);
    EXPECT_EQ(rounds[2][0].dest, 4u);
}

TEST(RoundPlanner, SingleHostPlansNothing) {
    SyncState state;
    EXPECT_EQ(round_planner::remaining(state, 1), 0u);
    EXPECT_TRUE(round_planner::plan(state, 1).empty());
    EXPECT_EQ(state.hosts_copied_to, 1u);
}

TEST(RoundPlanner, StepDoublesAfterEachRound) {
    SyncState state;
    EXPECT_EQ(state.step_size, 1u);
    round_planner::advance(state);
    EXPECT_EQ(state.iteration, 1u);
    EXPECT_EQ(state.step_size, 2u);
    round_planner::advance(state);
    round_planner::advance(state);
    EXPECT_EQ(state.iteration, 3u);
    EXPECT_EQ(state.step_size, 8u);
}

TEST(RoundPlanner, RoundCountIsCeilLog2) {
    for (size_t n = 1; n <= 300; ++n) {
        EXPECT_EQ(plan_all(n).size(), ceil_log2(n)) << "hosts: " << n;
    }
}

TEST(RoundPlanner, CoverageGrowsWithoutOverlap) {
    for (size_t n = 2; n <= 130; ++n) {
        SyncState state;
        std::set<size_t> synced{0};
        while (round_planner::remaining(state, n) > 0) {
            size_t before = state.hosts_copied_to;
            auto pairs = round_planner::plan(state, n);
            ASSERT_FALSE(pairs.empty());
            EXPECT_GT(state.hosts_copied_to, before);
            EXPECT_EQ(state.hosts_copied_to - before, pairs.size());
            EXPECT_LE(pairs.size(), state.step_size);

            std::set<size_t> sources;
            for (auto& p : pairs) {
                EXPECT_LT(p.dest, n);
                EXPECT_TRUE(synced.count(p.source)) << "unsynced source " << p.source;
                EXPECT_FALSE(synced.count(p.dest)) << "dest already synced " << p.dest;
                EXPECT_TRUE(sources.insert(p.source).second) << "source used twice";
            }
            for (auto& p : pairs) synced.insert(p.dest);
            round_planner::advance(state);
        }
        EXPECT_EQ(state.hosts_copied_to, n);
        EXPECT_EQ(synced.size(), n);
    }
}

TEST(RoundPlanner, OffsetPastRosterEndStopsTheRound) {
    // Inconsistent state: offset larger than the synced prefix
    SyncState state;
    state.hosts_copied_to = 2;
    state.step_size = 4;
    auto pairs = round_planner::plan(state, 5);
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs[0].source, 0u);
    EXPECT_EQ(pairs[0].dest, 4u);
    EXPECT_EQ(state.hosts_copied_to, 3u);
}
