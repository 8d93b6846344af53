#include "common/process.hpp"
#include <gtest/gtest.h>

TEST(Process, CapturesStdoutAndStderrSeparately) {
    auto res = process::run({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 0"});
    EXPECT_TRUE(res.ok());
    EXPECT_EQ(res.exit_status, 0);
    EXPECT_EQ(res.out, "out\n");
    EXPECT_EQ(res.err, "err\n");
    EXPECT_FALSE(res.timed_out);
}

TEST(Process, ReportsNonZeroExit) {
    auto res = process::run({"/bin/sh", "-c", "exit 3"});
    EXPECT_FALSE(res.ok());
    EXPECT_EQ(res.exit_status, 3);
}

TEST(Process, LargeOutputDoesNotBlock) {
    auto res = process::run({"/bin/sh", "-c",
                             "i=0; while [ $i -lt 20000 ]; do echo line-$i; i=$((i+1)); done"});
    ASSERT_TRUE(res.ok());
    EXPECT_GT(res.out.size(), 100000u);
}

TEST(Process, StdinIsEmpty) {
    auto res = process::run({"/bin/sh", "-c", "read x || echo eof"});
    EXPECT_EQ(res.out, "eof\n");
}

TEST(Process, MissingExecutableExits127) {
    auto res = process::run({"/nonexistent/msync-test-binary"});
    EXPECT_EQ(res.exit_status, PROCESS_EXEC_FAILED_STATUS);
    EXPECT_NE(res.err.find("execv failed"), std::string::npos);
}

TEST(Process, TimeoutStopsTheChild) {
    auto res = process::run({"/bin/sh", "-c", "exec sleep 30"}, 1);
    EXPECT_TRUE(res.timed_out);
    EXPECT_EQ(res.exit_status, PROCESS_TIMEOUT_STATUS);
    EXPECT_NE(res.err.find("timed out"), std::string::npos);
}

TEST(Process, EmptyArgvThrows) {
    EXPECT_THROW(process::run({}), std::invalid_argument);
}

