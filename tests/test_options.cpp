#include "cli/options.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <vector>

namespace {

ParseResult parse(std::vector<const char*> args, AppOptions& out, std::string& err) {
    args.insert(args.begin(), "msync");
    return parse_options((int)args.size(), args.data(), out, err);
}

} // namespace

TEST(Options, RequiredArguments) {
    AppOptions opts;
    std::string err;
    ASSERT_EQ(parse({"-d", "a,b", "-p", "/data"}, opts, err), ParseResult::OK);
    EXPECT_EQ(opts.destinations, "a,b");
    EXPECT_EQ(opts.path, "/data");
    EXPECT_FALSE(opts.verbose);
    EXPECT_EQ(opts.multiplier, DEFAULT_WORKER_MULTIPLIER);
    EXPECT_EQ(opts.timeout_secs, 0);
    EXPECT_EQ(opts.tools.ssh_exe, DEFAULT_SSH_EXE);
    EXPECT_EQ(opts.tools.rsync_exe, DEFAULT_RSYNC_EXE);
}

TEST(Options, LongFormsAndExtras) {
    AppOptions opts;
    std::string err;
    ASSERT_EQ(parse({"--destinations", "n1", "--path", "/x/", "--verbose",
                     "--multiplier", "3", "--timeout", "90",
                     "--source-host", " me ", "--ssh", "/opt/ssh",
                     "--rsync", "/opt/rsync", "--log-file", "/tmp/msync.log"},
                    opts, err),
              ParseResult::OK);
    EXPECT_TRUE(opts.verbose);
    EXPECT_EQ(opts.multiplier, 3);
    EXPECT_EQ(opts.timeout_secs, 90);
    EXPECT_EQ(opts.source_host, "me");
    EXPECT_EQ(opts.tools.ssh_exe, "/opt/ssh");
    EXPECT_EQ(opts.tools.rsync_exe, "/opt/rsync");
    EXPECT_EQ(opts.log_file, "/tmp/msync.log");
}

TEST(Options, MissingDestinations) {
    AppOptions opts;
    std::string err;
    EXPECT_EQ(parse({"-p", "/data"}, opts, err), ParseResult::ERROR);
    EXPECT_NE(err.find("destinations"), std::string::npos);
}

TEST(Options, MissingPath) {
    AppOptions opts;
    std::string err;
    EXPECT_EQ(parse({"-d", "a"}, opts, err), ParseResult::ERROR);
    EXPECT_NE(err.find("path"), std::string::npos);
}

TEST(Options, OptionWithoutValue) {
    AppOptions opts;
    std::string err;
    EXPECT_EQ(parse({"-p", "/data", "-d"}, opts, err), ParseResult::ERROR);
}

TEST(Options, BadNumbers) {
    AppOptions opts;
    std::string err;
    EXPECT_EQ(parse({"-d", "a", "-p", "/x", "--multiplier", "0"}, opts, err), ParseResult::ERROR);
    EXPECT_EQ(parse({"-d", "a", "-p", "/x", "--multiplier", "2x"}, opts, err), ParseResult::ERROR);
    EXPECT_EQ(parse({"-d", "a", "-p", "/x", "--timeout", "-1"}, opts, err), ParseResult::ERROR);
}

TEST(Options, UnknownOption) {
    AppOptions opts;
    std::string err;
    EXPECT_EQ(parse({"-d", "a", "-p", "/x", "--frobnicate"}, opts, err), ParseResult::ERROR);
    EXPECT_NE(err.find("--frobnicate"), std::string::npos);
}

TEST(Options, Help) {
    AppOptions opts;
    std::string err;
    EXPECT_EQ(parse({"-h"}, opts, err), ParseResult::HELP);

    std::ostringstream os;
    print_usage(os, "msync");
    EXPECT_NE(os.str().find("--destinations"), std::string::npos);
}
