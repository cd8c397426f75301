#include "rain/app.hpp"

#include <gtest/gtest.h>

#include <utility>

#include <fstream>
#include <string>
#include <vector>

using namespace rain;

namespace {

struct Argv {
    explicit Argv(std::vector<std::string> a) : args(std::move(a)) {
        for (auto& s : args) ptrs.push_back(s.data());
    }
    int argc() { return static_cast<int>(ptrs.size()); }
    char** argv() { return ptrs.data(); }
    std::vector<std::string> args;
    std::vector<char*> ptrs;
};

} // namespace

TEST(AppArgs, Defaults) {
    Argv a({"rainevents", "gauge.csv"});
    const Args args = App::parse_args(a.argc(), a.argv());
    EXPECT_EQ(args.source, "gauge.csv");
    EXPECT_EQ(args.outdir, "out");
    EXPECT_EQ(args.period, 24);
    EXPECT_EQ(args.delay, 0);
    EXPECT_EQ(args.reducer, "sum");
    EXPECT_DOUBLE_EQ(args.threshold, 0.1);
    EXPECT_EQ(args.merge_gap, 0);
    EXPECT_TRUE(args.samples.empty());
    EXPECT_FALSE(args.no_download);
}

TEST(AppArgs, AllFlags) {
    Argv a({"rainevents", "https://example.org/g.csv", "--out", "res", "--period", "48",
            "--delay", "2", "--reducer", "max", "--threshold", "0.25", "--merge-gap", "3",
            "--samples", "s.csv", "--time-column", "collected", "--prefix", "rain",
            "--no-download"});
    const Args args = App::parse_args(a.argc(), a.argv());
    EXPECT_EQ(args.outdir, "res");
    EXPECT_EQ(args.period, 48);
    EXPECT_EQ(args.delay, 2);
    EXPECT_EQ(args.reducer, "max");
    EXPECT_DOUBLE_EQ(args.threshold, 0.25);
    EXPECT_EQ(args.merge_gap, 3);
    EXPECT_EQ(args.samples, "s.csv");
    EXPECT_EQ(args.time_column, "collected");
    EXPECT_EQ(args.prefix, "rain");
    EXPECT_TRUE(args.no_download);
}

TEST(AppArgs, Rejected) {
    Argv none({"rainevents"});
    EXPECT_THROW(App::parse_args(none.argc(), none.argv()), UsageError);
    Argv unknown({"rainevents", "g.csv", "--hp", "20"});
    EXPECT_THROW(App::parse_args(unknown.argc(), unknown.argv()), UsageError);
    Argv bad({"rainevents", "g.csv", "--period", "24h"});
    EXPECT_THROW(App::parse_args(bad.argc(), bad.argv()), UsageError);
}

TEST(AppArgs, WindowParametersAreUsageErrors) {
    for (const std::vector<std::string>& extra : {std::vector<std::string>{"--period", "0"},
                                                  std::vector<std::string>{"--delay", "-1"},
                                                  std::vector<std::string>{"--merge-gap", "-2"},
                                                  std::vector<std::string>{"--reducer", "median"}}) {
        std::vector<std::string> args = {"rainevents", "g.csv"};
        args.insert(args.end(), extra.begin(), extra.end());
        Argv a(args);
        EXPECT_THROW(App::parse_args(a.argc(), a.argv()), UsageError) << extra[0] << " " << extra[1];
    }
}

TEST(AppRun, ZeroPeriodExitsWithUsage) {
    Argv a({"rainevents", ::testing::TempDir() + "never_read.csv", "--period", "0"});
    EXPECT_EQ(App().run(a.argc(), a.argv()), 1);
}

TEST(AppRun, GapBlocksPipeline) {
    const std::string path = ::testing::TempDir() + "gap.csv";
    {
        std::ofstream f(path);
        f << "timestamp,precip\n2021-07-01 00:00,0\n2021-07-01 03:00,0.2\n";
    }
    const std::string out = ::testing::TempDir() + "gap_out";
    Argv a({"rainevents", path, "--out", out});
    EXPECT_EQ(App().run(a.argc(), a.argv()), 2);
    EXPECT_FALSE(std::ifstream(out + "/summary.csv").good());
}

TEST(AppRun, WritesOutputs) {
    const std::string path = ::testing::TempDir() + "ok.csv";
    {
        std::ofstream f(path);
        f << "timestamp,precip\n"
             "2021-07-01 00:00,0\n2021-07-01 01:00,0.2\n2021-07-01 02:00,0.1\n2021-07-01 03:00,0\n";
    }
    const std::string out = ::testing::TempDir() + "ok_out";
    Argv a({"rainevents", path, "--out", out, "--period", "2"});
    EXPECT_EQ(App().run(a.argc(), a.argv()), 0);
    EXPECT_TRUE(std::ifstream(out + "/summary.csv").good());
    EXPECT_TRUE(std::ifstream(out + "/events.csv").good());
    EXPECT_TRUE(std::ifstream(out + "/antecedent.csv").good());
    EXPECT_TRUE(std::ifstream(out + "/hyetograph.svg").good());
}
