#include "rain/csv.hpp"
#include "rain/errors.hpp"
#include "helpers.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>
#include <variant>

using namespace rain;
using rain::test::hour;
using rain::test::make_series;

static std::string temp_file(const std::string& name, const std::string& content) {
    const std::string path = ::testing::TempDir() + name;
    std::ofstream f(path);
    f << content;
    return path;
}

static std::string slurp(const std::string& path) {
    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

TEST(CsvSplit, QuotedFields) {
    const auto f = split_csv_line("a,\"b,c\",\"say \"\"hi\"\"\",\r");
    ASSERT_EQ(f.size(), 4u);
    EXPECT_EQ(f[1], "b,c");
    EXPECT_EQ(f[2], "say \"hi\"");
    EXPECT_EQ(f[3], "");
}

TEST(CsvReader, ReadsSeriesWithMissingValues) {
    const auto path = temp_file("gauge.csv",
        "station,precip,timestamp\n"
        "G1,0.00,2021-07-01 00:00:00\n"
        "G1,NA,2021-07-01 01:00:00\n"
        "G1,0.25,2021-07-01T02:00:00\n"
        "\n");
    const HourlySeries s = CsvReader().read_series(path);
    ASSERT_EQ(s.records.size(), 3u);
    EXPECT_EQ(s.records[0].timestamp, hour(0));
    EXPECT_EQ(s.records[0].precip, 0.0);
    EXPECT_FALSE(s.records[1].precip);
    EXPECT_EQ(s.records[2].precip, 0.25);
    EXPECT_EQ(s.source, path);

    try {
        validate(s);
        FAIL() << "expected SeriesError";
    } catch (const SeriesError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MissingValue);
    }
}

TEST(CsvReader, SeriesRequiresColumns) {
    const auto path = temp_file("nocol.csv", "time,depth\n2021-07-01 00:00,0\n");
    EXPECT_THROW(CsvReader().read_series(path), std::runtime_error);
}

TEST(CsvReader, RejectsBadDepth) {
    const auto path = temp_file("bad.csv", "timestamp,precip\n2021-07-01 00:00,lots\n");
    EXPECT_THROW(CsvReader().read_series(path), std::runtime_error);
}

TEST(CsvReader, MissingFileThrows) {
    EXPECT_THROW(CsvReader().read_series(::testing::TempDir() + "does-not-exist.csv"), std::runtime_error);
}

TEST(CsvReader, TableCellsAreTyped) {
    const auto path = temp_file("samples.csv",
        "site,collected,ecoli,turbidity\n"
        "\"Creek, upper\",2021-07-01 02:35,120,1.5\n"
        "Creek lower,,NA,0\n");
    const Table t = CsvReader().read_table(path, "collected");
    ASSERT_EQ(t.rows.size(), 2u);
    EXPECT_EQ(std::get<std::string>(t.rows[0][0]), "Creek, upper");
    EXPECT_EQ(std::get<Timestamp>(t.rows[0][1]), hour(2) + std::chrono::minutes{35});
    EXPECT_EQ(std::get<std::int64_t>(t.rows[0][2]), 120);
    EXPECT_DOUBLE_EQ(std::get<double>(t.rows[0][3]), 1.5);
    EXPECT_TRUE(std::holds_alternative<std::monostate>(t.rows[1][1]));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(t.rows[1][2]));
}

TEST(CsvWriter, SummaryTable) {
    const auto events = summarize(segment(make_series({0, 0.5, 0.25})));
    const std::string path = ::testing::TempDir() + "summary.csv";
    CsvWriter().write(path, events);
    EXPECT_EQ(slurp(path),
        "event_id,event_type,start,end,duration_hours,total_depth,peak_intensity,mean_intensity\n"
        "1,Dry,2021-07-01 00:00:00,2021-07-01 00:00:00,1,0,0,0\n"
        "2,Wet,2021-07-01 01:00:00,2021-07-01 02:00:00,2,0.75,0.5,0.375\n");
}

TEST(CsvWriter, AntecedentLeavesUndefinedEmpty) {
    const auto a = aggregate(make_series({0.1, 0.2}), 2);
    const std::string path = ::testing::TempDir() + "antecedent.csv";
    CsvWriter().write(path, a, classify(a, 0.3));
    EXPECT_EQ(slurp(path),
        "timestamp,antecedent_sum_2h,weather\n"
        "2021-07-01 00:00:00,,\n"
        "2021-07-01 01:00:00,0.30000000000000004,Wet\n");
}

TEST(CsvWriter, DepthsKeepFullPrecision) {
    const auto events = summarize(segment(make_series({0.123456789, 0.000123456789})));
    const std::string path = ::testing::TempDir() + "summary_precision.csv";
    CsvWriter().write(path, events);
    std::ifstream in(path);
    std::string header, row;
    std::getline(in, header);
    std::getline(in, row);
    const auto fields = split_csv_line(row);
    ASSERT_EQ(fields.size(), 8u);
    EXPECT_EQ(std::stod(fields[5]), events[0].total_depth);
    EXPECT_EQ(std::stod(fields[6]), 0.123456789);
    EXPECT_EQ(std::stod(fields[7]), events[0].mean_intensity);
}

TEST(CsvWriter, TableDoublesKeepFullPrecision) {
    Table t;
    t.columns = {"v"};
    t.rows = {{1.0 / 3.0}};
    const std::string path = ::testing::TempDir() + "table_precision.csv";
    CsvWriter().write(path, t);
    std::ifstream in(path);
    std::string header, row;
    std::getline(in, header);
    std::getline(in, row);
    EXPECT_EQ(std::stod(row), 1.0 / 3.0);
}

TEST(CsvWriter, TableQuotesText) {
    Table t;
    t.columns = {"site", "n"};
    t.rows = {{std::string("a,b"), std::monostate{}}};
    const std::string path = ::testing::TempDir() + "table.csv";
    CsvWriter().write(path, t);
    EXPECT_EQ(slurp(path), "site,n\n\"a,b\",\n");
}
