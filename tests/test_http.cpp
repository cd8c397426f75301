#include "rain/http.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace rain;

TEST(HttpLocalName, KeepsLastPathSegment) {
    EXPECT_EQ(HttpClient::local_name("https://example.org/exports/gauge_12.csv"), "gauge_12.csv");
}

TEST(HttpLocalName, StripsQueryAndFragment) {
    EXPECT_EQ(HttpClient::local_name("https://example.org/export.csv?site=12&from=2021-07-01"), "export.csv");
    EXPECT_EQ(HttpClient::local_name("https://example.org/export.csv#top"), "export.csv");
    EXPECT_EQ(HttpClient::local_name("https://example.org/export.csv?path=a/b.txt"), "export.csv");
}

TEST(HttpLocalName, DefaultsToCsv) {
    EXPECT_EQ(HttpClient::local_name("https://example.org/api/hourly?site=12"), "hourly.csv");
    EXPECT_EQ(HttpClient::local_name("https://example.org/"), "gauge.csv");
    EXPECT_EQ(HttpClient::local_name("https://example.org"), "gauge.csv");
}

// file:// keeps the transfer tests offline.
TEST(HttpClient, DownloadsLocalFile) {
    const std::string src = ::testing::TempDir() + "remote_gauge.csv";
    {
        std::ofstream f(src);
        f << "timestamp,precip\n2021-07-01 00:00,0.1\n";
    }
    const std::string outdir = ::testing::TempDir() + "downloads";
    const std::string got = HttpClient().download_to("file://" + src, outdir);
    EXPECT_EQ(got, outdir + "/remote_gauge.csv");

    std::ifstream in(got);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str(), "timestamp,precip\n2021-07-01 00:00,0.1\n");
    EXPECT_FALSE(std::ifstream(got + ".part").good());
}

TEST(HttpClient, EmptyResponseLeavesNoFile) {
    const std::string src = ::testing::TempDir() + "empty_gauge.csv";
    { std::ofstream f(src); }
    const std::string outdir = ::testing::TempDir() + "downloads_empty";
    EXPECT_THROW(HttpClient().download_to("file://" + src, outdir), std::runtime_error);
    EXPECT_FALSE(std::ifstream(outdir + "/empty_gauge.csv").good());
    EXPECT_FALSE(std::ifstream(outdir + "/empty_gauge.csv.part").good());
}

TEST(HttpClient, MissingSourceThrows) {
    const std::string outdir = ::testing::TempDir() + "downloads_missing";
    EXPECT_THROW(HttpClient().download_to("file://" + ::testing::TempDir() + "no_such_gauge.csv", outdir),
                 std::runtime_error);
    EXPECT_FALSE(std::ifstream(outdir + "/no_such_gauge.csv").good());
}
