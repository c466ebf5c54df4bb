// Copyright 2018 Your Name <your_email>

#include <gtest/gtest.h>
#include <exporter.hpp>
#include <report.hpp>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

using linkcheck::BrokenLink;
using linkcheck::ClientOrServerError;
using linkcheck::TransportError;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    std::stringstream content;
    content << file.rdbuf();
    return content.str();
}

std::size_t count_lines(const std::string& text) {
    std::size_t lines = 0;
    for (char c : text)
        if (c == '\n') ++lines;
    return lines;
}

}  // namespace

TEST(Csv, QuotesOnlyWhenNeeded) {
    EXPECT_EQ(linkcheck::csv_row({"404", "https://a/b", "root"}),
              "404,https://a/b,root\r\n");
    EXPECT_EQ(linkcheck::csv_row({"ERROR", "https://a/b?x=1,2", "say \"hi\""}),
              "ERROR,\"https://a/b?x=1,2\",\"say \"\"hi\"\"\"\r\n");
    EXPECT_EQ(linkcheck::csv_header(), "Error,URL,Source\r\n");
}

TEST(RealtimeExporter, EachRowIsOnDiskAfterWrite) {
    std::string path = ::testing::TempDir() + "linkcheck_realtime.csv";
    {
        linkcheck::RealtimeExporter exporter(path);
        EXPECT_EQ(read_file(path), "Error,URL,Source\r\n");

        exporter.write({"https://example.com/b", ClientOrServerError{404},
                        "https://example.com"});
        EXPECT_EQ(read_file(path),
                  "Error,URL,Source\r\n"
                  "404,https://example.com/b,https://example.com\r\n");

        exporter.write({"https://example.com/x", TransportError{"timed out"},
                        "https://example.com/b"});
        EXPECT_EQ(count_lines(read_file(path)), 3u);
    }
    std::remove(path.c_str());
}

TEST(RealtimeExporter, ConcurrentWritersDoNotInterleave) {
    std::string path = ::testing::TempDir() + "linkcheck_concurrent.csv";
    {
        linkcheck::RealtimeExporter exporter(path);
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&exporter, t] {
                for (int i = 0; i < 50; ++i) {
                    exporter.write({"https://example.com/" + std::to_string(t) +
                                    "/" + std::to_string(i),
                                    ClientOrServerError{500}, "root"});
                }
            });
        }
        for (auto& thread : threads) thread.join();
    }

    std::ifstream file(path, std::ios::binary);
    std::string line;
    std::getline(file, line);
    EXPECT_EQ(line, "Error,URL,Source\r");
    std::size_t rows = 0;
    while (std::getline(file, line)) {
        EXPECT_EQ(line.compare(0, 24, "500,https://example.com/"), 0) << line;
        EXPECT_EQ(line.substr(line.size() - 6), ",root\r") << line;
        ++rows;
    }
    EXPECT_EQ(rows, 400u);
    std::remove(path.c_str());
}

TEST(RealtimeExporter, UnwritablePathThrows) {
    EXPECT_THROW(linkcheck::RealtimeExporter("/nonexistent-dir/x/live.csv"),
                 std::runtime_error);
}

TEST(FinalExport, FiltersByStatusAndKeepsTransportErrors) {
    std::vector<BrokenLink> broken{
        {"https://example.com/forbidden", ClientOrServerError{403}, "root"},
        {"https://example.com/missing", ClientOrServerError{404},
         "https://example.com"},
        {"https://example.com/down", TransportError{"refused"},
         "https://example.com"},
        {"https://example.com/busy", ClientOrServerError{503},
         "https://example.com"},
    };
    std::string path = ::testing::TempDir() + "linkcheck_final.csv";

    EXPECT_EQ(linkcheck::export_broken_links(path, broken, {400, 404, 500}),
              2u);
    EXPECT_EQ(read_file(path),
              "Error,URL,Source\r\n"
              "404,https://example.com/missing,https://example.com\r\n"
              "ERROR,https://example.com/down,https://example.com\r\n");

    // no filter exports everything, overwriting the previous file
    EXPECT_EQ(linkcheck::export_broken_links(path, broken, {}), 4u);
    EXPECT_EQ(count_lines(read_file(path)), 5u);
    std::remove(path.c_str());
}

TEST(Summary, PrintsTableOrSuccessLine) {
    std::ostringstream empty;
    linkcheck::print_summary(empty, {});
    EXPECT_EQ(empty.str(), "No broken links found.\n");

    std::ostringstream table;
    linkcheck::print_summary(table, {
        {"https://example.com/b", ClientOrServerError{404}, "https://example.com"},
        {"https://example.com/c", TransportError{"reset"}, "root"},
    });
    std::string text = table.str();
    EXPECT_NE(text.find("Broken links (2)"), std::string::npos);
    EXPECT_NE(text.find("404     https://example.com/b  https://example.com"),
              std::string::npos);
    EXPECT_NE(text.find("ERROR   https://example.com/c  root"),
              std::string::npos);
}

TEST(Progress, ShowsCounters) {
    linkcheck::Stats stats{5, 3, 2, {{200, 2}, {404, 1}, {linkcheck::kErrorKey, 4}}};
    std::ostringstream out;
    linkcheck::print_progress(out, stats);
    EXPECT_NE(out.str().find("discovered 5"), std::string::npos);
    EXPECT_NE(out.str().find("in queue 2"), std::string::npos);
    EXPECT_NE(out.str().find("404: 1"), std::string::npos);
    EXPECT_NE(out.str().find("errors: 4"), std::string::npos);
}
