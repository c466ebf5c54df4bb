// Copyright 2018 Your Name <your_email>

#ifndef LINKCHECK_EXPORTER_HPP
#define LINKCHECK_EXPORTER_HPP
#include <outcome.hpp>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace linkcheck {

// One CSV line (RFC 4180 quoting), terminated by "\r\n".
std::string csv_row(const std::vector<std::string>& fields);
std::string csv_row(const BrokenLink& link);
std::string csv_header();

// Streams broken links to a CSV file as they are found. Every row is
// flushed before write() returns.
class RealtimeExporter{
public:
    explicit RealtimeExporter(const std::string& path);
    RealtimeExporter(const RealtimeExporter&) = delete;
    RealtimeExporter& operator=(const RealtimeExporter&) = delete;

    void write(const BrokenLink& link);
    const std::string& path() const { return _path; }
private:
    std::string _path;
    std::ofstream _file;
    std::mutex _mutex;
};

}  // namespace linkcheck
#endif //LINKCHECK_EXPORTER_HPP
