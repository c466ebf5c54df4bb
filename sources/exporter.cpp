// Copyright 2018 Your Name <your_email>

#include <exporter.hpp>

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace linkcheck {

namespace {

std::string csv_field(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

}  // namespace

std::string csv_row(const std::vector<std::string>& fields) {
    std::string row;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) row += ',';
        row += csv_field(fields[i]);
    }
    row += "\r\n";
    return row;
}

std::string csv_row(const BrokenLink& link) {
    return csv_row({error_field(link.outcome), link.url, link.source});
}

std::string csv_header() {
    return csv_row({"Error", "URL", "Source"});
}

RealtimeExporter::RealtimeExporter(const std::string& path) :
        _path(path),
        _file(path, std::ios::out | std::ios::trunc | std::ios::binary) {
    if (!_file)
        throw std::runtime_error("cannot open realtime export file " + path);
    _file << csv_header();
    _file.flush();
    spdlog::info("streaming broken links to {}", path);
}

void RealtimeExporter::write(const BrokenLink& link) {
    std::lock_guard<std::mutex> lock(_mutex);
    _file << csv_row(link);
    _file.flush();
    if (!_file)
        spdlog::error("failed to append {} to {}", link.url, _path);
}

}  // namespace linkcheck
