// Copyright 2018 Your Name <your_email>

#include <report.hpp>
#include <exporter.hpp>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <variant>

namespace linkcheck {

void print_progress(std::ostream& out, const Stats& stats) {
    out << "\rdiscovered " << stats.discovered
        << " | checked " << stats.visited
        << " | in queue " << stats.in_queue
        << " | 200: " << stats.count(200)
        << " | 400: " << stats.count(400)
        << " | 404: " << stats.count(404)
        << " | 500: " << stats.count(500)
        << " | errors: " << stats.count(kErrorKey)
        << std::flush;
}

void print_summary(std::ostream& out, const std::vector<BrokenLink>& broken) {
    if (broken.empty()) {
        out << "No broken links found." << std::endl;
        return;
    }

    std::size_t url_width = 3;
    for (const auto& link : broken)
        url_width = std::max(url_width, link.url.size());

    out << "Broken links (" << broken.size() << ")" << std::endl;
    out << std::left << std::setw(6) << "Error" << "  "
        << std::setw(static_cast<int>(url_width)) << "URL" << "  "
        << "Source" << std::endl;
    out << std::string(6 + 2 + url_width + 2 + 6, '-') << std::endl;
    for (const auto& link : broken) {
        out << std::left << std::setw(6) << error_field(link.outcome) << "  "
            << std::setw(static_cast<int>(url_width)) << link.url << "  "
            << link.source << std::endl;
    }
}

std::size_t export_broken_links(const std::string& path,
                                const std::vector<BrokenLink>& broken,
                                const std::set<unsigned>& codes) {
    std::ofstream file(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file)
        throw std::runtime_error("cannot open export file " + path);

    file << csv_header();
    std::size_t rows = 0;
    for (const auto& link : broken) {
        if (auto error = std::get_if<ClientOrServerError>(&link.outcome)) {
            if (!codes.empty() && codes.count(error->status) == 0) continue;
        } else if (!std::holds_alternative<TransportError>(link.outcome)) {
            continue;
        }
        file << csv_row(link);
        ++rows;
    }
    file.flush();
    if (!file)
        throw std::runtime_error("failed writing export file " + path);
    spdlog::info("exported {} broken links to {}", rows, path);
    return rows;
}

}  // namespace linkcheck
