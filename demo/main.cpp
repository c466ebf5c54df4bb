// Copyright 2018 Your Name <your_email>

#include <crawler.hpp>
#include <exporter.hpp>
#include <http_fetcher.hpp>
#include <options.hpp>
#include <report.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <iostream>
#include <memory>

int main(int argc, char** argv) {
    linkcheck::Options options;
    try {
        options = linkcheck::parse_options(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl
                  << linkcheck::make_description() << std::endl;
        return 1;
    }
    if (options.help) {
        std::cout << linkcheck::make_description() << std::endl;
        return 0;
    }
    spdlog::set_default_logger(spdlog::stderr_color_mt("linkcheck"));
    spdlog::set_level(options.verbose ? spdlog::level::debug
                                      : spdlog::level::info);

    std::unique_ptr<linkcheck::RealtimeExporter> realtime;
    if (!options.realtime_path.empty()) {
        try {
            realtime = std::make_unique<linkcheck::RealtimeExporter>(
                    options.realtime_path);
        } catch (const std::exception& e) {
            spdlog::critical("{}", e.what());
            return 1;
        }
    }

    linkcheck::FetchSettings settings;
    settings.timeout = std::chrono::seconds(options.timeout);
    settings.max_redirects = options.max_redirects;
    settings.user_agent = options.user_agent;
    linkcheck::HttpFetcher fetcher(settings);

    spdlog::info("scanning {} up to depth {} with {} threads",
                 options.url, options.depth, options.threads);
    linkcheck::Crawler crawler(options.url, options.depth, options.threads,
                               fetcher, realtime.get());
    // progress shares the terminal with log lines; keep it off in verbose mode
    if (!options.verbose) {
        crawler.set_progress_callback([](const linkcheck::Stats& stats) {
            linkcheck::print_progress(std::cerr, stats);
        });
    }
    crawler.run();
    if (!options.verbose) std::cerr << std::endl;

    const auto& state = crawler.state();
    spdlog::info("scan complete: {} links checked", state.visited_count());
    auto broken = state.broken_links();
    linkcheck::print_summary(std::cout, broken);

    if (!options.export_path.empty()) {
        try {
            linkcheck::export_broken_links(options.export_path, broken,
                                           options.export_codes);
        } catch (const std::exception& e) {
            spdlog::error("{}", e.what());
            return 1;
        }
    }
    return 0;
}
