// Copyright 2018 Your Name <your_email>

#include <crawler.hpp>
#include <link_extractor.hpp>
#include <url.hpp>

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>
#include <condition_variable>
#include <exception>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace linkcheck {

Crawler::Crawler(const std::string& base_url, unsigned depth, unsigned threads,
                 Fetcher& fetcher, RealtimeExporter* exporter) :
        _base_url(base_url), _depth(depth), _threads(threads),
        _fetcher(fetcher), _state(exporter) {
    if (_threads == 0)
        throw std::invalid_argument("crawler needs at least one thread");
}

void Crawler::set_progress_callback(ProgressCallback callback) {
    _progress = std::move(callback);
}

void Crawler::run() {
    std::deque<FrontierEntry> queue;
    if (_state.try_mark_discovered(_base_url))
        queue.push_back({_base_url, 0, kRootSource});

    boost::asio::thread_pool pool(_threads);
    unsigned wave = 0;
    while (!queue.empty()) {
        spdlog::debug("wave {}: {} urls", wave++, queue.size());
        dispatch_wave(pool, &queue);
    }
    pool.join();
}

// Posts every queued entry to the pool and blocks until all of them have
// completed. Results are appended to the queue in completion order.
void Crawler::dispatch_wave(boost::asio::thread_pool& pool,
                            std::deque<FrontierEntry>* queue) {
    std::vector<FrontierEntry> batch(queue->begin(), queue->end());
    queue->clear();

    std::mutex mutex;
    std::condition_variable cond;
    std::deque<std::vector<FrontierEntry>> completed;

    for (const auto& entry : batch) {
        boost::asio::post(pool, [this, &entry, &mutex, &cond, &completed] {
            std::vector<FrontierEntry> links;
            try {
                links = fetch_and_extract(entry);
            } catch (const std::exception& e) {
                spdlog::error("task for {} failed: {}", entry.url, e.what());
            } catch (...) {
                spdlog::error("task for {} failed with an unknown error",
                              entry.url);
            }
            std::lock_guard<std::mutex> lock(mutex);
            completed.push_back(std::move(links));
            cond.notify_one();
        });
    }

    for (std::size_t pending = batch.size(); pending > 0; --pending) {
        std::unique_lock<std::mutex> lock(mutex);
        cond.wait(lock, [&completed] { return !completed.empty(); });
        std::vector<FrontierEntry> links = std::move(completed.front());
        completed.pop_front();
        lock.unlock();

        queue->insert(queue->end(), std::make_move_iterator(links.begin()),
                      std::make_move_iterator(links.end()));
        report_progress();
    }
}

void Crawler::report_progress() {
    if (!_progress) return;
    try {
        _progress(_state.snapshot());
    } catch (const std::exception& e) {
        spdlog::error("progress callback failed: {}", e.what());
    } catch (...) {
        spdlog::error("progress callback failed with an unknown error");
    }
}

std::vector<FrontierEntry> Crawler::fetch_and_extract(
        const FrontierEntry& entry) {
    if (entry.depth > _depth) return {};
    if (!_state.try_mark_visited(entry.url)) return {};

    Response response{};
    try {
        response = _fetcher.fetch(entry.url);
    } catch (const std::exception& e) {
        spdlog::warn("{} unreachable: {} (linked from {})",
                     entry.url, e.what(), entry.source);
        _state.record_status(kErrorKey);
        _state.record_broken(entry.url, TransportError{e.what()},
                             entry.source);
        return {};
    } catch (...) {
        spdlog::warn("{} unreachable (linked from {})", entry.url, entry.source);
        _state.record_status(kErrorKey);
        _state.record_broken(entry.url, TransportError{"unknown error"},
                             entry.source);
        return {};
    }

    _state.record_status(static_cast<int>(response.status));
    Outcome outcome = classify(response.status);
    if (is_broken(outcome)) {
        spdlog::warn("{} returned {} (linked from {})",
                     entry.url, response.status, entry.source);
        _state.record_broken(entry.url, outcome, entry.source);
        return {};
    }
    return select_links(entry, response.body);
}

std::vector<FrontierEntry> Crawler::select_links(const FrontierEntry& entry,
                                                 const std::string& body) {
    std::vector<std::string> hrefs;
    try {
        hrefs = extract_links(body);
    } catch (const std::exception& e) {
        spdlog::debug("no links extracted from {}: {}", entry.url, e.what());
        return {};
    }

    std::vector<FrontierEntry> links;
    for (const auto& href : hrefs) {
        std::string url = normalize_url(entry.url, href);
        if (!is_crawlable(url)) continue;
        if (!is_internal(_base_url, url)) continue;
        if (!_state.try_mark_discovered(url)) continue;
        links.push_back({url, entry.depth + 1, entry.url});
    }
    spdlog::debug("{}: {} links, {} new", entry.url, hrefs.size(), links.size());
    return links;
}

}  // namespace linkcheck
