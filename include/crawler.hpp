// Copyright 2018 Your Name <your_email>

#ifndef LINKCHECK_CRAWLER_HPP
#define LINKCHECK_CRAWLER_HPP
#include <crawl_state.hpp>
#include <fetcher.hpp>
#include <outcome.hpp>
#include <boost/asio/thread_pool.hpp>
#include <deque>
#include <functional>
#include <string>
#include <vector>

namespace linkcheck {

class RealtimeExporter;

// One crawl run: a breadth-first walk over the internal links of
// `base_url`, `threads` fetches at a time.
class Crawler{
public:
    using ProgressCallback = std::function<void(const Stats&)>;

    Crawler(const std::string& base_url, unsigned depth, unsigned threads,
            Fetcher& fetcher, RealtimeExporter* exporter = nullptr);

    void set_progress_callback(ProgressCallback callback);

    // Crawls until the frontier is empty.
    void run();

    // Fetches one frontier entry and returns the internal links it found
    // that nobody has queued yet. Never throws.
    std::vector<FrontierEntry> fetch_and_extract(const FrontierEntry& entry);

    const CrawlState& state() const { return _state; }
private:
    std::vector<FrontierEntry> select_links(const FrontierEntry& entry,
                                            const std::string& body);
    void dispatch_wave(boost::asio::thread_pool& pool,
                       std::deque<FrontierEntry>* queue);
    // A failing callback is logged; it must not unwind a running wave.
    void report_progress();

    std::string _base_url;
    unsigned _depth;
    unsigned _threads;
    Fetcher& _fetcher;
    CrawlState _state;
    ProgressCallback _progress;
};

}  // namespace linkcheck
#endif //LINKCHECK_CRAWLER_HPP
