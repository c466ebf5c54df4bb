// Copyright 2018 Your Name <your_email>

#ifndef LINKCHECK_CRAWL_STATE_HPP
#define LINKCHECK_CRAWL_STATE_HPP
#include <outcome.hpp>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace linkcheck {

class RealtimeExporter;

// Histogram key for transport failures; never a valid HTTP status.
const int kErrorKey = -1;

struct Stats{
    std::size_t discovered;
    std::size_t visited;
    std::size_t in_queue;
    std::map<int, std::size_t> statuses;

    std::size_t count(int key) const;
};

// Everything workers share during one crawl. All members are guarded by
// a single mutex; callers only see copies.
class CrawlState{
public:
    explicit CrawlState(RealtimeExporter* exporter = nullptr);

    bool try_mark_visited(const std::string& url);
    bool try_mark_discovered(const std::string& url);
    void record_status(int key);
    void record_broken(const std::string& url, const Outcome& outcome,
                       const std::string& source);

    Stats snapshot() const;
    std::vector<BrokenLink> broken_links() const;
    std::size_t visited_count() const;
    std::size_t discovered_count() const;
    std::size_t status_count(int key) const;
    bool was_visited(const std::string& url) const;
private:
    mutable std::mutex _mutex;
    std::unordered_set<std::string> _visited;
    std::unordered_set<std::string> _discovered;
    std::map<int, std::size_t> _statuses;
    std::vector<BrokenLink> _broken;
    RealtimeExporter* _exporter;
};

}  // namespace linkcheck
#endif //LINKCHECK_CRAWL_STATE_HPP
