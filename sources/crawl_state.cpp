// Copyright 2018 Your Name <your_email>

#include <crawl_state.hpp>
#include <exporter.hpp>

namespace linkcheck {

std::size_t Stats::count(int key) const {
    auto it = statuses.find(key);
    return it == statuses.end() ? 0 : it->second;
}

CrawlState::CrawlState(RealtimeExporter* exporter) : _exporter(exporter) {}

bool CrawlState::try_mark_visited(const std::string& url) {
    std::lock_guard<std::mutex> lock(_mutex);
    return _visited.insert(url).second;
}

bool CrawlState::try_mark_discovered(const std::string& url) {
    std::lock_guard<std::mutex> lock(_mutex);
    return _discovered.insert(url).second;
}

void CrawlState::record_status(int key) {
    std::lock_guard<std::mutex> lock(_mutex);
    ++_statuses[key];
}

void CrawlState::record_broken(const std::string& url, const Outcome& outcome,
                               const std::string& source) {
    std::lock_guard<std::mutex> lock(_mutex);
    _broken.push_back({url, outcome, source});
    // exporter has its own lock; it is always taken after ours
    if (_exporter) _exporter->write(_broken.back());
}

Stats CrawlState::snapshot() const {
    std::lock_guard<std::mutex> lock(_mutex);
    Stats stats{};
    stats.discovered = _discovered.size();
    stats.visited = _visited.size();
    // depth-exceeded URLs are discovered but never visited
    stats.in_queue = _discovered.size() > _visited.size() ?
                     _discovered.size() - _visited.size() : 0;
    stats.statuses = _statuses;
    return stats;
}

std::vector<BrokenLink> CrawlState::broken_links() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _broken;
}

std::size_t CrawlState::visited_count() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _visited.size();
}

std::size_t CrawlState::discovered_count() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _discovered.size();
}

std::size_t CrawlState::status_count(int key) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _statuses.find(key);
    return it == _statuses.end() ? 0 : it->second;
}

bool CrawlState::was_visited(const std::string& url) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _visited.count(url) > 0;
}

}  // namespace linkcheck
