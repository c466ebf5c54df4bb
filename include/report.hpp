// Copyright 2018 Your Name <your_email>

#ifndef LINKCHECK_REPORT_HPP
#define LINKCHECK_REPORT_HPP
#include <crawl_state.hpp>
#include <outcome.hpp>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace linkcheck {

void print_progress(std::ostream& out, const Stats& stats);

void print_summary(std::ostream& out, const std::vector<BrokenLink>& broken);

// Writes the header and every broken link whose status is in `codes`
// (all of them when `codes` is empty), plus every transport failure.
// Overwrites `path`. Returns the number of rows written.
std::size_t export_broken_links(const std::string& path,
                                const std::vector<BrokenLink>& broken,
                                const std::set<unsigned>& codes);

}  // namespace linkcheck
#endif //LINKCHECK_REPORT_HPP
