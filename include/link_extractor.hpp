// Copyright 2018 Your Name <your_email>

#ifndef LINKCHECK_LINK_EXTRACTOR_HPP
#define LINKCHECK_LINK_EXTRACTOR_HPP
#include <string>
#include <vector>

namespace linkcheck {

// Raw href values of every <a href> element in document order. Malformed
// markup yields whatever gumbo recovers, possibly nothing.
std::vector<std::string> extract_links(const std::string& html);

}  // namespace linkcheck
#endif //LINKCHECK_LINK_EXTRACTOR_HPP
