// Copyright 2018 Your Name <your_email>

#ifndef LINKCHECK_OPTIONS_HPP
#define LINKCHECK_OPTIONS_HPP
#include <boost/program_options.hpp>
#include <set>
#include <string>

namespace linkcheck {

struct Options{
    std::string url;
    unsigned depth = 5;
    unsigned threads = 10;
    std::string export_path;
    std::string realtime_path;
    std::set<unsigned> export_codes;
    unsigned timeout = 10;
    unsigned max_redirects = 10;
    std::string user_agent;
    bool verbose = false;
    bool help = false;
};

boost::program_options::options_description make_description();

// Throws boost::program_options::error for malformed command lines and
// std::invalid_argument for values out of range. `url` comes back
// normalized.
Options parse_options(int argc, const char* const argv[]);

}  // namespace linkcheck
#endif //LINKCHECK_OPTIONS_HPP
