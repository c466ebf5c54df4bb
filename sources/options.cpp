// Copyright 2018 Your Name <your_email>

#include <options.hpp>
#include <url.hpp>

#include <boost/beast/version.hpp>
#include <stdexcept>
#include <vector>

namespace linkcheck {

namespace po = boost::program_options;

namespace {

unsigned at_least(int value, int minimum, const char* name) {
    if (value < minimum)
        throw std::invalid_argument(std::string("--") + name +
                                    " must be at least " +
                                    std::to_string(minimum));
    return static_cast<unsigned>(value);
}

}  // namespace

po::options_description make_description() {
    po::options_description desc{"Options"};
    desc.add_options()
        ("help,h", "Shows this help message")
        ("url,u", po::value<std::string>(), "Base URL to start crawling from")
        ("depth,d", po::value<int>()->default_value(5),
         "Maximum crawl depth")
        ("threads,t", po::value<int>()->default_value(10),
         "Number of concurrent fetches")
        ("export,e", po::value<std::string>(),
         "Export broken links to CSV file after scan")
        ("export-realtime", po::value<std::string>(),
         "Export broken links to CSV file in real time")
        ("export-status", po::value<std::vector<int>>()->multitoken(),
         "Status codes kept by --export (default: every status >= 400)")
        ("timeout", po::value<int>()->default_value(10),
         "Per-request timeout in seconds")
        ("max-redirects", po::value<int>()->default_value(10),
         "Redirects followed before a request fails")
        ("user-agent", po::value<std::string>()
             ->default_value(BOOST_BEAST_VERSION_STRING),
         "User-Agent header")
        ("verbose,v", po::bool_switch(), "Log every request");
    return desc;
}

Options parse_options(int argc, const char* const argv[]) {
    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, make_description()), vm);
    po::notify(vm);

    Options options;
    if (vm.count("help")) {
        options.help = true;
        return options;
    }
    if (!vm.count("url"))
        throw po::required_option("url");

    options.url = normalize_url(vm["url"].as<std::string>(), "");
    UrlParts parts = split_url(options.url);
    if (!is_crawlable(options.url) || parts.host.empty())
        throw std::invalid_argument("not an http(s) URL: " + options.url);

    options.depth = at_least(vm["depth"].as<int>(), 0, "depth");
    options.threads = at_least(vm["threads"].as<int>(), 1, "threads");
    options.timeout = at_least(vm["timeout"].as<int>(), 1, "timeout");
    options.max_redirects =
            at_least(vm["max-redirects"].as<int>(), 0, "max-redirects");
    options.user_agent = vm["user-agent"].as<std::string>();
    options.verbose = vm["verbose"].as<bool>();

    if (vm.count("export"))
        options.export_path = vm["export"].as<std::string>();
    if (vm.count("export-realtime"))
        options.realtime_path = vm["export-realtime"].as<std::string>();
    if (vm.count("export-status")) {
        for (int code : vm["export-status"].as<std::vector<int>>()) {
            if (code < 400 || code > 599)
                throw std::invalid_argument("--export-status expects codes "
                                            "between 400 and 599, got " +
                                            std::to_string(code));
            options.export_codes.insert(static_cast<unsigned>(code));
        }
    }
    return options;
}

}  // namespace linkcheck
