// Copyright 2018 Your Name <your_email>

#ifndef LINKCHECK_FETCHER_HPP
#define LINKCHECK_FETCHER_HPP
#include <string>

namespace linkcheck {

struct Response{
    unsigned status;
    std::string body;
};

// Fetches one URL. Transport failures (DNS, connect, TLS, timeout,
// protocol) are reported by throwing a std::exception; any status code,
// including 4xx/5xx, is a normal return.
class Fetcher{
public:
    virtual ~Fetcher() = default;
    virtual Response fetch(const std::string& url) = 0;
};

}  // namespace linkcheck
#endif //LINKCHECK_FETCHER_HPP
