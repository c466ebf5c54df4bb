// Copyright 2018 Your Name <your_email>

#ifndef LINKCHECK_HTTP_FETCHER_HPP
#define LINKCHECK_HTTP_FETCHER_HPP
#include <fetcher.hpp>
#include <url.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <chrono>
#include <string>

namespace linkcheck {

struct FetchSettings{
    std::chrono::seconds timeout{10};
    unsigned max_redirects = 10;
    std::string user_agent = BOOST_BEAST_VERSION_STRING;
};

// Blocking HTTP/1.1 GET over Boost.Beast. One io_context per call, so a
// single instance can be shared by every worker thread.
class HttpFetcher : public Fetcher{
public:
    explicit HttpFetcher(FetchSettings settings = FetchSettings{});
    Response fetch(const std::string& url) override;
private:
    boost::beast::http::response<boost::beast::http::string_body>
    get(const UrlParts& url);
    boost::beast::http::request<boost::beast::http::empty_body>
    make_request(const UrlParts& url) const;

    FetchSettings _settings;
    boost::asio::ssl::context _ssl_context;
};

bool is_redirect(unsigned status);

}  // namespace linkcheck
#endif //LINKCHECK_HTTP_FETCHER_HPP
