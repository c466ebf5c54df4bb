// Copyright 2018 Your Name <your_email>

#include <http_fetcher.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/ssl.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <future>
#include <limits>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>

namespace linkcheck {

namespace asio = boost::asio;
namespace ssl = asio::ssl;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

using StringResponse = http::response<http::string_body>;
using Deadline = std::chrono::steady_clock::time_point;

// Runs the io_context until the single pending operation has completed.
// Timeouts are enforced by beast::tcp_stream, which only applies them to
// asynchronous operations.
void run(asio::io_context& ioc) {
    ioc.restart();
    ioc.run();
}

void check(const beast::error_code& ec) {
    if (ec) throw beast::system_error{ec};
}

std::string bare_host(const std::string& host) {
    if (host.size() > 1 && host.front() == '[' && host.back() == ']')
        return host.substr(1, host.size() - 2);
    return host;
}

template <class Stream>
StringResponse exchange(asio::io_context& ioc, Stream& stream,
                        const http::request<http::empty_body>& req,
                        Deadline deadline) {
    beast::error_code ec;

    beast::get_lowest_layer(stream).expires_at(deadline);
    http::async_write(stream, req,
                      [&ec](beast::error_code e, std::size_t) { ec = e; });
    run(ioc);
    check(ec);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());
    beast::get_lowest_layer(stream).expires_at(deadline);
    http::async_read(stream, buffer, parser,
                     [&ec](beast::error_code e, std::size_t) { ec = e; });
    run(ioc);
    // servers that skip close_notify end the body with a truncated stream
    if (ec == ssl::error::stream_truncated) {
        ec = {};
        if (!parser.is_done()) parser.put_eof(ec);
    }
    check(ec);

    // the response is complete; a failed shutdown changes nothing
    beast::error_code ignored;
    beast::get_lowest_layer(stream).socket().shutdown(
            tcp::socket::shutdown_both, ignored);
    return parser.release();
}

// getaddrinfo cannot be cancelled, so the lookup runs on its own detached
// thread and is abandoned once the deadline passes.
tcp::resolver::results_type resolve(const std::string& host,
                                    const std::string& port,
                                    Deadline deadline) {
    auto lookup = std::make_shared<
            std::packaged_task<tcp::resolver::results_type()>>([host, port] {
        asio::io_context ioc;
        tcp::resolver resolver(ioc);
        return resolver.resolve(host, port);
    });
    auto results = lookup->get_future();
    std::thread([lookup] { (*lookup)(); }).detach();

    if (results.wait_until(deadline) == std::future_status::timeout) {
        beast::error_code ec = asio::error::timed_out;
        throw beast::system_error{ec};
    }
    return results.get();
}

void connect(asio::io_context& ioc, beast::tcp_stream& stream,
             const UrlParts& url, const std::string& port,
             Deadline deadline) {
    auto const results = resolve(bare_host(url.host), port, deadline);

    beast::error_code ec;
    stream.expires_at(deadline);
    stream.async_connect(results,
                         [&ec](beast::error_code e, tcp::endpoint) { ec = e; });
    run(ioc);
    check(ec);
}

}  // namespace

bool is_redirect(unsigned status) {
    return status == 301 || status == 302 || status == 303 ||
           status == 307 || status == 308;
}

HttpFetcher::HttpFetcher(FetchSettings settings) :
        _settings(std::move(settings)),
        _ssl_context(ssl::context::tls_client) {
    _ssl_context.set_default_verify_paths();
    _ssl_context.set_verify_mode(ssl::verify_peer);
}

http::request<http::empty_body>
HttpFetcher::make_request(const UrlParts& url) const {
    std::string target = url.path.empty() ? "/" : url.path;
    if (url.has_query) target += "?" + url.query;

    std::string host = url.host;
    if (!url.port.empty() && url.port != default_port(url.scheme))
        host += ":" + url.port;

    int version = 11;
    http::request<http::empty_body> req{http::verb::get, target, version};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, _settings.user_agent);
    req.set(http::field::accept, "*/*");
    req.set(http::field::connection, "close");
    return req;
}

StringResponse HttpFetcher::get(const UrlParts& url) {
    std::string port = url.port.empty() ? default_port(url.scheme) : url.port;
    asio::io_context ioc;
    auto req = make_request(url);
    // one budget for the whole hop: lookup, connect, handshake, write, read
    Deadline deadline = std::chrono::steady_clock::now() + _settings.timeout;

    if (url.scheme == "http") {
        beast::tcp_stream stream(ioc);
        connect(ioc, stream, url, port, deadline);
        return exchange(ioc, stream, req, deadline);
    }

    beast::ssl_stream<beast::tcp_stream> stream(ioc, _ssl_context);
    std::string host = bare_host(url.host);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()),
                             asio::error::get_ssl_category()};
        throw beast::system_error{ec};
    }
    stream.set_verify_callback(ssl::host_name_verification(host));
    connect(ioc, beast::get_lowest_layer(stream), url, port, deadline);

    beast::error_code ec;
    beast::get_lowest_layer(stream).expires_at(deadline);
    stream.async_handshake(ssl::stream_base::client,
                           [&ec](beast::error_code e) { ec = e; });
    run(ioc);
    check(ec);
    return exchange(ioc, stream, req, deadline);
}

Response HttpFetcher::fetch(const std::string& url) {
    std::string current = url;
    for (unsigned hops = 0;; ++hops) {
        UrlParts parts = split_url(current);
        std::transform(parts.scheme.begin(), parts.scheme.end(),
                       parts.scheme.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        if (default_port(parts.scheme).empty())
            throw std::invalid_argument("unsupported URL scheme: " + current);
        if (parts.host.empty())
            throw std::invalid_argument("no host in URL: " + current);

        StringResponse res = get(parts);
        unsigned status = res.result_int();
        spdlog::debug("GET {} -> {}", current, status);

        auto location = res.find(http::field::location);
        if (is_redirect(status) && location != res.end()) {
            if (hops >= _settings.max_redirects)
                throw std::runtime_error("exceeded " +
                        std::to_string(_settings.max_redirects) +
                        " redirects fetching " + url);
            auto value = location->value();
            current = resolve_url(current,
                                  std::string(value.data(), value.size()));
            continue;
        }
        return Response{status, std::move(res.body())};
    }
}

}  // namespace linkcheck
