// Copyright 2018 Your Name <your_email>

#include <gtest/gtest.h>
#include <http_fetcher.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <map>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

struct Route{
    unsigned status;
    std::string body;
    std::string location;
};

// Answers `connections` requests on a loopback port, one per connection.
class LocalServer{
public:
    LocalServer(std::map<std::string, Route> routes, int connections) :
            _routes(std::move(routes)),
            _acceptor(_ioc, {asio::ip::make_address("127.0.0.1"), 0}) {
        _thread = std::thread([this, connections] {
            for (int i = 0; i < connections; ++i) serve_one();
        });
    }

    ~LocalServer() { _thread.join(); }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" +
               std::to_string(_acceptor.local_endpoint().port()) + path;
    }
private:
    void serve_one() {
        tcp::socket socket(_ioc);
        _acceptor.accept(socket);
        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        http::read(socket, buffer, req);

        std::string target(req.target().data(), req.target().size());
        auto it = _routes.find(target);
        Route route = it == _routes.end() ? Route{404, "missing", ""}
                                          : it->second;
        http::response<http::string_body> res{
                static_cast<http::status>(route.status), req.version()};
        res.set(http::field::content_type, "text/html");
        if (!route.location.empty())
            res.set(http::field::location, route.location);
        res.body() = route.body;
        res.prepare_payload();
        http::write(socket, res);

        beast::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
    }

    std::map<std::string, Route> _routes;
    asio::io_context _ioc;
    tcp::acceptor _acceptor;
    std::thread _thread;
};

// Reads one request and never answers; returns once the client hangs up.
class SilentServer{
public:
    SilentServer() : _acceptor(_ioc, {asio::ip::make_address("127.0.0.1"), 0}) {
        _thread = std::thread([this] {
            tcp::socket socket(_ioc);
            _acceptor.accept(socket);
            beast::error_code ec;
            char data[1024];
            while (!ec) socket.read_some(asio::buffer(data), ec);
        });
    }

    ~SilentServer() { _thread.join(); }

    std::string url() const {
        return "http://127.0.0.1:" +
               std::to_string(_acceptor.local_endpoint().port()) + "/";
    }
private:
    asio::io_context _ioc;
    tcp::acceptor _acceptor;
    std::thread _thread;
};

}  // namespace

TEST(HttpFetcher, RedirectStatuses) {
    EXPECT_TRUE(linkcheck::is_redirect(301));
    EXPECT_TRUE(linkcheck::is_redirect(308));
    EXPECT_FALSE(linkcheck::is_redirect(200));
    EXPECT_FALSE(linkcheck::is_redirect(304));
}

TEST(HttpFetcher, ReturnsStatusAndBody) {
    LocalServer server({{"/page", {200, "<a href=\"/x\">x</a>", ""}},
                        {"/gone", {404, "nope", ""}}}, 2);
    linkcheck::HttpFetcher fetcher;

    auto page = fetcher.fetch(server.url("/page"));
    EXPECT_EQ(page.status, 200u);
    EXPECT_EQ(page.body, "<a href=\"/x\">x</a>");

    EXPECT_EQ(fetcher.fetch(server.url("/gone")).status, 404u);
}

TEST(HttpFetcher, FollowsRedirects) {
    LocalServer server({{"/old", {301, "", "/new"}},
                        {"/new", {200, "moved here", ""}}}, 2);
    linkcheck::HttpFetcher fetcher;

    auto response = fetcher.fetch(server.url("/old"));
    EXPECT_EQ(response.status, 200u);
    EXPECT_EQ(response.body, "moved here");
}

TEST(HttpFetcher, RedirectLoopIsATransportError) {
    LocalServer server({{"/loop", {302, "", "/loop"}}}, 3);
    linkcheck::FetchSettings settings;
    settings.max_redirects = 2;
    linkcheck::HttpFetcher fetcher(settings);

    EXPECT_THROW(fetcher.fetch(server.url("/loop")), std::runtime_error);
}

TEST(HttpFetcher, RejectsUnsupportedUrls) {
    linkcheck::HttpFetcher fetcher;
    EXPECT_THROW(fetcher.fetch("ftp://example.com/file"), std::invalid_argument);
    EXPECT_THROW(fetcher.fetch("http:///nohost"), std::invalid_argument);
}

TEST(HttpFetcher, RefusedConnectionThrows) {
    asio::io_context ioc;
    tcp::acceptor listener(ioc, {asio::ip::make_address("127.0.0.1"), 0});
    auto port = listener.local_endpoint().port();
    listener.close();

    linkcheck::HttpFetcher fetcher;
    EXPECT_THROW(fetcher.fetch("http://127.0.0.1:" + std::to_string(port) + "/"),
                 std::exception);
}

TEST(HttpFetcher, UnansweredRequestTimesOut) {
    SilentServer server;
    linkcheck::FetchSettings settings;
    settings.timeout = std::chrono::seconds(1);
    linkcheck::HttpFetcher fetcher(settings);

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(fetcher.fetch(server.url()), std::exception);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
}
