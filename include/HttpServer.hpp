#pragma once
#include <memory>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "EndpointRouter.hpp"
#include "FeedService.hpp"

class HttpServer
{
public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    HttpServer(FeedService& feeds, EndpointRouter router, bool corsEnabled);

    boost::asio::awaitable<Response> handleRequest(Request const& request);

    // Accepts on the given endpoint until the io_context stops.
    void listen(boost::asio::io_context& ioc, boost::asio::ip::tcp::endpoint const& endpoint);

private:
    FeedService& feeds;
    EndpointRouter router;
    bool corsEnabled;

    static constexpr std::chrono::seconds IDLE_TIMEOUT{30};

    boost::asio::awaitable<void> acceptLoop(std::shared_ptr<boost::asio::ip::tcp::acceptor> acceptor);
    boost::asio::awaitable<void> handleHttpClient(boost::asio::ip::tcp::socket socket);
    Response makeResponse(Request const& request, boost::beast::http::status status,
                          std::string body, std::string const& contentType) const;
};
