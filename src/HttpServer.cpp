#include <iostream>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/version.hpp>
#include "HttpServer.hpp"

namespace http = boost::beast::http;

namespace
{

std::string_view targetOf(HttpServer::Request const& request)
{
    auto target = request.target();
    return std::string_view(target.data(), target.size());
}

}

HttpServer::HttpServer(FeedService& feeds, EndpointRouter router, bool corsEnabled)
    : feeds(feeds)
    , router(std::move(router))
    , corsEnabled(corsEnabled)
{
}

HttpServer::Response HttpServer::makeResponse(Request const& request, http::status status,
                                              std::string body, std::string const& contentType) const
{
    Response response(status, request.version());
    response.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    response.set(http::field::content_type, contentType);

    if (corsEnabled)
    {
        response.set(http::field::access_control_allow_origin, "*");
        response.set(http::field::access_control_allow_methods, "GET");
        response.set(http::field::access_control_allow_headers, "*");
    }

    response.keep_alive(request.keep_alive());
    response.body() = std::move(body);
    response.prepare_payload();
    return response;
}

boost::asio::awaitable<HttpServer::Response> HttpServer::handleRequest(Request const& request)
{
    std::optional<FeedKind> kind = router.match(targetOf(request));
    if (!kind)
        co_return makeResponse(request, http::status::not_found, "Not Found", "text/plain");

    if (request.method() == http::verb::options && corsEnabled)
        co_return makeResponse(request, http::status::no_content, "", "text/plain");

    if (request.method() != http::verb::get)
    {
        Response response = makeResponse(request, http::status::method_not_allowed, "Method Not Allowed", "text/plain");
        response.set(http::field::allow, "GET");
        co_return response;
    }

    FeedFormat format = EndpointRouter::parseFormat(targetOf(request));

    std::optional<FeedResponse> feed;
    try
    {
        feed = co_await feeds.respond(*kind, format);
    }
    catch (std::exception const& e)
    {
        std::cerr << "[HTTP] " << targetOf(request) << " failed: " << e.what() << std::endl;
    }

    if (!feed)
        co_return makeResponse(request, http::status::internal_server_error, "Internal Server Error", "text/plain");

    co_return makeResponse(request, http::status::ok, std::move(feed->body), feed->contentType);
}

boost::asio::awaitable<void> HttpServer::handleHttpClient(boost::asio::ip::tcp::socket socket)
{
    boost::beast::tcp_stream stream(std::move(socket));
    boost::beast::flat_buffer buffer;

    try
    {
        for (;;)
        {
            stream.expires_after(IDLE_TIMEOUT);

            Request request;
            co_await http::async_read(stream, buffer, request, boost::asio::use_awaitable);

            Response response = co_await handleRequest(request);
            bool keepAlive = response.keep_alive();

            stream.expires_after(IDLE_TIMEOUT);
            co_await http::async_write(stream, response, boost::asio::use_awaitable);

            if (!keepAlive)
                break;
        }

        boost::system::error_code ignore;
        stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignore);
    }
    catch (boost::system::system_error const& e)
    {
        auto code = e.code();
        if (code == http::error::end_of_stream ||
            code == boost::beast::error::timeout ||
            code == boost::asio::error::operation_aborted ||
            code == boost::asio::error::connection_reset ||
            code == boost::asio::error::connection_aborted ||
            code == boost::asio::error::eof)
        {
            co_return;
        }

        std::cerr << "[HTTP] Handler error: " << e.what() << "\n";
    }
    catch (std::exception const& e)
    {
        std::cerr << "[HTTP] Handler error: " << e.what() << "\n";
    }
}

boost::asio::awaitable<void> HttpServer::acceptLoop(std::shared_ptr<boost::asio::ip::tcp::acceptor> acceptor)
{
    for (;;)
    {
        boost::asio::ip::tcp::socket socket = co_await acceptor->async_accept(boost::asio::use_awaitable);
        auto executor = socket.get_executor();
        boost::asio::co_spawn(executor, handleHttpClient(std::move(socket)), boost::asio::detached);
    }
}

void HttpServer::listen(boost::asio::io_context& ioc, boost::asio::ip::tcp::endpoint const& endpoint)
{
    auto acceptor = std::make_shared<boost::asio::ip::tcp::acceptor>(ioc);
    acceptor->open(endpoint.protocol());
    acceptor->set_option(boost::asio::socket_base::reuse_address(true));
    acceptor->bind(endpoint);
    acceptor->listen(boost::asio::socket_base::max_listen_connections);

    boost::asio::co_spawn(ioc,
        [this, acceptor]() -> boost::asio::awaitable<void>
        {
            try
            {
                co_await acceptLoop(acceptor);
            }
            catch (boost::system::system_error const& e)
            {
                if (e.code() != boost::asio::error::operation_aborted)
                    std::cerr << "[HTTP] Accept loop stopped: " << e.what() << std::endl;
            }
        },
        boost::asio::detached);

    std::cout << "[HTTP] Serving feeds at http://" << endpoint << std::endl;
}
