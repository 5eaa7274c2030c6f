#include <thread>
#include "gtest/gtest.h"
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include "MemcachedClient.hpp"

namespace
{

using boost::asio::ip::tcp;

// Accepts one connection, reads a request of known size and answers with a
// canned reply.
class FakeMemcached
{
public:
    explicit FakeMemcached(boost::asio::io_context& ioc)
        : acceptor(ioc, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0))
    {
    }

    std::string port() const
    {
        return std::to_string(acceptor.local_endpoint().port());
    }

    boost::asio::awaitable<void> serveOnce(std::size_t requestSize, std::string reply)
    {
        tcp::socket socket = co_await acceptor.async_accept(boost::asio::use_awaitable);
        received.assign(requestSize, '\0');
        co_await boost::asio::async_read(socket, boost::asio::buffer(received), boost::asio::use_awaitable);
        co_await boost::asio::async_write(socket, boost::asio::buffer(reply), boost::asio::use_awaitable);
    }

    std::string received;

private:
    tcp::acceptor acceptor;
};

}

TEST(MemcachedClientTest, GetReturnsStoredValue)
{
    boost::asio::io_context ioc;
    FakeMemcached server(ioc);
    MemcachedClient client("127.0.0.1", server.port(), std::chrono::milliseconds(2000));

    std::string const value("\x0a\r\n\x00END", 7);
    std::string const request = "get /feed-pbf\r\n";
    std::string const reply = "VALUE /feed-pbf 0 7\r\n" + value + "\r\nEND\r\n";

    boost::asio::co_spawn(ioc, server.serveOnce(request.size(), reply), boost::asio::detached);
    auto result = boost::asio::co_spawn(ioc, client.get("/feed-pbf"), boost::asio::use_future);
    ioc.run();

    auto hit = result.get();
    EXPECT_EQ(request, server.received);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(value, *hit);
}

TEST(MemcachedClientTest, GetReportsMiss)
{
    boost::asio::io_context ioc;
    FakeMemcached server(ioc);
    MemcachedClient client("127.0.0.1", server.port(), std::chrono::milliseconds(2000));

    std::string const request = "get /feed-json\r\n";
    boost::asio::co_spawn(ioc, server.serveOnce(request.size(), "END\r\n"), boost::asio::detached);
    auto result = boost::asio::co_spawn(ioc, client.get("/feed-json"), boost::asio::use_future);
    ioc.run();

    EXPECT_FALSE(result.get().has_value());
}

TEST(MemcachedClientTest, SetSendsTtlAndPayload)
{
    boost::asio::io_context ioc;
    FakeMemcached server(ioc);
    MemcachedClient client("127.0.0.1", server.port(), std::chrono::milliseconds(2000));

    std::string const request = "set /feed-json 0 15 2\r\n{}\r\n";
    boost::asio::co_spawn(ioc, server.serveOnce(request.size(), "STORED\r\n"), boost::asio::detached);
    auto result = boost::asio::co_spawn(ioc, client.set("/feed-json", "{}", std::chrono::seconds(15)), boost::asio::use_future);
    ioc.run();

    EXPECT_NO_THROW(result.get());
    EXPECT_EQ(request, server.received);
}

TEST(MemcachedClientTest, RefusedStoreThrows)
{
    boost::asio::io_context ioc;
    FakeMemcached server(ioc);
    MemcachedClient client("127.0.0.1", server.port(), std::chrono::milliseconds(2000));

    std::string const request = "set /k 0 15 1\r\nx\r\n";
    boost::asio::co_spawn(ioc, server.serveOnce(request.size(), "SERVER_ERROR out of memory\r\n"), boost::asio::detached);
    auto result = boost::asio::co_spawn(ioc, client.set("/k", "x", std::chrono::seconds(15)), boost::asio::use_future);
    ioc.run();

    EXPECT_THROW(result.get(), std::runtime_error);
}

TEST(MemcachedClientTest, UnreachableServerThrows)
{
    boost::asio::io_context ioc;
    std::string port;
    {
        tcp::acceptor reserved(ioc, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        port = std::to_string(reserved.local_endpoint().port());
    }

    MemcachedClient client("127.0.0.1", port, std::chrono::milliseconds(2000));
    auto result = boost::asio::co_spawn(ioc, client.get("/feed-pbf"), boost::asio::use_future);
    ioc.run();

    EXPECT_THROW(result.get(), boost::system::system_error);
}

TEST(MemcachedClientTest, KeysWithWhitespaceAreRejected)
{
    boost::asio::io_context ioc;
    MemcachedClient client("127.0.0.1", "11211", std::chrono::milliseconds(100));

    auto result = boost::asio::co_spawn(ioc, client.get("/bad key"), boost::asio::use_future);
    ioc.run();

    EXPECT_THROW(result.get(), std::invalid_argument);
}

TEST(MemcachedClientTest, SilentServerTimesOut)
{
    boost::asio::io_context ioc;
    tcp::acceptor silent(ioc, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    MemcachedClient client("127.0.0.1", std::to_string(silent.local_endpoint().port()), std::chrono::milliseconds(200));

    auto result = boost::asio::co_spawn(ioc, client.get("/feed-pbf"), boost::asio::use_future);
    ioc.run();

    EXPECT_THROW(result.get(), boost::system::system_error);
}

TEST(MemcachedClientTest, NameLookupIsBoundedByTimeout)
{
    boost::asio::io_context ioc;
    MemcachedClient client("cache.invalid", "11211", std::chrono::milliseconds(300));

    auto result = boost::asio::co_spawn(ioc, client.get("/feed-pbf"), boost::asio::use_future);
    std::thread runner([&ioc]() { ioc.run(); });

    auto status = result.wait_for(std::chrono::seconds(3));
    ioc.stop();
    runner.join();

    ASSERT_EQ(std::future_status::ready, status);
    EXPECT_THROW(result.get(), boost::system::system_error);
}
