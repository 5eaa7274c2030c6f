#pragma once
#include <string>
#include <chrono>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include "ResponseCache.hpp"

// memcached text protocol client. Each operation opens its own connection, so
// one instance can be shared by every request coroutine.
class MemcachedClient : public ResponseCache
{
private:
    std::string host;
    std::string port;
    std::chrono::milliseconds timeout;

    boost::asio::awaitable<void> connect(boost::beast::tcp_stream& stream);
    boost::asio::awaitable<std::string> readLine(boost::beast::tcp_stream& stream, std::string& buffer);
    boost::asio::awaitable<void> readAtLeast(boost::beast::tcp_stream& stream, std::string& buffer, std::size_t size);
    static void checkKey(std::string const& key);

public:
    MemcachedClient(std::string host, std::string port, std::chrono::milliseconds timeout);

    boost::asio::awaitable<std::optional<std::string>> get(std::string const& key) override;
    boost::asio::awaitable<void> set(std::string const& key, std::string const& value, std::chrono::seconds ttl) override;
};
