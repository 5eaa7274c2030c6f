#include <memory>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <boost/asio/strand.hpp>
#include "MemcachedClient.hpp"

namespace
{

using Results = boost::asio::ip::tcp::resolver::results_type;

// Name lookup raced against a deadline. Cancelling a resolver does not stop a
// getaddrinfo call already running, so whichever of the two finishes first
// completes the operation and the other is ignored.
template <typename Handler>
class BoundedResolve : public std::enable_shared_from_this<BoundedResolve<Handler>>
{
public:
    BoundedResolve(Handler handler, boost::asio::any_io_executor const& executor)
        : handler(std::move(handler))
        , resolver(boost::asio::make_strand(executor))
        , deadline(resolver.get_executor())
    {
    }

    void start(std::string const& host, std::string const& port, std::chrono::milliseconds timeout)
    {
        auto self = this->shared_from_this();

        deadline.expires_after(timeout);
        deadline.async_wait([self](boost::system::error_code const& ec)
        {
            if (!ec)
                self->finish(boost::beast::error::timeout, {});
        });

        resolver.async_resolve(host, port, [self](boost::system::error_code const& ec, Results results)
        {
            self->deadline.cancel();
            self->finish(ec, std::move(results));
        });
    }

private:
    Handler handler;
    boost::asio::ip::tcp::resolver resolver;
    boost::asio::steady_timer deadline;
    bool done = false;

    // Runs on the strand shared by resolver and deadline.
    void finish(boost::system::error_code ec, Results results)
    {
        if (done)
            return;
        done = true;

        auto executor = boost::asio::get_associated_executor(handler, resolver.get_executor());
        boost::asio::post(executor, [h = std::move(handler), ec, results = std::move(results)]() mutable
        {
            h(ec, std::move(results));
        });
    }
};

template <typename CompletionToken>
auto asyncResolveWithin(boost::asio::any_io_executor executor, std::string const& host, std::string const& port,
                        std::chrono::milliseconds timeout, CompletionToken&& token)
{
    return boost::asio::async_initiate<CompletionToken, void(boost::system::error_code, Results)>(
        [executor](auto handler, std::string host, std::string port, std::chrono::milliseconds timeout)
        {
            using Handler = std::decay_t<decltype(handler)>;
            std::make_shared<BoundedResolve<Handler>>(std::move(handler), executor)->start(host, port, timeout);
        },
        token, host, port, timeout);
}

}

MemcachedClient::MemcachedClient(std::string host, std::string port, std::chrono::milliseconds timeout)
    : host(std::move(host))
    , port(std::move(port))
    , timeout(timeout)
{
}

void MemcachedClient::checkKey(std::string const& key)
{
    if (key.empty() || key.size() > 250)
        throw std::invalid_argument("memcached key length out of range: " + key);

    for (char c : key)
    {
        if (static_cast<unsigned char>(c) <= 32 || c == 127)
            throw std::invalid_argument("memcached key contains whitespace or control characters: " + key);
    }
}

boost::asio::awaitable<void> MemcachedClient::connect(boost::beast::tcp_stream& stream)
{
    auto results = co_await asyncResolveWithin(stream.get_executor(), host, port, timeout, boost::asio::use_awaitable);

    stream.expires_after(timeout);
    co_await stream.async_connect(results, boost::asio::use_awaitable);
}

boost::asio::awaitable<std::string> MemcachedClient::readLine(boost::beast::tcp_stream& stream, std::string& buffer)
{
    std::size_t n = co_await boost::asio::async_read_until(stream, boost::asio::dynamic_buffer(buffer), "\r\n", boost::asio::use_awaitable);

    std::string line = buffer.substr(0, n - 2);
    buffer.erase(0, n);
    co_return line;
}

boost::asio::awaitable<void> MemcachedClient::readAtLeast(boost::beast::tcp_stream& stream, std::string& buffer, std::size_t size)
{
    if (buffer.size() >= size)
        co_return;

    co_await boost::asio::async_read(stream, boost::asio::dynamic_buffer(buffer),
                                     boost::asio::transfer_at_least(size - buffer.size()),
                                     boost::asio::use_awaitable);
}

boost::asio::awaitable<std::optional<std::string>> MemcachedClient::get(std::string const& key)
{
    checkKey(key);

    boost::beast::tcp_stream stream(co_await boost::asio::this_coro::executor);
    co_await connect(stream);

    std::string request = "get " + key + "\r\n";
    co_await boost::asio::async_write(stream, boost::asio::buffer(request), boost::asio::use_awaitable);

    std::string buffer;
    std::string line = co_await readLine(stream, buffer);

    if (line == "END")
        co_return std::nullopt;

    // VALUE <key> <flags> <bytes>
    std::istringstream header(line);
    std::string keyword, returnedKey;
    unsigned long flags = 0;
    std::size_t bytes = 0;
    if (!(header >> keyword >> returnedKey >> flags >> bytes) || keyword != "VALUE" || returnedKey != key)
        throw std::runtime_error("unexpected memcached reply: " + line);

    static const std::string trailer = "\r\nEND\r\n";
    co_await readAtLeast(stream, buffer, bytes + trailer.size());

    if (buffer.compare(bytes, trailer.size(), trailer) != 0)
        throw std::runtime_error("malformed memcached value block for " + key);

    boost::beast::error_code ignore;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignore);

    co_return buffer.substr(0, bytes);
}

boost::asio::awaitable<void> MemcachedClient::set(std::string const& key, std::string const& value, std::chrono::seconds ttl)
{
    checkKey(key);

    boost::beast::tcp_stream stream(co_await boost::asio::this_coro::executor);
    co_await connect(stream);

    std::string request = "set " + key + " 0 " + std::to_string(ttl.count()) + " " + std::to_string(value.size()) + "\r\n";
    request.append(value);
    request.append("\r\n");
    co_await boost::asio::async_write(stream, boost::asio::buffer(request), boost::asio::use_awaitable);

    std::string buffer;
    std::string line = co_await readLine(stream, buffer);
    if (line != "STORED")
        throw std::runtime_error("memcached refused " + key + ": " + line);

    boost::beast::error_code ignore;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignore);
}
