#include <iostream>
#include <algorithm>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "ChangeListener.hpp"
#include "MqttPacket.hpp"

ChangeListener::ChangeListener(BrokerSettings settings, Listener& listener)
    : settings(std::move(settings))
    , listener(listener)
{
}

ChangeListener::~ChangeListener()
{
    stop();
}

void ChangeListener::start()
{
    if (worker.joinable())
        return;

    boost::asio::co_spawn(ioContext, run(), boost::asio::detached);
    worker = std::thread([this]()
    {
        try
        {
            ioContext.run();
        }
        catch (std::exception const& e)
        {
            std::cerr << "[Listener] Stopped: " << e.what() << std::endl;
        }
    });

    std::cout << "[Listener] Subscribing to " << settings.topic << " at "
              << settings.host << ":" << settings.port << std::endl;
}

void ChangeListener::stop()
{
    ioContext.stop();
    if (worker.joinable())
        worker.join();
}

std::chrono::seconds ChangeListener::idleTimeout() const
{
    return std::chrono::seconds(settings.keepAliveSeconds) * 3 / 2;
}

boost::asio::awaitable<void> ChangeListener::run()
{
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    std::chrono::seconds backoff = INITIAL_BACKOFF;

    for (;;)
    {
        try
        {
            co_await session();
            backoff = INITIAL_BACKOFF;
        }
        catch (boost::system::system_error const& e)
        {
            if (e.code() == boost::asio::error::operation_aborted)
                co_return;
            std::cerr << "[Listener] Broker connection lost: " << e.what() << std::endl;
        }
        catch (std::exception const& e)
        {
            std::cerr << "[Listener] Broker error: " << e.what() << std::endl;
        }

        std::cout << "[Listener] Reconnecting in " << backoff.count() << "s" << std::endl;
        timer.expires_after(backoff);
        co_await timer.async_wait(boost::asio::use_awaitable);
        backoff = std::min(backoff * 2, MAX_BACKOFF);
    }
}

boost::asio::awaitable<void> ChangeListener::send(boost::beast::tcp_stream& stream, std::string const& packet)
{
    stream.expires_after(idleTimeout());
    co_await boost::asio::async_write(stream, boost::asio::buffer(packet), boost::asio::use_awaitable);
}

boost::asio::awaitable<std::uint8_t> ChangeListener::readPacket(boost::beast::tcp_stream& stream, std::string& body)
{
    std::uint8_t header = 0;
    stream.expires_after(idleTimeout());
    co_await boost::asio::async_read(stream, boost::asio::buffer(&header, 1), boost::asio::use_awaitable);

    std::uint32_t value = 0;
    int position = 0;
    std::optional<std::uint32_t> length;
    while (!length)
    {
        std::uint8_t byte = 0;
        co_await boost::asio::async_read(stream, boost::asio::buffer(&byte, 1), boost::asio::use_awaitable);
        length = MqttPacket::decodeRemainingLength(byte, value, position);
    }

    body.assign(*length, '\0');
    if (*length > 0)
        co_await boost::asio::async_read(stream, boost::asio::buffer(body), boost::asio::use_awaitable);

    co_return header;
}

boost::asio::awaitable<void> ChangeListener::keepAlive(std::shared_ptr<boost::beast::tcp_stream> stream)
{
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    std::string const ping = MqttPacket::encodePingreq();

    try
    {
        for (;;)
        {
            timer.expires_after(std::chrono::seconds(settings.keepAliveSeconds) / 2);
            co_await timer.async_wait(boost::asio::use_awaitable);
            co_await send(*stream, ping);
        }
    }
    catch (std::exception const& e)
    {
        if (stream->socket().is_open())
            std::cerr << "[Listener] Keepalive failed: " << e.what() << std::endl;

        // Closing wakes the reader, which then reconnects.
        boost::beast::error_code ignore;
        stream->socket().close(ignore);
    }
}

boost::asio::awaitable<void> ChangeListener::session()
{
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::ip::tcp::resolver resolver(executor);
    auto stream = std::make_shared<boost::beast::tcp_stream>(executor);

    // Ends the pinger together with this session.
    struct CloseOnExit
    {
        std::shared_ptr<boost::beast::tcp_stream> stream;
        ~CloseOnExit()
        {
            boost::beast::error_code ignore;
            stream->socket().close(ignore);
        }
    } closeOnExit{stream};

    auto results = co_await resolver.async_resolve(settings.host, settings.port, boost::asio::use_awaitable);
    stream->expires_after(idleTimeout());
    co_await stream->async_connect(results, boost::asio::use_awaitable);

    co_await send(*stream, MqttPacket::encodeConnect(settings.clientId, settings.keepAliveSeconds));

    std::string body;
    std::uint8_t type = co_await readPacket(*stream, body);
    if ((type & 0xF0) != MqttPacket::CONNACK)
        throw std::runtime_error("expected CONNACK from broker");
    if (std::uint8_t code = MqttPacket::decodeConnack(body); code != 0)
        throw std::runtime_error("broker refused connection, code " + std::to_string(code));

    co_await send(*stream, MqttPacket::encodeSubscribe(SUBSCRIBE_PACKET_ID, settings.topic));

    type = co_await readPacket(*stream, body);
    if ((type & 0xF0) != MqttPacket::SUBACK)
        throw std::runtime_error("expected SUBACK from broker");
    if (MqttPacket::decodeSuback(body, SUBSCRIBE_PACKET_ID) == 0x80)
        throw std::runtime_error("broker refused subscription to " + settings.topic);

    std::cout << "[Listener] Subscribed to " << settings.topic << std::endl;

    boost::asio::co_spawn(executor, keepAlive(stream), boost::asio::detached);

    for (;;)
    {
        type = co_await readPacket(*stream, body);

        switch (type & 0xF0)
        {
        case MqttPacket::PUBLISH:
        {
            auto publish = MqttPacket::decodePublish(type & 0x0F, body);
            if (publish.qos == 1)
                co_await send(*stream, MqttPacket::encodePuback(publish.packetId));
            listener.onMessage(publish.topic, publish.payload);
            break;
        }
        case MqttPacket::PINGRESP:
            break;
        default:
            std::cerr << "[Listener] Ignoring MQTT packet type " << static_cast<int>(type >> 4) << std::endl;
            break;
        }
    }
}
