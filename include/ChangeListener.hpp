#pragma once
#include <string>
#include <thread>
#include <chrono>
#include <cstdint>
#include <memory>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/beast/core.hpp>
#include "Listener.hpp"

struct BrokerSettings
{
    std::string host;
    std::string port;
    std::string topic;
    std::string clientId;
    std::uint16_t keepAliveSeconds = 60;
};

// MQTT subscription on its own thread and io_context. Connection failures are
// logged and retried with backoff; nothing here touches request serving.
class ChangeListener
{
private:
    BrokerSettings settings;
    Listener& listener;
    boost::asio::io_context ioContext;
    std::thread worker;

    static constexpr std::chrono::seconds INITIAL_BACKOFF{1};
    static constexpr std::chrono::seconds MAX_BACKOFF{60};
    static constexpr std::uint16_t SUBSCRIBE_PACKET_ID = 1;

    boost::asio::awaitable<void> run();
    boost::asio::awaitable<void> session();
    boost::asio::awaitable<void> keepAlive(std::shared_ptr<boost::beast::tcp_stream> stream);
    boost::asio::awaitable<void> send(boost::beast::tcp_stream& stream, std::string const& packet);
    boost::asio::awaitable<std::uint8_t> readPacket(boost::beast::tcp_stream& stream, std::string& body);
    std::chrono::seconds idleTimeout() const;

public:
    ChangeListener(BrokerSettings settings, Listener& listener);
    ~ChangeListener();

    ChangeListener(ChangeListener const&) = delete;
    ChangeListener& operator=(ChangeListener const&) = delete;

    void start();
    void stop();
};
