#pragma once
#include <string>
#include <chrono>
#include <optional>
#include <utility>
#include <boost/asio/awaitable.hpp>

// Key/value store for serialized feeds. Entries expire on their own; callers
// never sweep. Implementations must tolerate concurrent callers.
class ResponseCache
{
public:
    virtual ~ResponseCache() = default;

    virtual boost::asio::awaitable<std::optional<std::string>> get(std::string const& key) = 0;
    virtual boost::asio::awaitable<void> set(std::string const& key, std::string const& value, std::chrono::seconds ttl) = 0;
};
