#pragma once
#include <string>
#include <ctime>
#include <mutex>
#include <unordered_map>
#include "ResponseCache.hpp"

// Process-local cache. Expiry is checked on read against VirtualClock.
class InMemoryCache : public ResponseCache
{
private:
    struct Entry
    {
        std::string value;
        std::time_t expiresAt;
    };

    std::unordered_map<std::string, Entry> entries;
    std::mutex mutex;

public:
    boost::asio::awaitable<std::optional<std::string>> get(std::string const& key) override;
    boost::asio::awaitable<void> set(std::string const& key, std::string const& value, std::chrono::seconds ttl) override;

    std::size_t size();
};
