#include "InMemoryCache.hpp"
#include "VirtualClock.hpp"

boost::asio::awaitable<std::optional<std::string>> InMemoryCache::get(std::string const& key)
{
    std::lock_guard<std::mutex> lock(mutex);

    auto it = entries.find(key);
    if (it == entries.end())
        co_return std::nullopt;

    if (VirtualClock::now() >= it->second.expiresAt)
    {
        entries.erase(it);
        co_return std::nullopt;
    }

    co_return it->second.value;
}

boost::asio::awaitable<void> InMemoryCache::set(std::string const& key, std::string const& value, std::chrono::seconds ttl)
{
    std::lock_guard<std::mutex> lock(mutex);
    entries[key] = Entry{value, VirtualClock::now() + static_cast<std::time_t>(ttl.count())};
    co_return;
}

std::size_t InMemoryCache::size()
{
    std::lock_guard<std::mutex> lock(mutex);
    return entries.size();
}
