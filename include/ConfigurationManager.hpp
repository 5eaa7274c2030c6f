#pragma once
#include <string>
#include <chrono>
#include <istream>
#include <cstdint>
#include "Types.hpp"
#include "ChangeListener.hpp"

struct ServerSettings
{
    std::string address = "0.0.0.0";
    std::uint16_t port = 8080;
    unsigned workerThreads = 4;
    bool cachingEnabled = false;
    bool corsEnabled = false;
};

struct RouteSettings
{
    std::string serviceAlerts = "/gtfs/realtime/service-alerts.pbf";
    std::string tripUpdates = "/gtfs/realtime/trip-updates.pbf";
    std::string vehiclePositions = "/gtfs/realtime/vehicle-positions.pbf";
};

struct CacheSettings
{
    // "host:port" of a memcached server, or "memory" for a process-local cache.
    std::string serverEndpoint = "127.0.0.1:11211";
    std::chrono::seconds serviceAlertsTtl{60};
    std::chrono::seconds tripUpdatesTtl{30};
    std::chrono::seconds vehiclePositionsTtl{15};
    std::chrono::milliseconds timeout{500};
};

struct NotificationSettings
{
    bool enabled = true;
    BrokerSettings broker{"test.mosquitto.org", "1883", "any/topic", "realtime-feed", 60};
};

class ConfigurationManager
{
private:
    ServerSettings server;
    RouteSettings routes;
    CacheSettings caching;
    NotificationSettings notifications;

    void validate() const;

public:
    static inline const std::string CONFIG_ENV = "REALTIME_FEED_CONFIG";
    static inline const std::string MEMORY_CACHE = "memory";
    static constexpr std::int64_t MAX_TTL_SECONDS = 2592000;  // memcached reads larger values as timestamps

    // Built-in defaults.
    ConfigurationManager();

    // Missing file keeps the defaults; anything unreadable in an existing
    // file throws std::runtime_error.
    void load(std::string const& path);
    void load(std::istream& in);

    [[nodiscard]] ServerSettings const& getServer() const noexcept;
    [[nodiscard]] RouteSettings const& getRoutes() const noexcept;
    [[nodiscard]] CacheSettings const& getCaching() const noexcept;
    [[nodiscard]] NotificationSettings const& getNotifications() const noexcept;

    [[nodiscard]] std::string const& getRoute(FeedKind kind) const noexcept;
    [[nodiscard]] std::chrono::seconds getTtl(FeedKind kind) const noexcept;

    // Splits "host:port"; throws std::runtime_error when malformed.
    static std::pair<std::string, std::string> splitEndpoint(std::string const& endpoint);
};
