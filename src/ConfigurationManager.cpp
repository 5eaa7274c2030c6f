#include <fstream>
#include <iostream>
#include <stdexcept>
#include <filesystem>
#include <boost/program_options.hpp>
#include "ConfigurationManager.hpp"

namespace bpo = boost::program_options;

ConfigurationManager::ConfigurationManager() = default;

void ConfigurationManager::load(std::string const& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        std::cout << "[System] No configuration at " << path << ", using defaults." << std::endl;
        return;
    }

    std::ifstream file(path);
    if (!file.is_open())
        throw std::runtime_error("Could not open configuration " + path);

    load(file);
    std::cout << "[System] Configuration loaded from " << path << std::endl;
}

void ConfigurationManager::load(std::istream& in)
{
    ServerSettings s = server;
    RouteSettings r = routes;
    NotificationSettings n = notifications;
    std::string cacheEndpoint = caching.serverEndpoint;
    std::int64_t port = s.port;
    std::int64_t threads = s.workerThreads;
    std::int64_t alertsTtl = caching.serviceAlertsTtl.count();
    std::int64_t tripUpdatesTtl = caching.tripUpdatesTtl.count();
    std::int64_t vehiclePositionsTtl = caching.vehiclePositionsTtl.count();
    std::int64_t timeoutMs = caching.timeout.count();
    std::int64_t brokerPort = std::stoll(n.broker.port);
    std::int64_t keepAlive = n.broker.keepAliveSeconds;

    bpo::options_description desc("Configuration");
    desc.add_options()
        ("app.caching_enabled", bpo::value(&s.cachingEnabled)->default_value(s.cachingEnabled))
        ("app.cors_enabled", bpo::value(&s.corsEnabled)->default_value(s.corsEnabled))
        ("app.listen_address", bpo::value(&s.address)->default_value(s.address))
        ("app.listen_port", bpo::value(&port)->default_value(port))
        ("app.worker_threads", bpo::value(&threads)->default_value(threads))
        ("routing.service_alerts_endpoint", bpo::value(&r.serviceAlerts)->default_value(r.serviceAlerts))
        ("routing.trip_updates_endpoint", bpo::value(&r.tripUpdates)->default_value(r.tripUpdates))
        ("routing.vehicle_positions_endpoint", bpo::value(&r.vehiclePositions)->default_value(r.vehiclePositions))
        ("caching.caching_server_endpoint", bpo::value(&cacheEndpoint)->default_value(cacheEndpoint))
        ("caching.caching_service_alerts_ttl_seconds", bpo::value(&alertsTtl)->default_value(alertsTtl))
        ("caching.caching_trip_updates_ttl_seconds", bpo::value(&tripUpdatesTtl)->default_value(tripUpdatesTtl))
        ("caching.caching_vehicle_positions_ttl_seconds", bpo::value(&vehiclePositionsTtl)->default_value(vehiclePositionsTtl))
        ("caching.caching_timeout_ms", bpo::value(&timeoutMs)->default_value(timeoutMs))
        ("notifications.notifications_enabled", bpo::value(&n.enabled)->default_value(n.enabled))
        ("notifications.broker_host", bpo::value(&n.broker.host)->default_value(n.broker.host))
        ("notifications.broker_port", bpo::value(&brokerPort)->default_value(brokerPort))
        ("notifications.topic", bpo::value(&n.broker.topic)->default_value(n.broker.topic))
        ("notifications.client_id", bpo::value(&n.broker.clientId)->default_value(n.broker.clientId))
        ("notifications.keep_alive_seconds", bpo::value(&keepAlive)->default_value(keepAlive));

    try
    {
        bpo::variables_map vm;
        bpo::store(bpo::parse_config_file(in, desc, false), vm);
        bpo::notify(vm);
    }
    catch (bpo::error const& e)
    {
        throw std::runtime_error(std::string("Malformed configuration: ") + e.what());
    }

    auto inRange = [](std::int64_t value, std::int64_t min, std::int64_t max, char const* name)
    {
        if (value < min || value > max)
            throw std::runtime_error(std::string("Malformed configuration: ") + name + " out of range");
    };

    inRange(port, 1, 65535, "app.listen_port");
    inRange(threads, 1, 256, "app.worker_threads");
    inRange(alertsTtl, 1, MAX_TTL_SECONDS, "caching.caching_service_alerts_ttl_seconds");
    inRange(tripUpdatesTtl, 1, MAX_TTL_SECONDS, "caching.caching_trip_updates_ttl_seconds");
    inRange(vehiclePositionsTtl, 1, MAX_TTL_SECONDS, "caching.caching_vehicle_positions_ttl_seconds");
    inRange(timeoutMs, 1, 60000, "caching.caching_timeout_ms");
    inRange(brokerPort, 1, 65535, "notifications.broker_port");
    inRange(keepAlive, 2, 65535, "notifications.keep_alive_seconds");

    s.port = static_cast<std::uint16_t>(port);
    s.workerThreads = static_cast<unsigned>(threads);
    n.broker.port = std::to_string(brokerPort);
    n.broker.keepAliveSeconds = static_cast<std::uint16_t>(keepAlive);

    CacheSettings c;
    c.serverEndpoint = cacheEndpoint;
    c.serviceAlertsTtl = std::chrono::seconds(alertsTtl);
    c.tripUpdatesTtl = std::chrono::seconds(tripUpdatesTtl);
    c.vehiclePositionsTtl = std::chrono::seconds(vehiclePositionsTtl);
    c.timeout = std::chrono::milliseconds(timeoutMs);

    ConfigurationManager previous = *this;
    server = s;
    routes = r;
    caching = c;
    notifications = n;

    try
    {
        validate();
    }
    catch (std::runtime_error const&)
    {
        *this = previous;
        throw;
    }
}

void ConfigurationManager::validate() const
{
    for (std::string const* route : {&routes.serviceAlerts, &routes.tripUpdates, &routes.vehiclePositions})
    {
        if (route->empty() || route->front() != '/' || route->find_first_of("?# ") != std::string::npos)
            throw std::runtime_error("Malformed configuration: invalid route '" + *route + "'");
    }

    if (routes.serviceAlerts == routes.tripUpdates ||
        routes.serviceAlerts == routes.vehiclePositions ||
        routes.tripUpdates == routes.vehiclePositions)
    {
        throw std::runtime_error("Malformed configuration: feed routes must be distinct");
    }

    if (server.cachingEnabled && caching.serverEndpoint != MEMORY_CACHE)
        splitEndpoint(caching.serverEndpoint);

    if (notifications.enabled && (notifications.broker.host.empty() || notifications.broker.topic.empty()))
        throw std::runtime_error("Malformed configuration: broker host and topic are required");
}

std::pair<std::string, std::string> ConfigurationManager::splitEndpoint(std::string const& endpoint)
{
    auto colon = endpoint.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == endpoint.size())
        throw std::runtime_error("Malformed configuration: cache endpoint '" + endpoint + "' is not host:port");

    std::string host = endpoint.substr(0, colon);
    std::string port = endpoint.substr(colon + 1);
    if (port.find_first_not_of("0123456789") != std::string::npos)
        throw std::runtime_error("Malformed configuration: cache endpoint '" + endpoint + "' has a bad port");

    return {host, port};
}

ServerSettings const& ConfigurationManager::getServer() const noexcept { return server; }
RouteSettings const& ConfigurationManager::getRoutes() const noexcept { return routes; }
CacheSettings const& ConfigurationManager::getCaching() const noexcept { return caching; }
NotificationSettings const& ConfigurationManager::getNotifications() const noexcept { return notifications; }

std::string const& ConfigurationManager::getRoute(FeedKind kind) const noexcept
{
    switch (kind)
    {
    case FeedKind::TripUpdates:
        return routes.tripUpdates;
    case FeedKind::VehiclePositions:
        return routes.vehiclePositions;
    case FeedKind::ServiceAlerts:
        break;
    }
    return routes.serviceAlerts;
}

std::chrono::seconds ConfigurationManager::getTtl(FeedKind kind) const noexcept
{
    switch (kind)
    {
    case FeedKind::TripUpdates:
        return caching.tripUpdatesTtl;
    case FeedKind::VehiclePositions:
        return caching.vehiclePositionsTtl;
    case FeedKind::ServiceAlerts:
        break;
    }
    return caching.serviceAlertsTtl;
}
