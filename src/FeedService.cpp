#include <iostream>
#include "FeedService.hpp"
#include "FeedAssembler.hpp"
#include "EnvelopeBuilder.hpp"
#include "FeedSerializer.hpp"

FeedService::FeedService(RowSource& rows, ResponseCache* cache, ConfigurationManager const& config)
    : rows(rows)
    , cache(cache)
    , config(config)
{
}

std::string FeedService::cacheKey(std::string const& route, FeedFormat format)
{
    return route + (format == FeedFormat::Json ? "-json" : "-pbf");
}

transit_realtime::FeedMessage FeedService::assemble(FeedKind kind)
{
    switch (kind)
    {
    case FeedKind::TripUpdates:
        return EnvelopeBuilder::build(FeedAssembler::assembleTripUpdates(rows.fetchTripUpdates()));
    case FeedKind::VehiclePositions:
        return EnvelopeBuilder::build(FeedAssembler::assembleVehiclePositions(rows.fetchVehiclePositions()));
    case FeedKind::ServiceAlerts:
        break;
    }
    return EnvelopeBuilder::build(FeedAssembler::assembleServiceAlerts(rows.fetchServiceAlerts()));
}

boost::asio::awaitable<FeedResponse> FeedService::respond(FeedKind kind, FeedFormat format)
{
    std::string const key = cacheKey(config.getRoute(kind), format);
    std::string const contentType = FeedSerializer::contentType(format);
    bool useCache = cache != nullptr;

    if (useCache)
    {
        try
        {
            std::optional<std::string> hit = co_await cache->get(key);
            if (hit)
                co_return FeedResponse{std::move(*hit), contentType, true};
        }
        catch (std::exception const& e)
        {
            std::cerr << "[Cache] Lookup of " << key << " failed, serving uncached: " << e.what() << std::endl;
            useCache = false;
        }
    }

    std::string body = FeedSerializer::serialize(assemble(kind), format);

    if (useCache)
    {
        try
        {
            co_await cache->set(key, body, config.getTtl(kind));
        }
        catch (std::exception const& e)
        {
            std::cerr << "[Cache] Store of " << key << " failed: " << e.what() << std::endl;
        }
    }

    co_return FeedResponse{std::move(body), contentType, false};
}
