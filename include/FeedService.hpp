#pragma once
#include <string>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include "GtfsRealtime.hpp"
#include "Types.hpp"
#include "RowSource.hpp"
#include "ResponseCache.hpp"
#include "ConfigurationManager.hpp"

struct FeedResponse
{
    std::string body;
    std::string contentType;
    bool fromCache = false;
};

// One request through the pipeline: cache lookup, then on a miss fetch,
// assemble, wrap, serialize and store. A null cache means caching is off.
class FeedService
{
private:
    RowSource& rows;
    ResponseCache* cache;
    ConfigurationManager const& config;

public:
    FeedService(RowSource& rows, ResponseCache* cache, ConfigurationManager const& config);

    boost::asio::awaitable<FeedResponse> respond(FeedKind kind, FeedFormat format);

    // Fresh envelope straight from the row source.
    transit_realtime::FeedMessage assemble(FeedKind kind);

    static std::string cacheKey(std::string const& route, FeedFormat format);
};
