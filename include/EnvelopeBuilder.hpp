#pragma once
#include <vector>
#include <ctime>
#include "GtfsRealtime.hpp"

class EnvelopeBuilder
{
public:
    static inline const std::string GTFS_REALTIME_VERSION = "2.0";

    // Header carries the assembly time, never a time taken from the rows.
    static transit_realtime::FeedMessage build(std::vector<transit_realtime::FeedEntity> entities);
    static transit_realtime::FeedMessage build(std::vector<transit_realtime::FeedEntity> entities, std::time_t assembledAt);
};
