#pragma once
#include <vector>
#include "GtfsRealtime.hpp"
#include "Types.hpp"

#ifndef REALTIME_FEED_ALERT_LANGUAGE
#define REALTIME_FEED_ALERT_LANGUAGE "de-DE"
#endif

// Turns row snapshots into feed entities. Parent order is kept as delivered;
// children are attached by id equality in their own order, orphans dropped.
class FeedAssembler
{
public:
    static inline const std::string ALERT_LANGUAGE = REALTIME_FEED_ALERT_LANGUAGE;

    static std::vector<transit_realtime::FeedEntity> assembleServiceAlerts(ServiceAlertSnapshot const& snapshot);
    static std::vector<transit_realtime::FeedEntity> assembleTripUpdates(TripUpdateSnapshot const& snapshot);
    static std::vector<transit_realtime::FeedEntity> assembleVehiclePositions(std::vector<VehiclePositionRow> const& rows);

private:
    static void fillTranslatedString(transit_realtime::TranslatedString& target, std::string const& text);
    static void fillInformedEntity(transit_realtime::EntitySelector& target, AlertInformedEntityRow const& row);
    static void fillStopTimeUpdate(transit_realtime::TripUpdate_StopTimeUpdate& target, StopTimeUpdateRow const& row);
    static void fillStopTimeEvent(transit_realtime::TripUpdate_StopTimeEvent& target,
                                  std::optional<std::int64_t> const& time,
                                  std::optional<std::int64_t> const& delay,
                                  std::optional<std::int64_t> const& uncertainty);
};
