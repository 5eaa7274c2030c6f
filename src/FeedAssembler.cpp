#include <unordered_map>
#include "FeedAssembler.hpp"
#include "DescriptorBuilder.hpp"
#include "SchemaFields.hpp"

namespace
{

// Groups child rows by parent id, preserving their relative order.
template <typename Row, typename Key>
std::unordered_map<std::string, std::vector<Row const*>> groupByParent(std::vector<Row> const& rows, Key key)
{
    std::unordered_map<std::string, std::vector<Row const*>> groups;
    for (Row const& row : rows)
    {
        auto const& id = key(row);
        if (id)
            groups[*id].push_back(&row);
    }
    return groups;
}

template <typename Row>
std::vector<Row const*> const& childrenOf(std::unordered_map<std::string, std::vector<Row const*>> const& groups,
                                          std::optional<std::string> const& parentId)
{
    static const std::vector<Row const*> none;
    if (!parentId)
        return none;

    auto it = groups.find(*parentId);
    return it != groups.end() ? it->second : none;
}

}

void FeedAssembler::fillTranslatedString(transit_realtime::TranslatedString& target, std::string const& text)
{
    auto* translation = target.add_translation();
    translation->set_text(text);
    translation->set_language(ALERT_LANGUAGE);
}

void FeedAssembler::fillInformedEntity(transit_realtime::EntitySelector& target, AlertInformedEntityRow const& row)
{
    if (row.agencyId)
        target.set_agency_id(*row.agencyId);

    if (row.routeId)
        target.set_route_id(*row.routeId);

    if (row.routeType)
        target.set_route_type(SchemaFields::toInt32(*row.routeType, "informed_entity.route_type"));

    if (row.stopId)
        target.set_stop_id(*row.stopId);

    if (auto trip = DescriptorBuilder::buildTripDescriptor(row.trip))
        *target.mutable_trip() = std::move(*trip);
}

std::vector<transit_realtime::FeedEntity> FeedAssembler::assembleServiceAlerts(ServiceAlertSnapshot const& snapshot)
{
    auto periods = groupByParent(snapshot.activePeriods,
                                 [](AlertActivePeriodRow const& r) -> auto const& { return r.serviceAlertId; });
    auto informed = groupByParent(snapshot.informedEntities,
                                  [](AlertInformedEntityRow const& r) -> auto const& { return r.serviceAlertId; });

    std::vector<transit_realtime::FeedEntity> entities;
    entities.reserve(snapshot.alerts.size());

    for (ServiceAlertRow const& row : snapshot.alerts)
    {
        transit_realtime::FeedEntity entity;
        if (row.serviceAlertId)
            entity.set_id(*row.serviceAlertId);

        auto* alert = entity.mutable_alert();

        if (row.cause)
        {
            alert->set_cause(SchemaFields::toEnum<transit_realtime::Alert_Cause>(
                *row.cause, "alert.cause",
                transit_realtime::Alert_Cause_Parse, transit_realtime::Alert_Cause_IsValid));
        }

        if (row.effect)
        {
            alert->set_effect(SchemaFields::toEnum<transit_realtime::Alert_Effect>(
                *row.effect, "alert.effect",
                transit_realtime::Alert_Effect_Parse, transit_realtime::Alert_Effect_IsValid));
        }

        if (row.headerText)
            fillTranslatedString(*alert->mutable_header_text(), *row.headerText);

        if (row.descriptionText)
            fillTranslatedString(*alert->mutable_description_text(), *row.descriptionText);

        for (AlertActivePeriodRow const* period : childrenOf(periods, row.serviceAlertId))
        {
            auto* range = alert->add_active_period();
            if (period->startTimestamp)
                range->set_start(SchemaFields::toUint64(*period->startTimestamp, "active_period.start"));
            if (period->endTimestamp)
                range->set_end(SchemaFields::toUint64(*period->endTimestamp, "active_period.end"));
        }

        for (AlertInformedEntityRow const* ie : childrenOf(informed, row.serviceAlertId))
            fillInformedEntity(*alert->add_informed_entity(), *ie);

        entities.push_back(std::move(entity));
    }

    return entities;
}

void FeedAssembler::fillStopTimeEvent(transit_realtime::TripUpdate_StopTimeEvent& target,
                                      std::optional<std::int64_t> const& time,
                                      std::optional<std::int64_t> const& delay,
                                      std::optional<std::int64_t> const& uncertainty)
{
    if (time)
        target.set_time(*time);

    if (delay)
        target.set_delay(SchemaFields::toInt32(*delay, "stop_time_event.delay"));

    if (uncertainty)
        target.set_uncertainty(SchemaFields::toInt32(*uncertainty, "stop_time_event.uncertainty"));
}

void FeedAssembler::fillStopTimeUpdate(transit_realtime::TripUpdate_StopTimeUpdate& target, StopTimeUpdateRow const& row)
{
    if (row.stopSequence)
        target.set_stop_sequence(SchemaFields::toUint32(*row.stopSequence, "stop_time_update.stop_sequence"));

    if (row.stopId)
        target.set_stop_id(*row.stopId);

    fillStopTimeEvent(*target.mutable_arrival(), row.arrivalTime, row.arrivalDelay, row.arrivalUncertainty);
    fillStopTimeEvent(*target.mutable_departure(), row.departureTime, row.departureDelay, row.departureUncertainty);

    // Always written; a NULL column means the schema default.
    auto relationship = transit_realtime::TripUpdate_StopTimeUpdate_ScheduleRelationship_SCHEDULED;
    if (row.scheduleRelationship)
    {
        relationship = SchemaFields::toEnum<transit_realtime::TripUpdate_StopTimeUpdate_ScheduleRelationship>(
            *row.scheduleRelationship, "stop_time_update.schedule_relationship",
            transit_realtime::TripUpdate_StopTimeUpdate_ScheduleRelationship_Parse,
            transit_realtime::TripUpdate_StopTimeUpdate_ScheduleRelationship_IsValid);
    }
    target.set_schedule_relationship(relationship);
}

std::vector<transit_realtime::FeedEntity> FeedAssembler::assembleTripUpdates(TripUpdateSnapshot const& snapshot)
{
    auto stopTimes = groupByParent(snapshot.stopTimeUpdates,
                                   [](StopTimeUpdateRow const& r) -> auto const& { return r.tripUpdateId; });

    std::vector<transit_realtime::FeedEntity> entities;
    entities.reserve(snapshot.tripUpdates.size());

    for (TripUpdateRow const& row : snapshot.tripUpdates)
    {
        transit_realtime::FeedEntity entity;
        if (row.tripUpdateId)
            entity.set_id(*row.tripUpdateId);

        auto* tripUpdate = entity.mutable_trip_update();

        if (auto trip = DescriptorBuilder::buildTripDescriptor(row.trip))
            *tripUpdate->mutable_trip() = std::move(*trip);

        if (auto vehicle = DescriptorBuilder::buildVehicleDescriptor(row.vehicle))
            *tripUpdate->mutable_vehicle() = std::move(*vehicle);

        for (StopTimeUpdateRow const* stu : childrenOf(stopTimes, row.tripUpdateId))
            fillStopTimeUpdate(*tripUpdate->add_stop_time_update(), *stu);

        entities.push_back(std::move(entity));
    }

    return entities;
}

std::vector<transit_realtime::FeedEntity> FeedAssembler::assembleVehiclePositions(std::vector<VehiclePositionRow> const& rows)
{
    std::vector<transit_realtime::FeedEntity> entities;
    entities.reserve(rows.size());

    for (VehiclePositionRow const& row : rows)
    {
        transit_realtime::FeedEntity entity;
        if (row.vehiclePositionId)
            entity.set_id(*row.vehiclePositionId);

        auto* vehicle = entity.mutable_vehicle();

        if (auto trip = DescriptorBuilder::buildTripDescriptor(row.trip))
            *vehicle->mutable_trip() = std::move(*trip);

        if (auto descriptor = DescriptorBuilder::buildVehicleDescriptor(row.vehicle))
            *vehicle->mutable_vehicle() = std::move(*descriptor);

        // latitude and longitude are required by the schema; a NULL leaves
        // them unset and the serializer rejects the feed.
        auto* position = vehicle->mutable_position();
        if (row.latitude)
            position->set_latitude(static_cast<float>(*row.latitude));
        if (row.longitude)
            position->set_longitude(static_cast<float>(*row.longitude));

        if (row.bearing)
            position->set_bearing(static_cast<float>(*row.bearing));

        if (row.odometer)
            position->set_odometer(*row.odometer);

        if (row.speed)
            position->set_speed(static_cast<float>(*row.speed));

        if (row.currentStopSequence)
            vehicle->set_current_stop_sequence(SchemaFields::toUint32(*row.currentStopSequence, "vehicle.current_stop_sequence"));

        if (row.stopId)
            vehicle->set_stop_id(*row.stopId);

        if (row.currentStatus)
        {
            vehicle->set_current_status(SchemaFields::toEnum<transit_realtime::VehiclePosition_VehicleStopStatus>(
                *row.currentStatus, "vehicle.current_status",
                transit_realtime::VehiclePosition_VehicleStopStatus_Parse,
                transit_realtime::VehiclePosition_VehicleStopStatus_IsValid));
        }

        if (row.timestamp)
            vehicle->set_timestamp(SchemaFields::toUint64(*row.timestamp, "vehicle.timestamp"));

        if (row.congestionLevel)
        {
            vehicle->set_congestion_level(SchemaFields::toEnum<transit_realtime::VehiclePosition_CongestionLevel>(
                *row.congestionLevel, "vehicle.congestion_level",
                transit_realtime::VehiclePosition_CongestionLevel_Parse,
                transit_realtime::VehiclePosition_CongestionLevel_IsValid));
        }

        entities.push_back(std::move(entity));
    }

    return entities;
}
