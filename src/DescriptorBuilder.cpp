#include "DescriptorBuilder.hpp"
#include "SchemaFields.hpp"

std::optional<transit_realtime::TripDescriptor> DescriptorBuilder::buildTripDescriptor(TripReference const& ref)
{
    if (!ref.tripId && !ref.routeId && !ref.directionId &&
        !ref.startTime && !ref.startDate && !ref.scheduleRelationship)
    {
        return std::nullopt;
    }

    transit_realtime::TripDescriptor trip;

    if (ref.tripId)
        trip.set_trip_id(*ref.tripId);

    if (ref.routeId)
        trip.set_route_id(*ref.routeId);

    if (ref.directionId)
        trip.set_direction_id(SchemaFields::toUint32(*ref.directionId, "trip.direction_id"));

    if (ref.startTime)
        trip.set_start_time(*ref.startTime);

    if (ref.startDate)
        trip.set_start_date(*ref.startDate);

    if (ref.scheduleRelationship)
    {
        trip.set_schedule_relationship(
            SchemaFields::toEnum<transit_realtime::TripDescriptor_ScheduleRelationship>(
                *ref.scheduleRelationship, "trip.schedule_relationship",
                transit_realtime::TripDescriptor_ScheduleRelationship_Parse,
                transit_realtime::TripDescriptor_ScheduleRelationship_IsValid));
    }

    return trip;
}

std::optional<transit_realtime::VehicleDescriptor> DescriptorBuilder::buildVehicleDescriptor(VehicleReference const& ref)
{
    if (!ref.id && !ref.label && !ref.licensePlate && !ref.wheelchairAccessible)
        return std::nullopt;

    transit_realtime::VehicleDescriptor vehicle;

    if (ref.id)
        vehicle.set_id(*ref.id);

    if (ref.label)
        vehicle.set_label(*ref.label);

    if (ref.licensePlate)
        vehicle.set_license_plate(*ref.licensePlate);

    if (ref.wheelchairAccessible)
    {
        vehicle.set_wheelchair_accessible(
            SchemaFields::toEnum<transit_realtime::VehicleDescriptor_WheelchairAccessible>(
                *ref.wheelchairAccessible, "vehicle.wheelchair_accessible",
                transit_realtime::VehicleDescriptor_WheelchairAccessible_Parse,
                transit_realtime::VehicleDescriptor_WheelchairAccessible_IsValid));
    }

    return vehicle;
}
