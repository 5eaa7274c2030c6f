#include "gtest/gtest.h"
#include "DescriptorBuilder.hpp"
#include "SchemaViolation.hpp"

TEST(DescriptorBuilderTest, AllNullTripFieldsYieldNoDescriptor)
{
    TripReference ref;
    EXPECT_FALSE(DescriptorBuilder::buildTripDescriptor(ref).has_value());
}

TEST(DescriptorBuilderTest, SingleTripFieldYieldsDescriptorWithOnlyThatField)
{
    TripReference ref;
    ref.routeId = "R5";

    auto trip = DescriptorBuilder::buildTripDescriptor(ref);
    ASSERT_TRUE(trip.has_value());
    EXPECT_TRUE(trip->has_route_id());
    EXPECT_EQ("R5", trip->route_id());
    EXPECT_FALSE(trip->has_trip_id());
    EXPECT_FALSE(trip->has_direction_id());
    EXPECT_FALSE(trip->has_start_time());
    EXPECT_FALSE(trip->has_start_date());
    EXPECT_FALSE(trip->has_schedule_relationship());
}

TEST(DescriptorBuilderTest, FalsyTripValuesCountAsPresent)
{
    TripReference ref;
    ref.directionId = 0;

    auto trip = DescriptorBuilder::buildTripDescriptor(ref);
    ASSERT_TRUE(trip.has_value());
    EXPECT_TRUE(trip->has_direction_id());
    EXPECT_EQ(0u, trip->direction_id());

    TripReference emptyId;
    emptyId.tripId = "";
    auto other = DescriptorBuilder::buildTripDescriptor(emptyId);
    ASSERT_TRUE(other.has_value());
    EXPECT_TRUE(other->has_trip_id());
}

TEST(DescriptorBuilderTest, AllTripFieldsAreCopied)
{
    TripReference ref;
    ref.tripId = "T1";
    ref.routeId = "R1";
    ref.directionId = 1;
    ref.startTime = "08:15:00";
    ref.startDate = "20240501";
    ref.scheduleRelationship = "CANCELED";

    auto trip = DescriptorBuilder::buildTripDescriptor(ref);
    ASSERT_TRUE(trip.has_value());
    EXPECT_EQ("T1", trip->trip_id());
    EXPECT_EQ("R1", trip->route_id());
    EXPECT_EQ(1u, trip->direction_id());
    EXPECT_EQ("08:15:00", trip->start_time());
    EXPECT_EQ("20240501", trip->start_date());
    EXPECT_EQ(transit_realtime::TripDescriptor_ScheduleRelationship_CANCELED, trip->schedule_relationship());
}

TEST(DescriptorBuilderTest, ScheduleRelationshipAcceptsEnumNumber)
{
    TripReference ref;
    ref.scheduleRelationship = "1";

    auto trip = DescriptorBuilder::buildTripDescriptor(ref);
    ASSERT_TRUE(trip.has_value());
    EXPECT_EQ(transit_realtime::TripDescriptor_ScheduleRelationship_ADDED, trip->schedule_relationship());
}

TEST(DescriptorBuilderTest, NewTripsAreAccepted)
{
    TripReference ref;
    ref.tripId = "T9";
    ref.scheduleRelationship = "NEW";

    auto trip = DescriptorBuilder::buildTripDescriptor(ref);
    ASSERT_TRUE(trip.has_value());
    EXPECT_EQ(transit_realtime::TripDescriptor_ScheduleRelationship_NEW, trip->schedule_relationship());

    ref.scheduleRelationship = "8";
    EXPECT_EQ(transit_realtime::TripDescriptor_ScheduleRelationship_NEW,
              DescriptorBuilder::buildTripDescriptor(ref)->schedule_relationship());
}

TEST(DescriptorBuilderTest, UnknownScheduleRelationshipIsRejected)
{
    TripReference ref;
    ref.scheduleRelationship = "LATE";
    EXPECT_THROW(DescriptorBuilder::buildTripDescriptor(ref), SchemaViolation);

    ref.scheduleRelationship = "4";
    EXPECT_THROW(DescriptorBuilder::buildTripDescriptor(ref), SchemaViolation);
}

TEST(DescriptorBuilderTest, NegativeDirectionIsRejected)
{
    TripReference ref;
    ref.directionId = -1;
    EXPECT_THROW(DescriptorBuilder::buildTripDescriptor(ref), SchemaViolation);
}

TEST(DescriptorBuilderTest, AllNullVehicleFieldsYieldNoDescriptor)
{
    VehicleReference ref;
    EXPECT_FALSE(DescriptorBuilder::buildVehicleDescriptor(ref).has_value());
}

TEST(DescriptorBuilderTest, VehicleDescriptorCarriesOnlyPresentFields)
{
    VehicleReference ref;
    ref.label = "Bus 12";
    ref.wheelchairAccessible = "WHEELCHAIR_ACCESSIBLE";

    auto vehicle = DescriptorBuilder::buildVehicleDescriptor(ref);
    ASSERT_TRUE(vehicle.has_value());
    EXPECT_FALSE(vehicle->has_id());
    EXPECT_FALSE(vehicle->has_license_plate());
    EXPECT_EQ("Bus 12", vehicle->label());
    EXPECT_EQ(transit_realtime::VehicleDescriptor_WheelchairAccessible_WHEELCHAIR_ACCESSIBLE,
              vehicle->wheelchair_accessible());
}

TEST(DescriptorBuilderTest, BuildingTwiceGivesEqualDescriptors)
{
    VehicleReference ref;
    ref.id = "V1";
    ref.licensePlate = "B-XY 123";

    auto first = DescriptorBuilder::buildVehicleDescriptor(ref);
    auto second = DescriptorBuilder::buildVehicleDescriptor(ref);
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->SerializeAsString(), second->SerializeAsString());
}
