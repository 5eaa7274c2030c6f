#include "gtest/gtest.h"
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>
#include "FeedAssembler.hpp"
#include "EnvelopeBuilder.hpp"
#include "FeedSerializer.hpp"
#include "SchemaViolation.hpp"
#include "VirtualClock.hpp"
#include "TestUtil.hpp"

namespace
{

transit_realtime::FeedMessage sampleTripUpdates()
{
    TripUpdateSnapshot snapshot;
    TripUpdateRow tu;
    tu.tripUpdateId = "TU1";
    tu.trip.tripId = "T1";
    tu.trip.directionId = 0;
    tu.vehicle.label = "Tram 4";
    snapshot.tripUpdates.push_back(tu);

    StopTimeUpdateRow stu;
    stu.tripUpdateId = "TU1";
    stu.stopId = "S1";
    stu.arrivalTime = 1700000000;
    stu.arrivalDelay = -30;
    stu.scheduleRelationship = "SCHEDULED";
    snapshot.stopTimeUpdates.push_back(stu);

    return EnvelopeBuilder::build(FeedAssembler::assembleTripUpdates(snapshot), 1700000100);
}

}

TEST(EnvelopeBuilderTest, HeaderCarriesVersionIncrementalityAndAssemblyTime)
{
    VirtualClock::set(1234567);
    auto message = EnvelopeBuilder::build({});
    VirtualClock::disable();

    EXPECT_EQ("2.0", message.header().gtfs_realtime_version());
    EXPECT_TRUE(message.header().has_incrementality());
    EXPECT_EQ(transit_realtime::FeedHeader_Incrementality_FULL_DATASET, message.header().incrementality());
    EXPECT_EQ(1234567u, message.header().timestamp());
    EXPECT_EQ(0, message.entity_size());
}

TEST(EnvelopeBuilderTest, EntitiesAreWrappedInOrder)
{
    auto entities = FeedAssembler::assembleVehiclePositions({
        makeVehiclePosition("B", 1.0, 2.0),
        makeVehiclePosition("A", 3.0, 4.0)});

    auto message = EnvelopeBuilder::build(std::move(entities), 42);
    ASSERT_EQ(2, message.entity_size());
    EXPECT_EQ("B", message.entity(0).id());
    EXPECT_EQ("A", message.entity(1).id());
}

TEST(FeedSerializerTest, BinaryOutputIsReproducible)
{
    std::string first = FeedSerializer::serializeBinary(sampleTripUpdates());
    std::string second = FeedSerializer::serializeBinary(sampleTripUpdates());
    EXPECT_FALSE(first.empty());
    EXPECT_EQ(first, second);
}

TEST(FeedSerializerTest, BinaryDecodesToTheSameEnvelope)
{
    auto message = sampleTripUpdates();
    transit_realtime::FeedMessage decoded;
    ASSERT_TRUE(decoded.ParseFromString(FeedSerializer::serialize(message, FeedFormat::Protobuf)));
    EXPECT_TRUE(google::protobuf::util::MessageDifferencer::Equals(message, decoded));
}

TEST(FeedSerializerTest, JsonAndBinaryAreStructurallyEquivalent)
{
    auto message = sampleTripUpdates();

    transit_realtime::FeedMessage fromBinary;
    ASSERT_TRUE(fromBinary.ParseFromString(FeedSerializer::serializeBinary(message)));

    transit_realtime::FeedMessage fromJson;
    auto status = google::protobuf::util::JsonStringToMessage(FeedSerializer::serializeJson(message), &fromJson);
    ASSERT_TRUE(status.ok()) << status.ToString();

    EXPECT_TRUE(google::protobuf::util::MessageDifferencer::Equals(fromBinary, fromJson));
}

TEST(FeedSerializerTest, JsonUsesSchemaFieldNamesAndEnumNames)
{
    std::string json = FeedSerializer::serializeJson(sampleTripUpdates());

    EXPECT_NE(std::string::npos, json.find("\"gtfs_realtime_version\":\"2.0\""));
    EXPECT_NE(std::string::npos, json.find("\"incrementality\":\"FULL_DATASET\""));
    EXPECT_NE(std::string::npos, json.find("\"stop_time_update\""));
    EXPECT_NE(std::string::npos, json.find("\"schedule_relationship\":\"SCHEDULED\""));
    EXPECT_NE(std::string::npos, json.find("\"direction_id\":0"));
    EXPECT_NE(std::string::npos, json.find("\"delay\":-30"));
    EXPECT_EQ(std::string::npos, json.find("\"uncertainty\""));
}

TEST(FeedSerializerTest, MissingRequiredFieldFailsBothModes)
{
    VehiclePositionRow row;
    row.vehiclePositionId = "VP1";
    row.latitude = 52.0;

    auto message = EnvelopeBuilder::build(FeedAssembler::assembleVehiclePositions({row}), 1);

    EXPECT_THROW(FeedSerializer::serialize(message, FeedFormat::Protobuf), SchemaViolation);
    EXPECT_THROW(FeedSerializer::serialize(message, FeedFormat::Json), SchemaViolation);
}

TEST(FeedSerializerTest, TripUpdateWithoutTripDescriptorIsRejected)
{
    TripUpdateSnapshot snapshot;
    TripUpdateRow tu;
    tu.tripUpdateId = "TU1";
    tu.vehicle.id = "V1";
    snapshot.tripUpdates.push_back(tu);

    auto message = EnvelopeBuilder::build(FeedAssembler::assembleTripUpdates(snapshot), 1);
    EXPECT_THROW(FeedSerializer::serializeBinary(message), SchemaViolation);
    EXPECT_THROW(FeedSerializer::serializeJson(message), SchemaViolation);
}

TEST(FeedSerializerTest, ContentTypeFollowsFormat)
{
    EXPECT_EQ("application/json", FeedSerializer::contentType(FeedFormat::Json));
    EXPECT_EQ("application/octet-stream", FeedSerializer::contentType(FeedFormat::Protobuf));
}
