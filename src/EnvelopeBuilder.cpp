#include "EnvelopeBuilder.hpp"
#include "VirtualClock.hpp"
#include "SchemaFields.hpp"

transit_realtime::FeedMessage EnvelopeBuilder::build(std::vector<transit_realtime::FeedEntity> entities)
{
    return build(std::move(entities), VirtualClock::now());
}

transit_realtime::FeedMessage EnvelopeBuilder::build(std::vector<transit_realtime::FeedEntity> entities, std::time_t assembledAt)
{
    transit_realtime::FeedMessage message;

    auto* header = message.mutable_header();
    header->set_gtfs_realtime_version(GTFS_REALTIME_VERSION);
    header->set_incrementality(transit_realtime::FeedHeader_Incrementality_FULL_DATASET);
    header->set_timestamp(SchemaFields::toUint64(static_cast<std::int64_t>(assembledAt), "header.timestamp"));

    message.mutable_entity()->Reserve(static_cast<int>(entities.size()));
    for (auto& entity : entities)
        *message.add_entity() = std::move(entity);

    return message;
}
