#pragma once
#include <string>
#include "GtfsRealtime.hpp"
#include "Types.hpp"

// Renders one envelope as protobuf wire bytes or as protobuf-JSON text. Both
// modes reject envelopes with missing required fields, so they fail together.
class FeedSerializer
{
public:
    static std::string serialize(transit_realtime::FeedMessage const& message, FeedFormat format);
    static std::string serializeBinary(transit_realtime::FeedMessage const& message);
    static std::string serializeJson(transit_realtime::FeedMessage const& message);

    [[nodiscard]] static std::string contentType(FeedFormat format) noexcept;

private:
    static void requireComplete(transit_realtime::FeedMessage const& message);
};
