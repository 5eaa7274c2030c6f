#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/util/json_util.h>
#include "FeedSerializer.hpp"
#include "SchemaViolation.hpp"

void FeedSerializer::requireComplete(transit_realtime::FeedMessage const& message)
{
    if (!message.IsInitialized())
        throw SchemaViolation("missing required fields: " + message.InitializationErrorString());
}

std::string FeedSerializer::serializeBinary(transit_realtime::FeedMessage const& message)
{
    requireComplete(message);

    std::string out;
    {
        google::protobuf::io::StringOutputStream stream(&out);
        google::protobuf::io::CodedOutputStream coded(&stream);
        coded.SetSerializationDeterministic(true);

        if (!message.SerializeToCodedStream(&coded) || coded.HadError())
            throw SchemaViolation("protobuf encoding failed");
    }
    return out;
}

std::string FeedSerializer::serializeJson(transit_realtime::FeedMessage const& message)
{
    requireComplete(message);

    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;

    std::string out;
    auto status = google::protobuf::util::MessageToJsonString(message, &out, options);
    if (!status.ok())
        throw SchemaViolation("json encoding failed: " + status.ToString());
    return out;
}

std::string FeedSerializer::serialize(transit_realtime::FeedMessage const& message, FeedFormat format)
{
    switch (format)
    {
    case FeedFormat::Json:
        return serializeJson(message);
    case FeedFormat::Protobuf:
        break;
    }
    return serializeBinary(message);
}

std::string FeedSerializer::contentType(FeedFormat format) noexcept
{
    return format == FeedFormat::Json ? "application/json" : "application/octet-stream";
}
