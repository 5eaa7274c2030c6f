#include <limits>
#include "SchemaFields.hpp"

std::uint32_t SchemaFields::toUint32(std::int64_t value, char const* field)
{
    if (value < 0 || value > std::numeric_limits<std::uint32_t>::max())
        throw SchemaViolation(std::string(field) + " out of range: " + std::to_string(value));
    return static_cast<std::uint32_t>(value);
}

std::int32_t SchemaFields::toInt32(std::int64_t value, char const* field)
{
    if (value < std::numeric_limits<std::int32_t>::min() || value > std::numeric_limits<std::int32_t>::max())
        throw SchemaViolation(std::string(field) + " out of range: " + std::to_string(value));
    return static_cast<std::int32_t>(value);
}

std::uint64_t SchemaFields::toUint64(std::int64_t value, char const* field)
{
    if (value < 0)
        throw SchemaViolation(std::string(field) + " out of range: " + std::to_string(value));
    return static_cast<std::uint64_t>(value);
}
