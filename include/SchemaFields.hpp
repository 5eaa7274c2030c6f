#pragma once
#include <string>
#include <cstdint>
#include <charconv>
#include "SchemaViolation.hpp"

// Conversions from warehouse column values to GTFS-RT field types. Anything
// out of range for the schema raises SchemaViolation.
class SchemaFields
{
public:
    static std::uint32_t toUint32(std::int64_t value, char const* field);
    static std::int32_t toInt32(std::int64_t value, char const* field);
    static std::uint64_t toUint64(std::int64_t value, char const* field);

    // Accepts the enum value name or its number, e.g. "DETOUR" or "4".
    template <typename Enum, typename Parse, typename IsValid>
    static Enum toEnum(std::string const& value, char const* field, Parse parse, IsValid isValid)
    {
        Enum result;
        if (parse(value, &result))
            return result;

        int number = 0;
        auto const* first = value.data();
        auto const* last = value.data() + value.size();
        auto [end, ec] = std::from_chars(first, last, number);
        if (ec == std::errc() && end == last && isValid(number))
            return static_cast<Enum>(number);

        throw SchemaViolation(std::string(field) + " has no value '" + value + "'");
    }
};
