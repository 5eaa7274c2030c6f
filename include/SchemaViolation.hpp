#pragma once
#include <stdexcept>
#include <string>

// A value that does not fit the GTFS-Realtime schema, or a required field that
// is missing. Always ends the request with a server error.
class SchemaViolation : public std::runtime_error
{
public:
    explicit SchemaViolation(std::string const& what)
        : std::runtime_error("schema violation: " + what)
    {
    }
};
