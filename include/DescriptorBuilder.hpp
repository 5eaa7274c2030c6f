#pragma once
#include <optional>
#include "GtfsRealtime.hpp"
#include "Types.hpp"

// Builds the optional trip and vehicle sub-messages. A descriptor exists only
// when at least one of its source columns is non-null; only those are set.
class DescriptorBuilder
{
public:
    static std::optional<transit_realtime::TripDescriptor> buildTripDescriptor(TripReference const& ref);
    static std::optional<transit_realtime::VehicleDescriptor> buildVehicleDescriptor(VehicleReference const& ref);
};
