#pragma once
#include <vector>
#include "Types.hpp"

// Read side of the warehouse. Implementations must be safe to call from
// several request threads at once.
class RowSource
{
public:
    virtual ~RowSource() = default;

    virtual ServiceAlertSnapshot fetchServiceAlerts() = 0;
    virtual TripUpdateSnapshot fetchTripUpdates() = 0;
    virtual std::vector<VehiclePositionRow> fetchVehiclePositions() = 0;
};
