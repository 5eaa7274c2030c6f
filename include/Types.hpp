#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

// Rows as the warehouse hands them out. Every nullable column is an optional,
// so a stored zero or empty string stays distinguishable from NULL.
// Enum-valued columns hold the GTFS-RT value name ("CONSTRUCTION") or its number.

struct TripReference
{
    std::optional<std::string> tripId;
    std::optional<std::string> routeId;
    std::optional<std::int64_t> directionId;
    std::optional<std::string> startTime;
    std::optional<std::string> startDate;
    std::optional<std::string> scheduleRelationship;
};

struct VehicleReference
{
    std::optional<std::string> id;
    std::optional<std::string> label;
    std::optional<std::string> licensePlate;
    std::optional<std::string> wheelchairAccessible;
};

struct ServiceAlertRow
{
    std::optional<std::string> serviceAlertId;
    std::optional<std::string> cause;
    std::optional<std::string> effect;
    std::optional<std::string> headerText;
    std::optional<std::string> descriptionText;
};

struct AlertActivePeriodRow
{
    std::optional<std::string> serviceAlertId;
    std::optional<std::int64_t> startTimestamp;
    std::optional<std::int64_t> endTimestamp;
};

struct AlertInformedEntityRow
{
    std::optional<std::string> serviceAlertId;
    std::optional<std::string> agencyId;
    std::optional<std::string> routeId;
    std::optional<std::int64_t> routeType;
    std::optional<std::string> stopId;
    TripReference trip;
};

struct TripUpdateRow
{
    std::optional<std::string> tripUpdateId;
    TripReference trip;
    VehicleReference vehicle;
};

struct StopTimeUpdateRow
{
    std::optional<std::string> tripUpdateId;
    std::optional<std::int64_t> stopSequence;
    std::optional<std::string> stopId;

    std::optional<std::int64_t> arrivalTime;
    std::optional<std::int64_t> arrivalDelay;
    std::optional<std::int64_t> arrivalUncertainty;

    std::optional<std::int64_t> departureTime;
    std::optional<std::int64_t> departureDelay;
    std::optional<std::int64_t> departureUncertainty;

    std::optional<std::string> scheduleRelationship;
};

struct VehiclePositionRow
{
    std::optional<std::string> vehiclePositionId;
    TripReference trip;
    VehicleReference vehicle;

    std::optional<double> latitude;
    std::optional<double> longitude;
    std::optional<double> bearing;
    std::optional<double> odometer;
    std::optional<double> speed;

    std::optional<std::int64_t> currentStopSequence;
    std::optional<std::string> stopId;
    std::optional<std::string> currentStatus;
    std::optional<std::int64_t> timestamp;
    std::optional<std::string> congestionLevel;
};

// One consistent read of the alert tables.
struct ServiceAlertSnapshot
{
    std::vector<ServiceAlertRow> alerts;
    std::vector<AlertActivePeriodRow> activePeriods;
    std::vector<AlertInformedEntityRow> informedEntities;
};

struct TripUpdateSnapshot
{
    std::vector<TripUpdateRow> tripUpdates;
    std::vector<StopTimeUpdateRow> stopTimeUpdates;
};

enum class FeedKind
{
    ServiceAlerts,
    TripUpdates,
    VehiclePositions
};

enum class FeedFormat
{
    Protobuf,
    Json
};
