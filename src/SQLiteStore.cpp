#include <iostream>
#include <stdexcept>
#include "SQLiteStore.hpp"
#include "SchemaViolation.hpp"

namespace
{

// Trip reference and vehicle reference columns share one layout in every table
// that carries them.
#define TRIP_COLUMNS "trip_id, trip_route_id, trip_direction_id, trip_start_time, trip_start_date, trip_schedule_relationship"
#define VEHICLE_COLUMNS "vehicle_id, vehicle_label, vehicle_license_plate, vehicle_wheelchair_accessible"

std::string columnName(sqlite3_stmt* stmt, int col)
{
    const char* name = sqlite3_column_name(stmt, col);
    return name ? name : "?";
}

std::optional<std::string> readText(sqlite3_stmt* stmt, int col)
{
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL)
        return std::nullopt;

    const unsigned char* text = sqlite3_column_text(stmt, col);
    int size = sqlite3_column_bytes(stmt, col);
    return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(size));
}

std::optional<std::int64_t> readInteger(sqlite3_stmt* stmt, int col)
{
    switch (sqlite3_column_type(stmt, col))
    {
    case SQLITE_NULL:
        return std::nullopt;
    case SQLITE_INTEGER:
        return static_cast<std::int64_t>(sqlite3_column_int64(stmt, col));
    default:
        throw SchemaViolation("column " + columnName(stmt, col) + " does not hold an integer");
    }
}

std::optional<double> readReal(sqlite3_stmt* stmt, int col)
{
    switch (sqlite3_column_type(stmt, col))
    {
    case SQLITE_NULL:
        return std::nullopt;
    case SQLITE_INTEGER:
    case SQLITE_FLOAT:
        return sqlite3_column_double(stmt, col);
    default:
        throw SchemaViolation("column " + columnName(stmt, col) + " does not hold a number");
    }
}

TripReference readTripReference(sqlite3_stmt* stmt, int first)
{
    TripReference t;
    t.tripId               = readText(stmt, first);
    t.routeId              = readText(stmt, first + 1);
    t.directionId          = readInteger(stmt, first + 2);
    t.startTime            = readText(stmt, first + 3);
    t.startDate            = readText(stmt, first + 4);
    t.scheduleRelationship = readText(stmt, first + 5);
    return t;
}

VehicleReference readVehicleReference(sqlite3_stmt* stmt, int first)
{
    VehicleReference v;
    v.id                   = readText(stmt, first);
    v.label                = readText(stmt, first + 1);
    v.licensePlate         = readText(stmt, first + 2);
    v.wheelchairAccessible = readText(stmt, first + 3);
    return v;
}

}

SQLiteStore::SQLiteStore(std::string const& path)
    : db(nullptr)
{
    int rc = sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READONLY, nullptr);
    if (rc != SQLITE_OK)
    {
        std::string message = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) sqlite3_close(db);
        db = nullptr;
        throw std::runtime_error("Failed to open SQLite DB " + path + ": " + message);
    }

    std::cout << "[System] Row source opened at " << path << std::endl;
}

SQLiteStore::~SQLiteStore()
{
    if (db) sqlite3_close(db);
}

void SQLiteStore::execute(char const* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string message = errMsg ? errMsg : sqlite3_errmsg(db);
        if (errMsg) sqlite3_free(errMsg);
        throw std::runtime_error("SQLite error: " + message);
    }
}

void SQLiteStore::forEachRow(char const* sql, std::function<void(sqlite3_stmt*)> const& onRow)
{
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        std::string message = sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        throw std::runtime_error("Failed to prepare query: " + message);
    }

    int rc;
    try
    {
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
            onRow(stmt);
    }
    catch (...)
    {
        sqlite3_finalize(stmt);
        throw;
    }

    if (rc != SQLITE_DONE)
    {
        std::string message = sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        throw std::runtime_error("Error stepping query: " + message);
    }

    sqlite3_finalize(stmt);
}

namespace
{

// Parent and child reads of one feed run inside a single read transaction so
// the join sees one database state.
class ReadTransaction
{
public:
    explicit ReadTransaction(sqlite3* db) : db(db)
    {
        if (sqlite3_exec(db, "BEGIN;", nullptr, nullptr, nullptr) != SQLITE_OK)
            throw std::runtime_error(std::string("Failed to begin read: ") + sqlite3_errmsg(db));
    }

    ~ReadTransaction()
    {
        if (!committed)
            sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
    }

    void commit()
    {
        if (sqlite3_exec(db, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK)
            throw std::runtime_error(std::string("Failed to end read: ") + sqlite3_errmsg(db));
        committed = true;
    }

private:
    sqlite3* db;
    bool committed = false;
};

}

ServiceAlertSnapshot SQLiteStore::fetchServiceAlerts()
{
    std::lock_guard<std::mutex> lock(mutex);
    ReadTransaction tx(db);
    ServiceAlertSnapshot snapshot;

    forEachRow(
        "SELECT service_alert_id, cause, effect, header_text, description_text "
        "FROM realtime_service_alerts ORDER BY rowid;",
        [&](sqlite3_stmt* stmt)
        {
            ServiceAlertRow row;
            row.serviceAlertId  = readText(stmt, 0);
            row.cause           = readText(stmt, 1);
            row.effect          = readText(stmt, 2);
            row.headerText      = readText(stmt, 3);
            row.descriptionText = readText(stmt, 4);
            snapshot.alerts.push_back(std::move(row));
        });

    forEachRow(
        "SELECT service_alert_id, start_timestamp, end_timestamp "
        "FROM realtime_alert_active_periods ORDER BY rowid;",
        [&](sqlite3_stmt* stmt)
        {
            AlertActivePeriodRow row;
            row.serviceAlertId = readText(stmt, 0);
            row.startTimestamp = readInteger(stmt, 1);
            row.endTimestamp   = readInteger(stmt, 2);
            snapshot.activePeriods.push_back(std::move(row));
        });

    forEachRow(
        "SELECT service_alert_id, agency_id, route_id, route_type, stop_id, " TRIP_COLUMNS " "
        "FROM realtime_alert_informed_entities ORDER BY rowid;",
        [&](sqlite3_stmt* stmt)
        {
            AlertInformedEntityRow row;
            row.serviceAlertId = readText(stmt, 0);
            row.agencyId       = readText(stmt, 1);
            row.routeId        = readText(stmt, 2);
            row.routeType      = readInteger(stmt, 3);
            row.stopId         = readText(stmt, 4);
            row.trip           = readTripReference(stmt, 5);
            snapshot.informedEntities.push_back(std::move(row));
        });

    tx.commit();
    return snapshot;
}

TripUpdateSnapshot SQLiteStore::fetchTripUpdates()
{
    std::lock_guard<std::mutex> lock(mutex);
    ReadTransaction tx(db);
    TripUpdateSnapshot snapshot;

    forEachRow(
        "SELECT trip_update_id, " TRIP_COLUMNS ", " VEHICLE_COLUMNS " "
        "FROM realtime_trip_updates ORDER BY rowid;",
        [&](sqlite3_stmt* stmt)
        {
            TripUpdateRow row;
            row.tripUpdateId = readText(stmt, 0);
            row.trip         = readTripReference(stmt, 1);
            row.vehicle      = readVehicleReference(stmt, 7);
            snapshot.tripUpdates.push_back(std::move(row));
        });

    forEachRow(
        "SELECT trip_update_id, stop_sequence, stop_id, "
        "  arrival_time, arrival_delay, arrival_uncertainty, "
        "  departure_time, departure_delay, departure_uncertainty, "
        "  schedule_relationship "
        "FROM realtime_trip_stop_time_updates ORDER BY rowid;",
        [&](sqlite3_stmt* stmt)
        {
            StopTimeUpdateRow row;
            row.tripUpdateId         = readText(stmt, 0);
            row.stopSequence         = readInteger(stmt, 1);
            row.stopId               = readText(stmt, 2);
            row.arrivalTime          = readInteger(stmt, 3);
            row.arrivalDelay         = readInteger(stmt, 4);
            row.arrivalUncertainty   = readInteger(stmt, 5);
            row.departureTime        = readInteger(stmt, 6);
            row.departureDelay       = readInteger(stmt, 7);
            row.departureUncertainty = readInteger(stmt, 8);
            row.scheduleRelationship = readText(stmt, 9);
            snapshot.stopTimeUpdates.push_back(std::move(row));
        });

    tx.commit();
    return snapshot;
}

std::vector<VehiclePositionRow> SQLiteStore::fetchVehiclePositions()
{
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<VehiclePositionRow> results;

    forEachRow(
        "SELECT vehicle_position_id, " TRIP_COLUMNS ", " VEHICLE_COLUMNS ", "
        "  position_latitude, position_longitude, position_bearing, "
        "  position_odometer, position_speed, "
        "  current_stop_sequence, stop_id, current_status, timestamp, congestion_level "
        "FROM realtime_vehicle_positions ORDER BY rowid;",
        [&](sqlite3_stmt* stmt)
        {
            VehiclePositionRow row;
            row.vehiclePositionId   = readText(stmt, 0);
            row.trip                = readTripReference(stmt, 1);
            row.vehicle             = readVehicleReference(stmt, 7);
            row.latitude            = readReal(stmt, 11);
            row.longitude           = readReal(stmt, 12);
            row.bearing             = readReal(stmt, 13);
            row.odometer            = readReal(stmt, 14);
            row.speed               = readReal(stmt, 15);
            row.currentStopSequence = readInteger(stmt, 16);
            row.stopId              = readText(stmt, 17);
            row.currentStatus       = readText(stmt, 18);
            row.timestamp           = readInteger(stmt, 19);
            row.congestionLevel     = readText(stmt, 20);
            results.push_back(std::move(row));
        });

    return results;
}
