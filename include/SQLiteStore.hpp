#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <functional>
#include "sqlite3.h"
#include "RowSource.hpp"
#include "Types.hpp"

// Row source over the warehouse's SQLite export, opened read-only. A missing
// database fails construction; a missing table fails the fetch that needs it.
class SQLiteStore : public RowSource
{
private:
    sqlite3* db;
    std::mutex mutex;

    void execute(char const* sql);
    void forEachRow(char const* sql, std::function<void(sqlite3_stmt*)> const& onRow);

public:
    SQLiteStore(std::string const& path);
    ~SQLiteStore() override;

    SQLiteStore(SQLiteStore const&) = delete;
    SQLiteStore& operator=(SQLiteStore const&) = delete;

    ServiceAlertSnapshot fetchServiceAlerts() override;
    TripUpdateSnapshot fetchTripUpdates() override;
    std::vector<VehiclePositionRow> fetchVehiclePositions() override;
};
