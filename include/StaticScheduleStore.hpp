#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <iostream>
#include "sqlite3.h"
#include "Types.hpp"

class CsvTable;

// Query surface over a GTFS static archive. stops, trips and stop_times are
// imported once into an in-memory SQLite database at construction; every
// query afterwards is answered from that index.
class StaticScheduleStore
{
private:
    struct DatabaseCloser
    {
        void operator()(sqlite3* handle) const noexcept { sqlite3_close(handle); }
    };
    struct StatementFinalizer
    {
        void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
    };
    using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

    std::string archivePath;
    std::unique_ptr<sqlite3, DatabaseCloser> db;

    void exec(char const* sql);
    Statement prepare(char const* sql);
    void bindText(Statement const& stmt, int index, std::string const& value);
    void finish(Statement const& stmt, int rc, char const* what);
    static Stop readStop(Statement const& stmt);

    void createSchema();
    void importStops(CsvTable const& table);
    void importTrips(CsvTable const& table);
    void importStopTimes(CsvTable const& table);
    int count(char const* table);

public:
    // Throws NotFoundError when the archive or one of stops.txt, trips.txt,
    // stop_times.txt is missing, DataFormatError on malformed tables.
    explicit StaticScheduleStore(std::string zipPath, std::ostream& log = std::cout);

    [[nodiscard]] std::string const& getArchivePath() const noexcept { return archivePath; }

    std::vector<Stop> loadStops();
    std::optional<Stop> findStop(std::string const& stopId);
    std::vector<Stop> findStopsByName(std::string const& keyword);

    // Sorted, de-duplicated route ids of every trip calling at the stop.
    std::vector<std::string> routesForStop(std::string const& stopId);

    // Stops visited by any trip of the route, in stops.txt order.
    std::vector<Stop> stopsForRoute(std::string const& routeId);

    // Re-reads agency.txt from the archive on every call.
    std::vector<Agency> agencyInfo();
};
